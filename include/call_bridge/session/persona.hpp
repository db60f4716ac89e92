#pragma once

#include <optional>
#include <string>

#include "call_bridge/backend/gateway.hpp"

namespace call_bridge::session {

// Details the AI caller needs, pulled from the free-text purpose and
// additional instructions of a call record.
struct PersonaProfile {
    std::string user_name = "Sarah";
    std::string tone = "polite";
    std::optional<std::string> company;
    std::optional<std::string> order_number;
    std::optional<std::string> desired_outcome;
    std::optional<std::string> email;
    std::optional<std::string> phone;
    std::string purpose;
    std::string additional_instructions;
};

PersonaProfile extract_profile(const backend::CallRecord& record);

// "A12" -> "A, one, two"
std::string spell_out(const std::string& value);

std::string voice_for(const std::string& preference);
std::string build_instructions(const PersonaProfile& profile);

}
