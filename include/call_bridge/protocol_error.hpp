#pragma once

#include <stdexcept>
#include <string>

namespace call_bridge {

// Raised when a peer sends a message that cannot be interpreted.
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& message) : std::runtime_error(message) {}
};

}
