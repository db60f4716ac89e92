#include "call_bridge/session/persona.hpp"

#include <cctype>
#include <regex>
#include <sstream>
#include <unordered_map>

#include "call_bridge/utils/text.hpp"

namespace call_bridge::session {

namespace {

std::optional<std::string> match_group(const std::string& text, const std::regex& pattern) {
    std::smatch match;
    if (!std::regex_search(text, match, pattern) || match.size() < 2) {
        return std::nullopt;
    }
    auto value = utils::trim_copy(match[1].str());
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

const char* kDigitWords[] = {"zero", "one", "two", "three", "four",
                             "five", "six", "seven", "eight", "nine"};

}

PersonaProfile extract_profile(const backend::CallRecord& record) {
    PersonaProfile profile;
    profile.purpose = record.purpose;
    profile.additional_instructions = record.additional_instructions;
    const auto text = record.purpose + " " + record.additional_instructions;
    const auto icase = std::regex::ECMAScript | std::regex::icase;

    if (auto tone = match_group(record.additional_instructions,
                                std::regex(R"(tone[:\s]+(polite|firm))", icase))) {
        profile.tone = utils::normalize_text(*tone);
    }
    if (auto name = match_group(text, std::regex(R"((?:[Uu]ser|[Nn]ame|[Cc]ustomer)[:\s]+([A-Z][a-z]+(?:\s+[A-Z][a-z]+)?))"))) {
        profile.user_name = *name;
    }
    profile.order_number =
        match_group(text, std::regex(R"(order\s*(?:number|#)?\s*:?\s*([A-Z0-9\-]*[0-9][A-Z0-9\-]*))", icase));
    profile.company = match_group(
        text, std::regex(R"((?:[Cc]ustomer needs help with|[Cc]ompany:?)\s+([A-Z][a-zA-Z]+(?:\s[A-Z][a-zA-Z]+)*))"));
    profile.desired_outcome =
        match_group(text, std::regex(R"((?:desired outcome|outcome)[:\s]+([^.,]+))", icase));
    profile.email = match_group(
        text, std::regex(R"(email\s*(?:address)?\s*:?\s*([a-z0-9._%+-]+@[a-z0-9.-]+\.[a-z]{2,}))", icase));
    profile.phone =
        match_group(text, std::regex(R"(phone\s*(?:number)?\s*:?\s*(\+?[\d][\d\s\-()]*\d))", icase));
    return profile;
}

std::string spell_out(const std::string& value) {
    std::string spelled;
    for (unsigned char ch : value) {
        if (std::isspace(ch)) {
            continue;
        }
        if (!spelled.empty()) {
            spelled += ", ";
        }
        if (std::isdigit(ch)) {
            spelled += kDigitWords[ch - '0'];
        } else {
            spelled += static_cast<char>(std::toupper(ch));
        }
    }
    return spelled;
}

std::string voice_for(const std::string& preference) {
    static const std::unordered_map<std::string, std::string> voices = {
        {"professional_female", "shimmer"},
        {"professional_male", "echo"},
        {"friendly_female", "coral"},
        {"friendly_male", "echo"},
    };
    const auto it = voices.find(preference.empty() ? "professional_female" : preference);
    return it == voices.end() ? "shimmer" : it->second;
}

std::string build_instructions(const PersonaProfile& profile) {
    std::ostringstream out;
    out << "You are " << profile.user_name
        << ", a customer calling a support line. You are NOT customer service. "
           "The person who answers is the representative who will help you.\n\n";

    out << "Goal: " << (profile.purpose.empty() ? "get help with your request" : profile.purpose)
        << "\n";
    if (profile.company) {
        out << "Company: " << *profile.company << "\n";
    }
    if (profile.desired_outcome) {
        out << "Desired outcome: " << *profile.desired_outcome << "\n";
    }
    if (!profile.additional_instructions.empty()) {
        out << "Additional context: " << profile.additional_instructions << "\n";
    }

    out << "\nInformation you can share when asked:\n";
    bool any_info = false;
    if (profile.order_number) {
        out << "- Order number: " << *profile.order_number << " (say it as: "
            << spell_out(*profile.order_number) << ")\n";
        any_info = true;
    }
    if (profile.email) {
        out << "- Email address: " << *profile.email << "\n";
        any_info = true;
    }
    if (profile.phone) {
        out << "- Phone number: " << *profile.phone << "\n";
        any_info = true;
    }
    if (!any_info) {
        out << "- None. If asked for details you do not have, say you will need to check.\n";
    }

    out << "\nConversation rules:\n"
           "- Wait for the representative to greet you first. Reply to a plain hello with a "
           "short greeting and your introduction.\n"
           "- Introduce yourself once. Never repeat your introduction.\n"
           "- Keep replies short and natural, one or two sentences.\n"
           "- Finish your sentence unless you hear a clear interruption such as \"wait\", "
           "\"stop\", \"hold on\" or \"excuse me\". When interrupted, stop and listen.\n"
           "- Never respond to your own words heard back as echo.\n"
           "- Reply to a simple acknowledgement with one or two words.\n"
           "- Never invent order details, names or numbers.\n";

    out << "\nTone: ";
    if (profile.tone == "firm") {
        out << "firm and direct, while staying respectful.\n";
    } else {
        out << "polite and friendly.\n";
    }
    return out.str();
}

}
