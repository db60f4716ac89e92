#pragma once

#include <string>
#include <vector>

namespace call_bridge::utils {

std::string remove_emojis(const std::string& text);
std::string normalize_text(const std::string& text);

// Lowercased words with punctuation treated as whitespace.
std::vector<std::string> split_words(const std::string& text);
std::string trim_copy(const std::string& text);
bool starts_with(const std::string& text, const std::string& prefix);

}
