#pragma once

#include <optional>
#include <string>

namespace call_bridge::utils {

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path);

std::string url_encode(const std::string& value);
std::string url_decode(const std::string& value);

// Value of `key` in the query part of a request target such as
// "/media-stream?callSid=CA1". Empty optional when absent.
std::optional<std::string> query_param(const std::string& target, const std::string& key);

// Request target without its query string.
std::string strip_query(const std::string& target);

}
