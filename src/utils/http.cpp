#include "call_bridge/utils/http.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace call_bridge::utils {

namespace {

int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

int default_port(const std::string& scheme) {
    if (scheme == "https" || scheme == "wss") {
        return 443;
    }
    return 80;
}

}

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path) {
    std::string working = url;
    scheme = "http";
    base_path = "";
    host.clear();
    port = 0;

    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        scheme = working.substr(0, scheme_pos);
        std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        working = working.substr(scheme_pos + 3);
    }

    const auto path_pos = working.find('/');
    if (path_pos != std::string::npos) {
        base_path = working.substr(path_pos);
        working = working.substr(0, path_pos);
    } else {
        base_path = "/";
    }

    const auto port_pos = working.find(':');
    if (port_pos != std::string::npos) {
        host = working.substr(0, port_pos);
        port = std::stoi(working.substr(port_pos + 1));
    } else {
        host = working;
        port = default_port(scheme);
    }
}

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped << std::hex << std::uppercase;
    for (unsigned char ch : value) {
        if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            escaped << ch;
        } else {
            escaped << '%' << std::setw(2) << std::setfill('0')
                    << static_cast<int>(ch);
        }
    }
    return escaped.str();
}

std::string url_decode(const std::string& value) {
    std::string decoded;
    decoded.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        const char ch = value[i];
        if (ch == '+') {
            decoded += ' ';
        } else if (ch == '%' && i + 2 < value.size() && hex_value(value[i + 1]) >= 0 &&
                   hex_value(value[i + 2]) >= 0) {
            decoded += static_cast<char>(hex_value(value[i + 1]) * 16 + hex_value(value[i + 2]));
            i += 2;
        } else {
            decoded += ch;
        }
    }
    return decoded;
}

std::optional<std::string> query_param(const std::string& target, const std::string& key) {
    const auto query_pos = target.find('?');
    if (query_pos == std::string::npos) {
        return std::nullopt;
    }
    std::istringstream query(target.substr(query_pos + 1));
    std::string pair;
    while (std::getline(query, pair, '&')) {
        const auto eq = pair.find('=');
        const auto name = url_decode(pair.substr(0, eq));
        if (name != key) {
            continue;
        }
        if (eq == std::string::npos) {
            return std::string();
        }
        return url_decode(pair.substr(eq + 1));
    }
    return std::nullopt;
}

std::string strip_query(const std::string& target) {
    return target.substr(0, target.find('?'));
}

}
