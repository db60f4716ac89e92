#pragma once

#include <initializer_list>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "call_bridge/config.hpp"
#include "spdlog/logger.h"

namespace call_bridge {
namespace logging {

struct KeyValue {
    std::string key;
    std::string value;
};

template <typename T>
inline KeyValue kv(const std::string& key, const T& value) {
    std::ostringstream oss;
    oss << std::boolalpha << value;
    return {key, oss.str()};
}

template <typename T>
inline KeyValue kv(const std::string& key, const std::optional<T>& value) {
    if (!value) {
        return {key, "none"};
    }
    return kv(key, *value);
}

// Long transcripts are clipped so a single log line stays readable.
inline KeyValue kv_text(const std::string& key, const std::string& text, size_t limit = 120) {
    if (text.size() <= limit) {
        return {key, text};
    }
    return {key, text.substr(0, limit) + "..."};
}

inline std::string format_kv(std::initializer_list<KeyValue> items) {
    std::string result;
    for (const auto& item : items) {
        if (!result.empty()) {
            result += ", ";
        }
        bool needs_quotes = item.value.find(' ') != std::string::npos;
        result += item.key;
        result += '=';
        if (needs_quotes) {
            result += '"';
            result += item.value;
            result += '"';
        } else {
            result += item.value;
        }
    }
    return result;
}

inline std::string with_kv(const std::string& message,
                           std::initializer_list<KeyValue> items) {
    const auto context = format_kv(items);
    if (context.empty()) {
        return message;
    }
    return message + " [" + context + "]";
}

void init(const Config& config);
std::shared_ptr<spdlog::logger> get_logger();

// Tag for every line logged from the calling thread. Session loops set it to
// the connection (and call sid once known) they serve.
void set_thread_context(std::string context);
const std::string& thread_context();

inline void log(spdlog::level::level_enum level,
                const std::string& message,
                std::initializer_list<KeyValue> items = {}) {
    auto logger = get_logger();
    if (!logger || !logger->should_log(level)) {
        return;
    }
    const auto& context = thread_context();
    if (context.empty()) {
        logger->log(level, with_kv(message, items));
    } else {
        logger->log(level, "<" + context + "> " + with_kv(message, items));
    }
}

inline void trace(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::trace, message, items);
}

inline void debug(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::debug, message, items);
}

inline void info(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::info, message, items);
}

inline void warn(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::warn, message, items);
}

inline void error(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::err, message, items);
}

inline void critical(const std::string& message,
                     std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::critical, message, items);
}

}

using logging::kv;
using logging::kv_text;
using logging::with_kv;
using logging::debug;
using logging::error;
using logging::info;
using logging::trace;
using logging::warn;

}
