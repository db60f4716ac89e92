#include "call_bridge/logging.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace call_bridge {
namespace logging {

namespace {

std::string& logger_name() {
    static std::string name = "call_bridge";
    return name;
}

spdlog::level::level_enum parse_level(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    if (value == "TRACE") return spdlog::level::trace;
    if (value == "DEBUG") return spdlog::level::debug;
    if (value == "WARN" || value == "WARNING") return spdlog::level::warn;
    if (value == "ERROR") return spdlog::level::err;
    if (value == "CRITICAL") return spdlog::level::critical;
    if (value == "OFF") return spdlog::level::off;
    return spdlog::level::info;
}

std::vector<spdlog::sink_ptr> make_sinks(const Config& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!config.log_filename) {
        return sinks;
    }
    const std::filesystem::path log_path(*config.log_filename);
    if (!log_path.parent_path().empty()) {
        std::filesystem::create_directories(log_path.parent_path());
    }
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(), true);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v");
    sinks.push_back(std::move(file_sink));
    return sinks;
}

thread_local std::string current_context;

}

void init(const Config& config) {
    const auto sinks = make_sinks(config);
    logger_name() = config.log_name;
    spdlog::drop(config.log_name);
    auto logger = std::make_shared<spdlog::logger>(config.log_name, sinks.begin(), sinks.end());
    logger->set_level(parse_level(config.log_level));
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (auto logger = spdlog::get(logger_name())) {
        return logger;
    }
    return spdlog::default_logger();
}

void set_thread_context(std::string context) {
    current_context = std::move(context);
}

const std::string& thread_context() {
    return current_context;
}

}
}
