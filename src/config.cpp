#include "call_bridge/config.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace call_bridge {

namespace {

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

std::string get_env_required(const char* name) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) {
        throw std::runtime_error(std::string(name) + " is required");
    }
    return std::string(value);
}

bool get_env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return normalized == "true" || normalized == "1";
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be an integer");
    }
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be a number");
    }
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
    localtime_r(&time_t, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (key.empty()) {
            continue;
        }
        // Real environment wins over .env.
        setenv(key.c_str(), strip_quotes(value).c_str(), 0);
    }
}

}

Config Config::load() {
    load_dotenv();
    Config config;

    config.backend_url = get_env_required("BACKEND_URL");
    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");
    config.backend_request_timeout = get_env_double("BACKEND_REQUEST_TIMEOUT", 30.0);
    config.backend_connect_timeout = get_env_double("BACKEND_CONNECT_TIMEOUT", 10.0);
    config.backend_sock_read_timeout = get_env_double("BACKEND_SOCK_READ_TIMEOUT", 30.0);

    config.media_stream_port = get_env_int("MEDIA_STREAM_PORT", 8080);
    config.media_stream_path = get_env_str("MEDIA_STREAM_PATH", "/media-stream");
    config.rest_api_port = get_env_int("REST_API_PORT", 8000);

    config.openai_api_key = get_env_required("OPENAI_API_KEY");
    config.realtime_url = get_env_str("REALTIME_URL", config.realtime_url);
    config.realtime_model = get_env_str("REALTIME_MODEL", config.realtime_model);
    config.realtime_temperature = get_env_double("REALTIME_TEMPERATURE", 0.8);
    config.realtime_max_output_tokens = get_env_int("REALTIME_MAX_OUTPUT_TOKENS", 4096);
    config.transcription_model = get_env_str("TRANSCRIPTION_MODEL", "whisper-1");
    config.openai_vad_threshold = get_env_double("OPENAI_VAD_THRESHOLD", 0.05);
    config.openai_prefix_padding_ms = get_env_int("OPENAI_PREFIX_PADDING_MS", 50);
    config.openai_silence_duration_ms = get_env_int("OPENAI_SILENCE_DURATION_MS", 2000);
    config.openai_response_delay_ms = get_env_int("OPENAI_RESPONSE_DELAY_MS", 0);
    config.greeting_on_connect = get_env_bool("GREETING_ON_CONNECT", false);

    config.speech_detection_threshold = get_env_double("SPEECH_DETECTION_THRESHOLD", 2000.0);
    config.high_energy_threshold = get_env_double("HIGH_ENERGY_THRESHOLD", 4000.0);
    config.high_energy_avg_threshold = get_env_double("HIGH_ENERGY_AVG_THRESHOLD", 3000.0);
    config.interruption_energy_threshold =
        get_env_double("INTERRUPTION_ENERGY_THRESHOLD", 3500.0);
    config.echo_baseline_multiplier = get_env_double("ECHO_BASELINE_MULTIPLIER", 2.0);
    config.echo_suppression_min_threshold =
        get_env_double("ECHO_SUPPRESSION_MIN_THRESHOLD", 2500.0);

    config.echo_period_ms = get_env_int("ECHO_PERIOD_MS", 800);
    config.echo_suppression_ms = get_env_int("ECHO_SUPPRESSION_MS", 1500);
    config.post_response_echo_ms = get_env_int("POST_RESPONSE_ECHO_MS", 3000);
    config.suspected_speech_timeout_ms = get_env_int("SUSPECTED_SPEECH_TIMEOUT_MS", 2000);
    config.transcript_pair_ttl_sec = get_env_int("TRANSCRIPT_PAIR_TTL_SEC", 30);

    config.inbound_buffer_frames = get_env_int("INBOUND_BUFFER_FRAMES", 250);

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    config.log_name = get_env_str("LOG_NAME", "call_bridge");

    return config;
}

void Config::validate() const {
    if (backend_url.empty()) {
        throw std::runtime_error("BACKEND_URL is required");
    }
    if (openai_api_key.empty()) {
        throw std::runtime_error("OPENAI_API_KEY is required");
    }
    if (realtime_url.rfind("wss://", 0) != 0 && realtime_url.rfind("ws://", 0) != 0) {
        throw std::runtime_error("REALTIME_URL must start with ws:// or wss://");
    }
    if (media_stream_port <= 0) {
        throw std::runtime_error("MEDIA_STREAM_PORT must be positive");
    }
    if (rest_api_port <= 0) {
        throw std::runtime_error("REST_API_PORT must be positive");
    }
    if (media_stream_port == rest_api_port) {
        throw std::runtime_error("MEDIA_STREAM_PORT and REST_API_PORT must differ");
    }
    if (openai_vad_threshold < 0.0 || openai_vad_threshold > 1.0) {
        throw std::runtime_error("OPENAI_VAD_THRESHOLD must be within [0, 1]");
    }
    if (openai_response_delay_ms < 0) {
        throw std::runtime_error("OPENAI_RESPONSE_DELAY_MS must be zero or positive");
    }
    if (realtime_max_output_tokens <= 0) {
        throw std::runtime_error("REALTIME_MAX_OUTPUT_TOKENS must be positive");
    }
    if (echo_period_ms < 0 || echo_suppression_ms < 0 || post_response_echo_ms < 0) {
        throw std::runtime_error("Echo window durations must be zero or positive");
    }
    if (inbound_buffer_frames <= 0) {
        throw std::runtime_error("INBOUND_BUFFER_FRAMES must be positive");
    }
}

}
