#pragma once

#include <optional>
#include <string>

namespace call_bridge {

struct Config {
    std::string backend_url;
    std::optional<std::string> authorization_token;
    double backend_request_timeout = 30.0;
    double backend_connect_timeout = 10.0;
    double backend_sock_read_timeout = 30.0;

    int media_stream_port = 8080;
    std::string media_stream_path = "/media-stream";
    int rest_api_port = 8000;

    std::string openai_api_key;
    std::string realtime_url = "wss://api.openai.com/v1/realtime";
    std::string realtime_model = "gpt-4o-realtime-preview-2024-12-17";
    double realtime_temperature = 0.8;
    int realtime_max_output_tokens = 4096;
    std::string transcription_model = "whisper-1";
    double openai_vad_threshold = 0.05;
    int openai_prefix_padding_ms = 50;
    int openai_silence_duration_ms = 2000;
    int openai_response_delay_ms = 0;
    bool greeting_on_connect = false;

    double speech_detection_threshold = 2000.0;
    double high_energy_threshold = 4000.0;
    double high_energy_avg_threshold = 3000.0;
    double interruption_energy_threshold = 3500.0;
    double echo_baseline_multiplier = 2.0;
    double echo_suppression_min_threshold = 2500.0;

    int echo_period_ms = 800;
    int echo_suppression_ms = 1500;
    int post_response_echo_ms = 3000;
    int suspected_speech_timeout_ms = 2000;
    int transcript_pair_ttl_sec = 30;

    int inbound_buffer_frames = 250;

    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::string log_name = "call_bridge";

    static Config load();
    void validate() const;
};

}
