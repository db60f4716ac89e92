#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "call_bridge/audio/frame.hpp"
#include "call_bridge/config.hpp"
#include "call_bridge/protocol_error.hpp"

namespace call_bridge::realtime {

enum class EventType {
    SessionCreated,
    SessionUpdated,
    ResponseCreated,
    ResponseAudioDelta,
    ResponseAudioDone,
    ResponseTranscriptDelta,
    ResponseTranscriptDone,
    ResponseDone,
    ResponseCancelled,
    UserTranscriptCompleted,
    UserTranscriptFailed,
    SpeechStarted,
    SpeechStopped,
    Error,
    Other
};

const char* to_string(EventType type);

struct SessionEvent {
    EventType type = EventType::Other;
    std::string name;
    std::string text;
    std::vector<int16_t> audio;
    std::string response_status;
    std::string error_code;
    std::string error_message;
};

struct SessionSettings {
    std::string instructions;
    std::string voice = "shimmer";
    std::string transcription_model = "whisper-1";
    double vad_threshold = 0.05;
    int prefix_padding_ms = 50;
    int silence_duration_ms = 2000;
    double temperature = 0.8;
    int max_output_tokens = 4096;

    static SessionSettings from_config(const Config& config,
                                       std::string instructions,
                                       std::string voice);
};

// Parses one server event. Throws ProtocolError when the message is not a JSON
// object carrying a "type". A response.done whose status is "cancelled" is
// reported as ResponseCancelled.
SessionEvent parse_event(const std::string& message);

std::string session_url(const Config& config);

nlohmann::json session_update(const SessionSettings& settings);
nlohmann::json input_audio_append(const audio::AudioFrame& frame);
nlohmann::json input_audio_commit();
nlohmann::json response_create();
nlohmann::json response_cancel();

}
