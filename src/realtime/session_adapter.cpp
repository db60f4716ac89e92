#include "call_bridge/realtime/session_adapter.hpp"

#include <unordered_map>
#include <utility>

#include <websocketpp/base64/base64.hpp>

#include "call_bridge/audio/codec.hpp"
#include "call_bridge/utils/http.hpp"

namespace call_bridge::realtime {

namespace {

const std::unordered_map<std::string, EventType>& event_types() {
    static const std::unordered_map<std::string, EventType> types = {
        {"session.created", EventType::SessionCreated},
        {"session.updated", EventType::SessionUpdated},
        {"response.created", EventType::ResponseCreated},
        {"response.audio.delta", EventType::ResponseAudioDelta},
        {"response.audio.done", EventType::ResponseAudioDone},
        {"response.audio_transcript.delta", EventType::ResponseTranscriptDelta},
        {"response.audio_transcript.done", EventType::ResponseTranscriptDone},
        {"response.done", EventType::ResponseDone},
        {"response.cancelled", EventType::ResponseCancelled},
        {"conversation.item.input_audio_transcription.completed",
         EventType::UserTranscriptCompleted},
        {"conversation.item.input_audio_transcription.failed",
         EventType::UserTranscriptFailed},
        {"input_audio_buffer.speech_started", EventType::SpeechStarted},
        {"input_audio_buffer.speech_stopped", EventType::SpeechStopped},
        {"error", EventType::Error},
    };
    return types;
}

std::string string_field(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) {
        return {};
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

void read_error(const nlohmann::json& data, SessionEvent& event) {
    const auto it = data.find("error");
    if (it == data.end()) {
        return;
    }
    if (it->is_string()) {
        event.error_message = it->get<std::string>();
        return;
    }
    event.error_code = string_field(*it, "code");
    event.error_message = string_field(*it, "message");
    if (event.error_code.empty()) {
        event.error_code = string_field(*it, "type");
    }
}

}

const char* to_string(EventType type) {
    for (const auto& [name, value] : event_types()) {
        if (value == type) {
            return name.c_str();
        }
    }
    return "other";
}

SessionSettings SessionSettings::from_config(const Config& config,
                                             std::string instructions,
                                             std::string voice) {
    SessionSettings settings;
    settings.instructions = std::move(instructions);
    settings.voice = std::move(voice);
    settings.transcription_model = config.transcription_model;
    settings.vad_threshold = config.openai_vad_threshold;
    settings.prefix_padding_ms = config.openai_prefix_padding_ms;
    settings.silence_duration_ms = config.openai_silence_duration_ms;
    settings.temperature = config.realtime_temperature;
    settings.max_output_tokens = config.realtime_max_output_tokens;
    return settings;
}

SessionEvent parse_event(const std::string& message) {
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(message);
    } catch (const nlohmann::json::parse_error& ex) {
        throw ProtocolError(std::string("invalid session event: ") + ex.what());
    }
    if (!data.is_object()) {
        throw ProtocolError("session event is not an object");
    }
    SessionEvent event;
    event.name = string_field(data, "type");
    if (event.name.empty()) {
        throw ProtocolError("session event has no type");
    }
    const auto it = event_types().find(event.name);
    event.type = it == event_types().end() ? EventType::Other : it->second;

    switch (event.type) {
        case EventType::ResponseAudioDelta: {
            const auto delta = string_field(data, "delta");
            if (!delta.empty()) {
                event.audio = audio::pcm_from_bytes(websocketpp::base64_decode(delta));
            }
            break;
        }
        case EventType::ResponseTranscriptDelta:
            event.text = string_field(data, "delta");
            break;
        case EventType::ResponseTranscriptDone:
        case EventType::UserTranscriptCompleted:
            event.text = string_field(data, "transcript");
            break;
        case EventType::ResponseDone:
            event.response_status = string_field(data.value("response", nlohmann::json::object()),
                                                 "status");
            if (event.response_status == "cancelled") {
                event.type = EventType::ResponseCancelled;
            }
            break;
        case EventType::UserTranscriptFailed:
        case EventType::Error:
            read_error(data, event);
            break;
        default:
            break;
    }
    return event;
}

std::string session_url(const Config& config) {
    const auto separator = config.realtime_url.find('?') == std::string::npos ? "?" : "&";
    return config.realtime_url + separator + "model=" + utils::url_encode(config.realtime_model);
}

nlohmann::json session_update(const SessionSettings& settings) {
    return {
        {"type", "session.update"},
        {"session",
         {
             {"modalities", nlohmann::json::array({"text", "audio"})},
             {"instructions", settings.instructions},
             {"voice", settings.voice},
             {"input_audio_format", "pcm16"},
             {"output_audio_format", "pcm16"},
             {"input_audio_transcription", {{"model", settings.transcription_model}}},
             {"turn_detection",
              {
                  {"type", "server_vad"},
                  {"threshold", settings.vad_threshold},
                  {"prefix_padding_ms", settings.prefix_padding_ms},
                  {"silence_duration_ms", settings.silence_duration_ms},
                  {"create_response", false},
              }},
             {"temperature", settings.temperature},
             {"max_response_output_tokens", settings.max_output_tokens},
         }},
    };
}

nlohmann::json input_audio_append(const audio::AudioFrame& frame) {
    auto samples = frame.samples;
    if (frame.sample_rate != audio::kSessionSampleRate) {
        samples = audio::resample(samples, frame.sample_rate, audio::kSessionSampleRate);
    }
    return {
        {"type", "input_audio_buffer.append"},
        {"audio", websocketpp::base64_encode(audio::pcm_to_bytes(samples))},
    };
}

nlohmann::json input_audio_commit() {
    return {{"type", "input_audio_buffer.commit"}};
}

nlohmann::json response_create() {
    return {
        {"type", "response.create"},
        {"response", {{"modalities", nlohmann::json::array({"audio", "text"})}}},
    };
}

nlohmann::json response_cancel() {
    return {{"type", "response.cancel"}};
}

}
