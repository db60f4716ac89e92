#include "call_bridge/telephony/stream_adapter.hpp"

#include <utility>

#include <websocketpp/base64/base64.hpp>

#include "call_bridge/audio/codec.hpp"
#include "call_bridge/logging.hpp"
#include "call_bridge/metrics.hpp"

namespace call_bridge::telephony {

namespace {

StreamEventType event_type(const std::string& name) {
    if (name == "connected") {
        return StreamEventType::Connected;
    }
    if (name == "start") {
        return StreamEventType::Start;
    }
    if (name == "media") {
        return StreamEventType::Media;
    }
    if (name == "stop") {
        return StreamEventType::Stop;
    }
    if (name == "mark") {
        return StreamEventType::Mark;
    }
    return StreamEventType::Unknown;
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

}

const char* to_string(StreamEventType type) {
    switch (type) {
        case StreamEventType::Connected:
            return "connected";
        case StreamEventType::Start:
            return "start";
        case StreamEventType::Media:
            return "media";
        case StreamEventType::Stop:
            return "stop";
        case StreamEventType::Mark:
            return "mark";
        case StreamEventType::Unknown:
            break;
    }
    return "unknown";
}

StreamEvent parse_event(const std::string& message) {
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(message);
    } catch (const nlohmann::json::parse_error& ex) {
        throw ProtocolError(std::string("invalid media stream message: ") + ex.what());
    }
    if (!data.is_object()) {
        throw ProtocolError("media stream message is not an object");
    }
    const auto name = string_field(data, "event");
    if (name.empty()) {
        throw ProtocolError("media stream message has no event");
    }

    StreamEvent event;
    event.name = name;
    event.type = event_type(name);
    event.stream_sid = string_field(data, "streamSid");

    if (event.type == StreamEventType::Start) {
        const auto start = data.value("start", nlohmann::json::object());
        if (event.stream_sid.empty()) {
            event.stream_sid = string_field(start, "streamSid");
        }
        event.call_sid = string_field(start, "callSid");
        if (event.call_sid.empty()) {
            event.call_sid = string_field(data, "callSid");
        }
    } else if (event.type == StreamEventType::Media) {
        event.payload = string_field(data.value("media", nlohmann::json::object()), "payload");
    } else if (event.type == StreamEventType::Mark) {
        event.mark_name = string_field(data.value("mark", nlohmann::json::object()), "name");
    }
    return event;
}

std::vector<int16_t> decode_payload(const std::string& base64_payload) {
    if (base64_payload.empty()) {
        return {};
    }
    const auto mulaw = websocketpp::base64_decode(base64_payload);
    if (mulaw.empty()) {
        return {};
    }
    return audio::resample(audio::decode_mulaw(mulaw), audio::kTelephonySampleRate,
                           audio::kSessionSampleRate);
}

std::string encode_payload(const std::vector<int16_t>& samples) {
    const auto narrowband = audio::resample(audio::normalize(samples), audio::kSessionSampleRate,
                                            audio::kTelephonySampleRate);
    return websocketpp::base64_encode(audio::encode_mulaw(narrowband));
}

TelephonyStreamAdapter::TelephonyStreamAdapter(std::optional<std::string> query_call_sid)
    : query_call_sid_(std::move(query_call_sid)) {}

StreamEvent TelephonyStreamAdapter::handle_message(const std::string& message) {
    auto event = parse_event(message);
    switch (event.type) {
        case StreamEventType::Start:
            stream_sid_ = event.stream_sid;
            if (event.call_sid.empty() && query_call_sid_ && !query_call_sid_->empty()) {
                logging::info("Using call sid from connection query", {kv("call_sid", *query_call_sid_)});
                event.call_sid = *query_call_sid_;
            }
            if (!event.call_sid.empty()) {
                call_sid_ = event.call_sid;
            }
            logging::info(
                "Media stream started",
                {kv("stream_sid", stream_sid_),
                 kv("call_sid", call_sid_)});
            break;
        case StreamEventType::Unknown:
            logging::debug("Unhandled media stream event", {kv("event", event.name)});
            break;
        default:
            break;
    }
    return event;
}

std::optional<audio::AudioFrame> TelephonyStreamAdapter::to_frame(const StreamEvent& event) const {
    if (event.type != StreamEventType::Media) {
        return std::nullopt;
    }
    auto samples = decode_payload(event.payload);
    if (samples.empty()) {
        Metrics::instance().increment(Counter::DecodeErrors);
        logging::debug("Media payload skipped", {kv("bytes", event.payload.size())});
        return std::nullopt;
    }
    audio::AudioFrame frame;
    frame.samples = std::move(samples);
    frame.sample_rate = audio::kSessionSampleRate;
    frame.direction = audio::Direction::Inbound;
    return frame;
}

std::optional<std::string> TelephonyStreamAdapter::media_message(const audio::AudioFrame& frame) const {
    if (stream_sid_.empty() || frame.samples.empty()) {
        return std::nullopt;
    }
    auto samples = frame.samples;
    if (frame.sample_rate != audio::kSessionSampleRate) {
        samples = audio::resample(samples, frame.sample_rate, audio::kSessionSampleRate);
    }
    nlohmann::json message{
        {"event", "media"},
        {"streamSid", stream_sid_},
        {"media", {{"payload", encode_payload(samples)}}},
    };
    return message.dump();
}

std::optional<std::string> TelephonyStreamAdapter::clear_message() const {
    if (stream_sid_.empty()) {
        return std::nullopt;
    }
    nlohmann::json message{
        {"event", "clear"},
        {"streamSid", stream_sid_},
    };
    return message.dump();
}

}
