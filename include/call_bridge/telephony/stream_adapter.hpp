#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "call_bridge/audio/frame.hpp"
#include "call_bridge/protocol_error.hpp"

namespace call_bridge::telephony {

enum class StreamEventType {
    Connected,
    Start,
    Media,
    Stop,
    Mark,
    Unknown
};

const char* to_string(StreamEventType type);

struct StreamEvent {
    StreamEventType type = StreamEventType::Unknown;
    std::string name;
    std::string stream_sid;
    std::string call_sid;
    std::string payload;
    std::string mark_name;
};

// Parses one media-stream message. Throws ProtocolError on malformed JSON or
// a missing "event" field.
StreamEvent parse_event(const std::string& message);

// base64 mu-law at 8 kHz -> PCM16 at the session rate. Returns an empty buffer
// when the payload does not decode to any audio.
std::vector<int16_t> decode_payload(const std::string& base64_payload);

// PCM16 at the session rate -> normalized, 8 kHz, mu-law, base64.
std::string encode_payload(const std::vector<int16_t>& samples);

// Per-connection protocol state for one telephony media stream.
class TelephonyStreamAdapter {
public:
    explicit TelephonyStreamAdapter(std::optional<std::string> query_call_sid = std::nullopt);

    // Parses and applies a message. A start event fixes the stream sid and
    // resolves the call sid (start payload, envelope, then connection query).
    StreamEvent handle_message(const std::string& message);

    // Inbound frame for a media event; empty when the payload is unusable.
    std::optional<audio::AudioFrame> to_frame(const StreamEvent& event) const;

    // Outbound messages; empty until the stream has started.
    std::optional<std::string> media_message(const audio::AudioFrame& frame) const;
    std::optional<std::string> clear_message() const;

    bool started() const { return !stream_sid_.empty(); }
    const std::string& stream_sid() const { return stream_sid_; }
    const std::optional<std::string>& call_sid() const { return call_sid_; }

private:
    std::optional<std::string> query_call_sid_;
    std::string stream_sid_;
    std::optional<std::string> call_sid_;
};

}
