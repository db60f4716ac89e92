#include <catch2/catch_test_macros.hpp>

#include "call_bridge/metrics.hpp"
#include "call_bridge/telephony/stream_adapter.hpp"

#include <nlohmann/json.hpp>
#include <websocketpp/base64/base64.hpp>

#include <string>
#include <vector>

using call_bridge::telephony::StreamEventType;
using call_bridge::telephony::TelephonyStreamAdapter;

namespace {

std::string silence_payload(size_t bytes) {
    return websocketpp::base64_encode(std::string(bytes, static_cast<char>(0xFF)));
}

std::string media_event(const std::string& payload) {
    return nlohmann::json{
        {"event", "media"},
        {"streamSid", "MZ1"},
        {"media", {{"track", "inbound"}, {"payload", payload}}},
    }.dump();
}

}

TEST_CASE("parse_event reads the event name and stream fields") {
    const auto connected = call_bridge::telephony::parse_event(R"({"event":"connected"})");
    REQUIRE(connected.type == StreamEventType::Connected);

    const auto start = call_bridge::telephony::parse_event(
        R"({"event":"start","start":{"streamSid":"MZ1","callSid":"CA1"}})");
    REQUIRE(start.type == StreamEventType::Start);
    REQUIRE(start.stream_sid == "MZ1");
    REQUIRE(start.call_sid == "CA1");

    const auto mark = call_bridge::telephony::parse_event(
        R"({"event":"mark","streamSid":"MZ1","mark":{"name":"reply-1"}})");
    REQUIRE(mark.type == StreamEventType::Mark);
    REQUIRE(mark.mark_name == "reply-1");

    const auto other = call_bridge::telephony::parse_event(R"({"event":"dtmf"})");
    REQUIRE(other.type == StreamEventType::Unknown);
    REQUIRE(other.name == "dtmf");
}

TEST_CASE("parse_event rejects malformed messages") {
    REQUIRE_THROWS_AS(call_bridge::telephony::parse_event("{not json"),
                      call_bridge::ProtocolError);
    REQUIRE_THROWS_AS(call_bridge::telephony::parse_event("[1,2]"), call_bridge::ProtocolError);
    REQUIRE_THROWS_AS(call_bridge::telephony::parse_event(R"({"streamSid":"MZ1"})"),
                      call_bridge::ProtocolError);
}

TEST_CASE("call sid resolution prefers the start payload") {
    SECTION("start payload") {
        TelephonyStreamAdapter adapter("CAquery");
        adapter.handle_message(
            R"({"event":"start","callSid":"CAenvelope","start":{"streamSid":"MZ1","callSid":"CAstart"}})");
        REQUIRE(adapter.call_sid() == std::string("CAstart"));
    }

    SECTION("message envelope") {
        TelephonyStreamAdapter adapter("CAquery");
        adapter.handle_message(
            R"({"event":"start","streamSid":"MZ1","callSid":"CAenvelope","start":{}})");
        REQUIRE(adapter.call_sid() == std::string("CAenvelope"));
        REQUIRE(adapter.stream_sid() == "MZ1");
    }

    SECTION("connection query") {
        TelephonyStreamAdapter adapter("CAquery");
        const auto event = adapter.handle_message(R"({"event":"start","start":{"streamSid":"MZ1"}})");
        REQUIRE(event.call_sid == "CAquery");
        REQUIRE(adapter.call_sid() == std::string("CAquery"));
    }

    SECTION("nowhere") {
        TelephonyStreamAdapter adapter;
        adapter.handle_message(R"({"event":"start","start":{"streamSid":"MZ1"}})");
        REQUIRE(adapter.started());
        REQUIRE_FALSE(adapter.call_sid().has_value());
    }
}

TEST_CASE("media payloads decode to session-rate frames") {
    TelephonyStreamAdapter adapter;
    const auto event = adapter.handle_message(media_event(silence_payload(160)));
    REQUIRE(event.type == StreamEventType::Media);

    const auto frame = adapter.to_frame(event);
    REQUIRE(frame.has_value());
    REQUIRE(frame->sample_rate == call_bridge::audio::kSessionSampleRate);
    REQUIRE(frame->samples.size() == 480);
    for (auto sample : frame->samples) {
        REQUIRE(sample == 0);
    }
}

TEST_CASE("empty media payloads are skipped and counted") {
    TelephonyStreamAdapter adapter;
    const auto before =
        call_bridge::Metrics::instance().value(call_bridge::Counter::DecodeErrors);
    const auto event = adapter.handle_message(media_event(""));
    REQUIRE_FALSE(adapter.to_frame(event).has_value());
    REQUIRE(call_bridge::Metrics::instance().value(call_bridge::Counter::DecodeErrors) ==
            before + 1);

    const auto stop = adapter.handle_message(R"({"event":"stop","streamSid":"MZ1"})");
    REQUIRE_FALSE(adapter.to_frame(stop).has_value());
}

TEST_CASE("outbound messages need a started stream") {
    TelephonyStreamAdapter adapter;
    call_bridge::audio::AudioFrame frame;
    frame.samples.assign(480, 0);
    frame.direction = call_bridge::audio::Direction::Outbound;

    REQUIRE_FALSE(adapter.media_message(frame).has_value());
    REQUIRE_FALSE(adapter.clear_message().has_value());

    adapter.handle_message(R"({"event":"start","start":{"streamSid":"MZ9","callSid":"CA9"}})");

    const auto media = adapter.media_message(frame);
    REQUIRE(media.has_value());
    const auto json = nlohmann::json::parse(*media);
    REQUIRE(json["event"] == "media");
    REQUIRE(json["streamSid"] == "MZ9");
    const auto bytes = websocketpp::base64_decode(json["media"]["payload"].get<std::string>());
    REQUIRE(bytes.size() == 160);
    REQUIRE(bytes == std::string(160, static_cast<char>(0xFF)));

    const auto clear = nlohmann::json::parse(*adapter.clear_message());
    REQUIRE(clear == nlohmann::json{{"event", "clear"}, {"streamSid", "MZ9"}});
}

TEST_CASE("decode then encode keeps a payload the same length") {
    const auto samples = call_bridge::telephony::decode_payload(silence_payload(320));
    REQUIRE(samples.size() == 960);
    const auto encoded = call_bridge::telephony::encode_payload(samples);
    REQUIRE(websocketpp::base64_decode(encoded).size() == 320);
}
