#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "call_bridge/realtime/session_adapter.hpp"

#include <nlohmann/json.hpp>
#include <websocketpp/base64/base64.hpp>

#include <string>
#include <vector>

using call_bridge::realtime::EventType;

TEST_CASE("parse_event maps server event names") {
    const auto created = call_bridge::realtime::parse_event(R"({"type":"response.created"})");
    REQUIRE(created.type == EventType::ResponseCreated);
    REQUIRE(std::string(call_bridge::realtime::to_string(created.type)) == "response.created");

    const auto started =
        call_bridge::realtime::parse_event(R"({"type":"input_audio_buffer.speech_started"})");
    REQUIRE(started.type == EventType::SpeechStarted);

    const auto unknown = call_bridge::realtime::parse_event(R"({"type":"rate_limits.updated"})");
    REQUIRE(unknown.type == EventType::Other);
    REQUIRE(unknown.name == "rate_limits.updated");
    REQUIRE(std::string(call_bridge::realtime::to_string(unknown.type)) == "other");
}

TEST_CASE("parse_event decodes audio deltas to PCM16") {
    // Two little-endian samples: 1 and -2.
    const std::string bytes{'\x01', '\x00', '\xFE', '\xFF'};
    nlohmann::json message{
        {"type", "response.audio.delta"},
        {"delta", websocketpp::base64_encode(bytes)},
    };
    const auto event = call_bridge::realtime::parse_event(message.dump());
    REQUIRE(event.type == EventType::ResponseAudioDelta);
    REQUIRE(event.audio == std::vector<int16_t>{1, -2});
}

TEST_CASE("parse_event reads transcripts") {
    const auto user = call_bridge::realtime::parse_event(
        R"({"type":"conversation.item.input_audio_transcription.completed","transcript":"Hello there"})");
    REQUIRE(user.type == EventType::UserTranscriptCompleted);
    REQUIRE(user.text == "Hello there");

    const auto reply = call_bridge::realtime::parse_event(
        R"({"type":"response.audio_transcript.done","transcript":"Hi, my name is Sarah."})");
    REQUIRE(reply.type == EventType::ResponseTranscriptDone);
    REQUIRE(reply.text == "Hi, my name is Sarah.");

    const auto delta = call_bridge::realtime::parse_event(
        R"({"type":"response.audio_transcript.delta","delta":"Hi,"})");
    REQUIRE(delta.text == "Hi,");
}

TEST_CASE("response.done with a cancelled status is reported as cancelled") {
    const auto done = call_bridge::realtime::parse_event(
        R"({"type":"response.done","response":{"status":"completed"}})");
    REQUIRE(done.type == EventType::ResponseDone);
    REQUIRE(done.response_status == "completed");

    const auto cancelled = call_bridge::realtime::parse_event(
        R"({"type":"response.done","response":{"status":"cancelled"}})");
    REQUIRE(cancelled.type == EventType::ResponseCancelled);
}

TEST_CASE("parse_event reads error details") {
    const auto error = call_bridge::realtime::parse_event(
        R"({"type":"error","error":{"type":"invalid_request_error","code":"response_cancel_not_active","message":"no active response"}})");
    REQUIRE(error.type == EventType::Error);
    REQUIRE(error.error_code == "response_cancel_not_active");
    REQUIRE(error.error_message == "no active response");

    const auto failed = call_bridge::realtime::parse_event(
        R"({"type":"conversation.item.input_audio_transcription.failed","error":{"type":"server_error","message":"429 Too Many Requests"}})");
    REQUIRE(failed.type == EventType::UserTranscriptFailed);
    REQUIRE(failed.error_code == "server_error");
    REQUIRE(failed.error_message == "429 Too Many Requests");

    const auto plain = call_bridge::realtime::parse_event(R"({"type":"error","error":"boom"})");
    REQUIRE(plain.error_message == "boom");
}

TEST_CASE("parse_event rejects malformed events") {
    REQUIRE_THROWS_AS(call_bridge::realtime::parse_event("nope"), call_bridge::ProtocolError);
    REQUIRE_THROWS_AS(call_bridge::realtime::parse_event("42"), call_bridge::ProtocolError);
    REQUIRE_THROWS_AS(call_bridge::realtime::parse_event(R"({"delta":"AA=="})"),
                      call_bridge::ProtocolError);
}

TEST_CASE("session_update configures audio formats and server VAD") {
    call_bridge::Config config;
    config.openai_vad_threshold = 0.3;
    config.openai_silence_duration_ms = 900;
    const auto settings =
        call_bridge::realtime::SessionSettings::from_config(config, "Be brief.", "coral");
    const auto update = call_bridge::realtime::session_update(settings);

    REQUIRE(update["type"] == "session.update");
    const auto& session = update["session"];
    REQUIRE(session["instructions"] == "Be brief.");
    REQUIRE(session["voice"] == "coral");
    REQUIRE(session["input_audio_format"] == "pcm16");
    REQUIRE(session["output_audio_format"] == "pcm16");
    REQUIRE(session["modalities"] == nlohmann::json::array({"text", "audio"}));
    REQUIRE(session["input_audio_transcription"]["model"] == config.transcription_model);
    REQUIRE(session["turn_detection"]["type"] == "server_vad");
    REQUIRE(session["turn_detection"]["threshold"].get<double>() == Catch::Approx(0.3));
    REQUIRE(session["turn_detection"]["silence_duration_ms"] == 900);
    REQUIRE(session["turn_detection"]["create_response"] == false);
    REQUIRE(session["max_response_output_tokens"] == config.realtime_max_output_tokens);
}

TEST_CASE("input_audio_append sends session-rate PCM as base64") {
    call_bridge::audio::AudioFrame frame;
    frame.samples.assign(480, 256);
    const auto message = call_bridge::realtime::input_audio_append(frame);
    REQUIRE(message["type"] == "input_audio_buffer.append");
    const auto bytes = websocketpp::base64_decode(message["audio"].get<std::string>());
    REQUIRE(bytes.size() == 960);
    REQUIRE(bytes[0] == '\x00');
    REQUIRE(bytes[1] == '\x01');

    SECTION("telephony-rate frames are upsampled first") {
        call_bridge::audio::AudioFrame narrow;
        narrow.samples.assign(160, 0);
        narrow.sample_rate = call_bridge::audio::kTelephonySampleRate;
        const auto upsampled = call_bridge::realtime::input_audio_append(narrow);
        REQUIRE(websocketpp::base64_decode(upsampled["audio"].get<std::string>()).size() == 960);
    }
}

TEST_CASE("client control messages") {
    REQUIRE(call_bridge::realtime::input_audio_commit() ==
            nlohmann::json{{"type", "input_audio_buffer.commit"}});
    REQUIRE(call_bridge::realtime::response_cancel() ==
            nlohmann::json{{"type", "response.cancel"}});
    const auto create = call_bridge::realtime::response_create();
    REQUIRE(create["type"] == "response.create");
    REQUIRE(create["response"]["modalities"] == nlohmann::json::array({"audio", "text"}));
}

TEST_CASE("session_url appends the encoded model") {
    call_bridge::Config config;
    config.realtime_url = "wss://api.example.com/v1/realtime";
    config.realtime_model = "gpt-4o realtime";
    REQUIRE(call_bridge::realtime::session_url(config) ==
            "wss://api.example.com/v1/realtime?model=gpt-4o%20realtime");

    config.realtime_url = "wss://proxy.example.com/realtime?region=eu";
    config.realtime_model = "gpt-4o";
    REQUIRE(call_bridge::realtime::session_url(config) ==
            "wss://proxy.example.com/realtime?region=eu&model=gpt-4o");
}
