#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "call_bridge/audio/frame.hpp"
#include "call_bridge/backend/gateway.hpp"
#include "call_bridge/config.hpp"
#include "call_bridge/realtime/session_adapter.hpp"
#include "call_bridge/realtime/ws_client.hpp"
#include "call_bridge/telephony/stream_adapter.hpp"
#include "call_bridge/turn/state_machine.hpp"
#include "call_bridge/utils/event_loop.hpp"

namespace call_bridge::session {

turn::TurnConfig make_turn_config(const Config& config);
vad::SpeechDetectorConfig make_detector_config(const Config& config);
turn::ValidatorConfig make_validator_config(const Config& config);

struct SessionDependencies {
    const Config& config;
    backend::CallDirectory& directory;
    backend::TranscriptSink& transcripts;
    backend::EventNotifier& notifier;
};

// Ways back to the telephony connection that owns this session.
struct TelephonyLink {
    std::function<bool(const std::string&)> send;
    std::function<void(const std::string&)> close;
    // Called once on the loop thread after teardown completes.
    std::function<void()> on_finished;
};

// One call: the telephony stream, its speech session and the turn state
// machine, all driven from a single event loop.
class BridgeSession {
public:
    BridgeSession(uint64_t connection_id,
                  std::optional<std::string> query_call_sid,
                  SessionDependencies deps,
                  TelephonyLink link);
    ~BridgeSession();

    BridgeSession(const BridgeSession&) = delete;
    BridgeSession& operator=(const BridgeSession&) = delete;

    void start();

    // Thread-safe; each call posts onto the session loop.
    void post_telephony_message(std::string message);
    void post_telephony_closed();

    uint64_t connection_id() const { return connection_id_; }
    bool finished() const { return finished_; }

private:
    void handle_telephony_message(const std::string& message);
    void handle_stream_start(const telephony::StreamEvent& event);
    void handle_media(const telephony::StreamEvent& event);
    void connect_speech_session(const backend::CallRecord& record);
    void handle_session_open();
    void handle_session_message(const std::string& message);
    void dispatch(const realtime::SessionEvent& event);

    void forward_to_session(const audio::AudioFrame& frame);
    void flush_inbound_buffer();
    void send_to_session(const nlohmann::json& payload, const char* what);
    void send_to_caller(const std::string& message);

    void record_transcript(turn::Speaker speaker, const std::string& text);
    void notify(const std::string& event, const nlohmann::json& payload);

    void teardown(const std::string& reason);

    uint64_t connection_id_;
    SessionDependencies deps_;
    TelephonyLink link_;
    utils::EventLoop loop_;
    telephony::TelephonyStreamAdapter telephony_;
    std::unique_ptr<turn::TurnStateMachine> turn_;
    std::unique_ptr<realtime::RealtimeWsClient> speech_;
    std::optional<backend::CallRecord> record_;
    std::deque<audio::AudioFrame> inbound_buffer_;
    bool session_ready_ = false;
    bool closing_ = false;
    std::atomic<bool> finished_{false};
};

}
