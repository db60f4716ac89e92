#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>

#include <nlohmann/json.hpp>

#include "call_bridge/audio/frame.hpp"
#include "call_bridge/turn/transcript_validator.hpp"
#include "call_bridge/turn/types.hpp"
#include "call_bridge/utils/event_loop.hpp"
#include "call_bridge/vad/energy_detector.hpp"

namespace call_bridge {
namespace turn {

struct TurnConfig {
    std::chrono::milliseconds echo_period{800};
    std::chrono::milliseconds echo_suppression{1500};
    std::chrono::milliseconds echo_suppression_extended{2000};
    std::chrono::milliseconds post_response_echo{3000};
    std::chrono::milliseconds suspected_speech_timeout{2000};
    std::chrono::milliseconds polite_phrase_window{2000};
    std::chrono::milliseconds deferred_reply_min_delay{100};
    std::chrono::milliseconds response_delay{0};
    bool greeting_on_connect = false;
};

struct TurnHooks {
    std::function<void(const audio::AudioFrame&)> forward_to_session;
    std::function<void(const audio::AudioFrame&)> play_to_caller;
    std::function<void()> clear_caller_audio;
    std::function<void()> request_response;
    std::function<void()> cancel_response;
    std::function<void(Speaker, const std::string&)> record_transcript;
    std::function<void(const std::string&, const nlohmann::json&)> notify;
};

// Owns the turn state of one call. Every method must be called from the
// session's event loop; timers are scheduled on the same loop.
class TurnStateMachine {
public:
    using NowFn = std::function<Clock::time_point()>;

    TurnStateMachine(TurnConfig cfg,
                     vad::SpeechDetectorConfig detector_cfg,
                     ValidatorConfig validator_cfg,
                     utils::Scheduler& scheduler,
                     TurnHooks hooks,
                     NowFn now = [] { return Clock::now(); });
    ~TurnStateMachine();

    TurnStateMachine(const TurnStateMachine&) = delete;
    TurnStateMachine& operator=(const TurnStateMachine&) = delete;

    void start_conversation();

    void on_inbound_audio(const audio::AudioFrame& frame);

    void on_response_created();
    void on_response_audio(const audio::AudioFrame& frame);
    void on_response_audio_done();
    void on_response_transcript_done(const std::string& text);
    void on_response_done();
    void on_response_cancelled();

    void on_user_transcript(const std::string& text);
    void on_user_transcript_failed(const std::string& reason);
    void on_speech_started();
    void on_speech_stopped();
    void on_session_error(const std::string& code, const std::string& message);

    void shutdown();

    ResponseState state() const { return state_; }
    const TurnTiming& timing() const { return timing_; }
    const std::optional<PendingTranscript>& pending() const { return pending_; }
    bool has_responded_to(const std::string& transcript) const;
    bool closing_phrase_heard() const { return closing_heard_; }
    bool greeting_sent() const { return greeting_sent_; }
    bool audio_suppressed() const { return suppress_audio_; }
    std::optional<double> echo_baseline() const { return detector_.echo_baseline(); }
    TranscriptValidator& validator() { return validator_; }

    static bool is_benign_cancel_error(const std::string& text);
    static bool is_rate_limit_error(const std::string& text);

private:
    void transition(ResponseState next, const char* reason);
    void finish_response(bool cancelled);
    void interrupt(const std::string& text, Clock::time_point now);
    void accept(const std::string& text, Clock::time_point now);
    bool is_echo(const std::string& text, Clock::time_point now);
    void schedule_reply(const PendingTranscript& transcript, std::chrono::milliseconds delay);
    void issue_reply(const PendingTranscript& transcript);
    void cancel_active_response(const char* reason);
    void cancel_reply_timer();
    void drop_scheduled_reply(const char* reason);

    bool suspected_speech_confirmed(Clock::time_point now) const;
    bool in_echo_period(Clock::time_point now) const;
    bool in_post_response_window(Clock::time_point now) const;
    std::optional<std::chrono::milliseconds> since(const std::optional<Clock::time_point>& point,
                                                   Clock::time_point now) const;
    void notify(const std::string& event, const nlohmann::json& payload) const;
    void record(Speaker speaker, const std::string& text) const;

    TurnConfig cfg_;
    vad::SpeechActivityDetector detector_;
    TranscriptValidator validator_;
    utils::Scheduler& scheduler_;
    TurnHooks hooks_;
    NowFn now_;

    ResponseState state_ = ResponseState::Idle;
    TurnTiming timing_;
    bool suppress_audio_ = false;
    bool reply_requested_ = false;
    bool current_response_solicited_ = false;
    bool awaiting_first_audio_ = false;
    bool greeting_sent_ = false;
    bool introduction_given_ = false;
    bool closing_heard_ = false;
    std::optional<PendingTranscript> pending_;
    std::optional<std::string> responding_to_;
    std::string last_ai_reply_;
    std::unordered_set<std::string> responded_;
    std::optional<utils::Scheduler::TimerId> reply_timer_;
};

}
}
