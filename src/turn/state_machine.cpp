#include "call_bridge/turn/state_machine.hpp"

#include <algorithm>
#include <utility>

#include "call_bridge/logging.hpp"
#include "call_bridge/metrics.hpp"
#include "call_bridge/utils/text.hpp"

namespace call_bridge {
namespace turn {

const char* to_string(ResponseState state) {
    switch (state) {
        case ResponseState::Idle:
            return "IDLE";
        case ResponseState::Responding:
            return "RESPONDING";
        case ResponseState::Interrupted:
            return "INTERRUPTED";
        case ResponseState::Closing:
            return "CLOSING";
    }
    return "UNKNOWN";
}

const char* to_string(Speaker speaker) {
    return speaker == Speaker::Ai ? "ai" : "human";
}

TurnStateMachine::TurnStateMachine(TurnConfig cfg,
                                   vad::SpeechDetectorConfig detector_cfg,
                                   ValidatorConfig validator_cfg,
                                   utils::Scheduler& scheduler,
                                   TurnHooks hooks,
                                   NowFn now)
    : cfg_(cfg),
      detector_(detector_cfg),
      validator_(validator_cfg),
      scheduler_(scheduler),
      hooks_(std::move(hooks)),
      now_(std::move(now)) {}

TurnStateMachine::~TurnStateMachine() {
    cancel_reply_timer();
}

bool TurnStateMachine::is_benign_cancel_error(const std::string& text) {
    return text.find("response_cancel_not_active") != std::string::npos ||
           text.find("no active response") != std::string::npos ||
           text.find("response_cancel") != std::string::npos;
}

bool TurnStateMachine::is_rate_limit_error(const std::string& text) {
    return text.find("429") != std::string::npos ||
           text.find("Too Many Requests") != std::string::npos;
}

bool TurnStateMachine::has_responded_to(const std::string& transcript) const {
    return responded_.count(utils::trim_copy(transcript)) > 0;
}

void TurnStateMachine::transition(ResponseState next, const char* reason) {
    if (state_ == ResponseState::Closing || state_ == next) {
        return;
    }
    if (next == ResponseState::Responding && state_ != ResponseState::Idle) {
        logging::warn(
            "Rejected state transition",
            {kv("from", to_string(state_)),
             kv("to", to_string(next)),
             kv("reason", reason)});
        return;
    }
    const auto previous = state_;
    state_ = next;
    suppress_audio_ = false;
    logging::info(
        "Turn state changed",
        {kv("from", to_string(previous)),
         kv("to", to_string(next)),
         kv("reason", reason)});
}

std::optional<std::chrono::milliseconds> TurnStateMachine::since(
    const std::optional<Clock::time_point>& point,
    Clock::time_point now) const {
    if (!point) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - *point);
}

bool TurnStateMachine::suspected_speech_confirmed(Clock::time_point now) const {
    const auto elapsed = since(timing_.suspected_speech, now);
    return elapsed && *elapsed < cfg_.suspected_speech_timeout;
}

bool TurnStateMachine::in_echo_period(Clock::time_point now) const {
    if (state_ == ResponseState::Responding) {
        return true;
    }
    const auto elapsed = since(timing_.response_started, now);
    return elapsed && *elapsed < cfg_.echo_period;
}

bool TurnStateMachine::in_post_response_window(Clock::time_point now) const {
    const auto elapsed = since(timing_.response_ended, now);
    return elapsed && *elapsed < cfg_.post_response_echo;
}

void TurnStateMachine::notify(const std::string& event, const nlohmann::json& payload) const {
    if (hooks_.notify) {
        hooks_.notify(event, payload);
    }
}

void TurnStateMachine::record(Speaker speaker, const std::string& text) const {
    if (hooks_.record_transcript) {
        hooks_.record_transcript(speaker, text);
    }
}

void TurnStateMachine::cancel_reply_timer() {
    if (reply_timer_) {
        scheduler_.cancel(*reply_timer_);
        reply_timer_.reset();
    }
}

void TurnStateMachine::drop_scheduled_reply(const char* reason) {
    if (!reply_timer_) {
        return;
    }
    cancel_reply_timer();
    if (pending_) {
        logging::info(
            "Scheduled reply discarded",
            {kv_text("transcript", pending_->text),
             kv("seq", pending_->seq),
             kv("reason", reason)});
        pending_.reset();
    }
}

void TurnStateMachine::cancel_active_response(const char* reason) {
    logging::info(
        "Cancelling reply",
        {kv("reason", reason),
         kv("state", to_string(state_))});
    Metrics::instance().increment(Counter::RepliesCancelled);
    if (hooks_.cancel_response) {
        hooks_.cancel_response();
    }
    reply_requested_ = false;
}

void TurnStateMachine::start_conversation() {
    if (!cfg_.greeting_on_connect || greeting_sent_ || state_ != ResponseState::Idle) {
        return;
    }
    greeting_sent_ = true;
    reply_requested_ = true;
    timing_.reply_requested = now_();
    logging::info("Requesting opening greeting");
    Metrics::instance().increment(Counter::RepliesRequested);
    if (hooks_.request_response) {
        hooks_.request_response();
    }
}

void TurnStateMachine::on_inbound_audio(const audio::AudioFrame& frame) {
    if (state_ == ResponseState::Closing) {
        return;
    }
    const auto now = now_();
    const bool baseline_window =
        state_ == ResponseState::Idle && !in_echo_period(now) && !in_post_response_window(now);
    const auto detection = detector_.process_frame(frame.samples, baseline_window,
                                                   in_echo_period(now));
    if (detection.suspected_speech) {
        if (!suspected_speech_confirmed(now)) {
            logging::debug(
                "Suspected caller speech",
                {kv("energy", detection.energy),
                 kv("threshold", detection.threshold),
                 kv("high_energy", detection.high_energy),
                 kv("state", to_string(state_))});
        }
        timing_.suspected_speech = now;
    }
    if (hooks_.forward_to_session) {
        hooks_.forward_to_session(frame);
    }
}

void TurnStateMachine::on_speech_started() {
    if (state_ == ResponseState::Closing) {
        return;
    }
    const auto now = now_();
    const auto elapsed = since(timing_.response_started, now);
    if (elapsed && *elapsed < cfg_.echo_suppression) {
        logging::debug("Speech start ignored (echo window)", {kv("since_response_ms", elapsed->count())});
        return;
    }
    if (state_ == ResponseState::Responding && elapsed &&
        *elapsed < cfg_.echo_suppression_extended) {
        logging::debug("Speech start ignored (AI speaking)", {kv("since_response_ms", elapsed->count())});
        return;
    }
    timing_.suspected_speech = now;
}

void TurnStateMachine::on_speech_stopped() {
    if (state_ == ResponseState::Closing) {
        return;
    }
    if (in_post_response_window(now_())) {
        return;
    }
    // A reply timer armed for the previous utterance is superseded.
    drop_scheduled_reply("caller kept speaking");
}

void TurnStateMachine::on_response_created() {
    if (state_ == ResponseState::Closing) {
        return;
    }
    const auto now = now_();
    const bool solicited = reply_requested_;
    if (!solicited && state_ != ResponseState::Responding) {
        if (timing_.latest_speech_seq == 0 && !greeting_sent_) {
            logging::warn("Unsolicited reply without caller input, cancelling");
            cancel_active_response("no valid transcript");
            suppress_audio_ = true;
            return;
        }
        logging::warn(
            "Unsolicited reply created",
            {kv("latest_speech_seq", timing_.latest_speech_seq)});
    }

    if (state_ == ResponseState::Interrupted) {
        transition(ResponseState::Idle, "stale interruption cleared");
    }
    if (state_ == ResponseState::Responding) {
        logging::debug("Reply continuation", {kv("solicited", solicited)});
        reply_requested_ = false;
        return;
    }

    transition(ResponseState::Responding, "response created");
    timing_.response_started = now;
    current_response_solicited_ = solicited;
    awaiting_first_audio_ = solicited;
    reply_requested_ = false;
    logging::info(
        "AI reply started",
        {kv_text("responding_to", responding_to_.value_or("")),
         kv("solicited", solicited)});
}

void TurnStateMachine::on_response_audio(const audio::AudioFrame& frame) {
    if (state_ == ResponseState::Interrupted || state_ == ResponseState::Closing ||
        suppress_audio_) {
        logging::trace("Reply audio dropped", {kv("state", to_string(state_))});
        return;
    }
    if (awaiting_first_audio_ && timing_.reply_requested) {
        const auto latency = std::chrono::duration<double>(now_() - *timing_.reply_requested);
        Metrics::instance().observe_response_time("first_audio", latency.count());
        awaiting_first_audio_ = false;
    }
    if (hooks_.play_to_caller) {
        hooks_.play_to_caller(frame);
    }
}

void TurnStateMachine::on_response_audio_done() {
    logging::debug("AI audio complete", {kv("state", to_string(state_))});
}

void TurnStateMachine::on_response_transcript_done(const std::string& text) {
    const auto reply = utils::trim_copy(text);
    if (reply.empty() || state_ == ResponseState::Closing) {
        return;
    }

    const bool introduction = validator_.is_introduction(reply);
    if (introduction && introduction_given_) {
        if (validator_.is_duplicate(reply, last_ai_reply_)) {
            logging::info(
                "Duplicate introduction discarded",
                {kv_text("reply", reply),
                 kv_text("previous", last_ai_reply_)});
            return;
        }
        if (timing_.latest_speech_seq == 0) {
            logging::info("Repeated introduction without caller input discarded",
                          {kv_text("reply", reply)});
            return;
        }
    }
    if (introduction) {
        introduction_given_ = true;
    }

    if (validator_.is_closing_phrase(reply)) {
        const bool asks = validator_.contains_question(reply) ||
                          (!last_ai_reply_.empty() && validator_.contains_question(last_ai_reply_));
        if (asks) {
            logging::debug("Closing phrase next to a question ignored", {kv_text("reply", reply)});
        } else if (!closing_heard_) {
            closing_heard_ = true;
            logging::info("AI said goodbye, call stays open", {kv_text("reply", reply)});
            notify("ai_closing", {{"message", reply}});
        }
    }

    if (responding_to_) {
        const auto& pair = validator_.resolve(*responding_to_, reply, now_());
        if (pair.suggested_correction) {
            Metrics::instance().increment(Counter::AccuracyFlags);
            notify("transcript_accuracy_flag",
                   {{"transcript", pair.user_transcript},
                    {"reply", pair.ai_reply},
                    {"understood", *pair.suggested_correction}});
        }
    }

    last_ai_reply_ = reply;
    logging::info("AI replied", {kv_text("reply", reply)});
    record(Speaker::Ai, utils::remove_emojis(reply));
}

void TurnStateMachine::on_response_done() {
    finish_response(false);
}

void TurnStateMachine::on_response_cancelled() {
    finish_response(true);
}

void TurnStateMachine::finish_response(bool cancelled) {
    if (state_ == ResponseState::Closing) {
        return;
    }
    const auto now = now_();
    timing_.response_ended = now;
    reply_requested_ = false;
    awaiting_first_audio_ = false;
    current_response_solicited_ = false;
    if (state_ == ResponseState::Responding) {
        transition(ResponseState::Idle, cancelled ? "response cancelled" : "response done");
    } else if (state_ == ResponseState::Idle) {
        suppress_audio_ = false;
    }
    if (!pending_) {
        return;
    }

    const auto deferred = *pending_;
    if ((responding_to_ && *responding_to_ == deferred.text) || responded_.count(deferred.text)) {
        logging::debug("Deferred transcript already answered", {kv_text("transcript", deferred.text)});
        pending_.reset();
        return;
    }
    if (state_ != ResponseState::Idle) {
        return;
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - *timing_.response_ended);
    const auto delay = std::max(cfg_.post_response_echo - elapsed, cfg_.deferred_reply_min_delay);
    logging::info(
        "Reply to deferred transcript scheduled",
        {kv_text("transcript", deferred.text),
         kv("delay_ms", delay.count())});
    schedule_reply(deferred, delay);
}

void TurnStateMachine::on_user_transcript(const std::string& text) {
    if (state_ == ResponseState::Closing) {
        return;
    }
    const auto now = now_();
    const auto transcript = utils::trim_copy(text);
    auto& metrics = Metrics::instance();

    if (validator_.is_too_short(transcript)) {
        logging::debug("Transcript too short", {kv_text("transcript", transcript)});
        metrics.increment(Counter::TranscriptsRejected);
        return;
    }
    if (validator_.is_non_conversational(transcript)) {
        logging::info("Voicemail or system prompt discarded", {kv_text("transcript", transcript)});
        metrics.increment(Counter::TranscriptsRejected);
        return;
    }

    const bool interruption = validator_.is_interruption_phrase(transcript);
    if (interruption && state_ == ResponseState::Responding && timing_.response_started) {
        interrupt(transcript, now);
        return;
    }

    if (!interruption) {
        if (is_echo(transcript, now)) {
            metrics.increment(Counter::EchoSuppressed);
            metrics.increment(Counter::TranscriptsRejected);
            timing_.suspected_speech.reset();
            return;
        }
        if (state_ == ResponseState::Responding && validator_.is_short_phrase(transcript)) {
            logging::info("Short phrase during reply discarded", {kv_text("transcript", transcript)});
            metrics.increment(Counter::TranscriptsRejected);
            return;
        }
    }

    timing_.suspected_speech.reset();
    accept(transcript, now);
}

bool TurnStateMachine::is_echo(const std::string& text, Clock::time_point now) {
    if (suspected_speech_confirmed(now)) {
        return false;
    }
    const bool greeting = validator_.is_greeting_phrase(text);
    const auto since_start = since(timing_.response_started, now);

    if (!greeting && since_start && *since_start < cfg_.echo_period) {
        logging::info(
            "Transcript discarded as echo (reply just started)",
            {kv_text("transcript", text),
             kv("since_response_ms", since_start->count())});
        return true;
    }
    if (!greeting && state_ == ResponseState::Responding && since_start &&
        *since_start < cfg_.echo_suppression) {
        logging::info(
            "Transcript discarded as echo (AI speaking)",
            {kv_text("transcript", text),
             kv("since_response_ms", since_start->count())});
        return true;
    }

    if (!in_post_response_window(now)) {
        return false;
    }
    const auto since_end = *since(timing_.response_ended, now);
    if (!last_ai_reply_.empty()) {
        const double similarity = TranscriptValidator::similarity(text, last_ai_reply_);
        if (similarity > validator_.config().duplicate_similarity) {
            logging::info(
                "Transcript discarded as echo of reply",
                {kv_text("transcript", text),
                 kv("similarity", similarity),
                 kv("since_end_ms", since_end.count())});
            return true;
        }
    } else if (validator_.is_short_phrase(text)) {
        logging::info("Short transcript after reply discarded", {kv_text("transcript", text)});
        return true;
    }
    if (validator_.is_polite_phrase(text) && since_end < cfg_.polite_phrase_window) {
        logging::info("Polite phrase after reply discarded", {kv_text("transcript", text)});
        return true;
    }
    return false;
}

void TurnStateMachine::interrupt(const std::string& text, Clock::time_point now) {
    const auto since_start = since(timing_.response_started, now);
    logging::info(
        "Caller interrupted reply",
        {kv_text("transcript", text),
         kv("since_response_ms", since_start ? since_start->count() : 0)});
    Metrics::instance().increment(Counter::Interruptions);

    cancel_reply_timer();
    pending_.reset();
    ++timing_.latest_speech_seq;
    timing_.suspected_speech.reset();

    cancel_active_response("caller interruption");
    transition(ResponseState::Interrupted, "interruption phrase");
    suppress_audio_ = true;
    if (hooks_.clear_caller_audio) {
        hooks_.clear_caller_audio();
    }
    record(Speaker::Human, text);
    notify("caller_interrupted", {{"message", text}});
}

void TurnStateMachine::accept(const std::string& text, Clock::time_point now) {
    Metrics::instance().increment(Counter::TranscriptsAccepted);
    const auto seq = ++timing_.latest_speech_seq;
    logging::info(
        "Caller transcript accepted",
        {kv_text("transcript", text),
         kv("seq", seq),
         kv("state", to_string(state_))});
    record(Speaker::Human, text);

    if (state_ == ResponseState::Interrupted) {
        transition(ResponseState::Idle, "interruption finished");
    }

    PendingTranscript transcript{text, seq, now};
    if (state_ == ResponseState::Responding || reply_requested_) {
        // The AI finishes its sentence; the reply waits for response done.
        cancel_reply_timer();
        pending_ = transcript;
        logging::info(
            "Transcript deferred until reply completes",
            {kv_text("transcript", text),
             kv("reply_requested", reply_requested_)});
        return;
    }
    pending_.reset();

    if (responded_.count(text)) {
        logging::info("Transcript already answered", {kv_text("transcript", text)});
        return;
    }

    auto delay = cfg_.response_delay;
    if (in_post_response_window(now)) {
        const auto elapsed = *since(timing_.response_ended, now);
        delay = std::max(delay, cfg_.post_response_echo - elapsed);
    }
    schedule_reply(transcript, delay);
}

void TurnStateMachine::schedule_reply(const PendingTranscript& transcript,
                                      std::chrono::milliseconds delay) {
    cancel_reply_timer();
    if (delay.count() <= 0) {
        issue_reply(transcript);
        return;
    }
    pending_ = transcript;
    reply_timer_ = scheduler_.schedule(delay, [this, transcript]() {
        reply_timer_.reset();
        issue_reply(transcript);
    });
}

void TurnStateMachine::issue_reply(const PendingTranscript& transcript) {
    if (state_ == ResponseState::Closing) {
        return;
    }
    if (transcript.seq != timing_.latest_speech_seq) {
        logging::debug(
            "Stale transcript dropped",
            {kv_text("transcript", transcript.text),
             kv("seq", transcript.seq),
             kv("latest_seq", timing_.latest_speech_seq)});
        return;
    }
    if (state_ != ResponseState::Idle || reply_requested_) {
        logging::debug(
            "Reply request skipped",
            {kv("state", to_string(state_)),
             kv("reply_requested", reply_requested_)});
        return;
    }
    if (responded_.count(transcript.text)) {
        pending_.reset();
        return;
    }

    responded_.insert(transcript.text);
    responding_to_ = transcript.text;
    pending_.reset();
    reply_requested_ = true;
    timing_.reply_requested = now_();
    Metrics::instance().increment(Counter::RepliesRequested);
    logging::info("Requesting AI reply", {kv_text("transcript", transcript.text)});
    if (hooks_.request_response) {
        hooks_.request_response();
    }
}

void TurnStateMachine::on_user_transcript_failed(const std::string& reason) {
    if (state_ == ResponseState::Closing) {
        return;
    }
    Metrics::instance().increment(Counter::TranscriptionFailures);
    if (is_rate_limit_error(reason)) {
        logging::error("Caller transcription rate limited", {kv("error", reason)});
    } else {
        logging::warn("Caller transcription failed", {kv("error", reason)});
    }

    timing_.suspected_speech.reset();
    drop_scheduled_reply("transcription failed");
    if (state_ == ResponseState::Responding && !current_response_solicited_) {
        cancel_active_response("reply not backed by a transcript");
    }
}

void TurnStateMachine::on_session_error(const std::string& code, const std::string& message) {
    if (is_benign_cancel_error(code) || is_benign_cancel_error(message)) {
        logging::debug("Nothing to cancel", {kv("code", code)});
        return;
    }
    logging::error(
        "Speech session error",
        {kv("code", code),
         kv("error", message),
         kv("state", to_string(state_))});
}

void TurnStateMachine::shutdown() {
    if (state_ == ResponseState::Closing) {
        return;
    }
    cancel_reply_timer();
    if (state_ == ResponseState::Responding || reply_requested_) {
        cancel_active_response("session closing");
    }
    pending_.reset();
    transition(ResponseState::Closing, "session teardown");
}

}
}
