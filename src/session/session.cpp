#include "call_bridge/session/session.hpp"

#include <string>
#include <utility>

#include "call_bridge/logging.hpp"
#include "call_bridge/metrics.hpp"
#include "call_bridge/session/persona.hpp"

namespace call_bridge::session {

turn::TurnConfig make_turn_config(const Config& config) {
    turn::TurnConfig cfg;
    cfg.echo_period = std::chrono::milliseconds(config.echo_period_ms);
    cfg.echo_suppression = std::chrono::milliseconds(config.echo_suppression_ms);
    cfg.post_response_echo = std::chrono::milliseconds(config.post_response_echo_ms);
    cfg.suspected_speech_timeout = std::chrono::milliseconds(config.suspected_speech_timeout_ms);
    cfg.response_delay = std::chrono::milliseconds(config.openai_response_delay_ms);
    cfg.greeting_on_connect = config.greeting_on_connect;
    return cfg;
}

vad::SpeechDetectorConfig make_detector_config(const Config& config) {
    vad::SpeechDetectorConfig cfg;
    cfg.speech_threshold = config.speech_detection_threshold;
    cfg.high_energy_threshold = config.high_energy_threshold;
    cfg.high_energy_avg_threshold = config.high_energy_avg_threshold;
    cfg.interruption_energy_threshold = config.interruption_energy_threshold;
    cfg.echo_baseline_multiplier = config.echo_baseline_multiplier;
    cfg.echo_min_threshold = config.echo_suppression_min_threshold;
    cfg.debug = config.log_level == "DEBUG" || config.log_level == "TRACE";
    return cfg;
}

turn::ValidatorConfig make_validator_config(const Config& config) {
    turn::ValidatorConfig cfg;
    cfg.pair_ttl = std::chrono::seconds(config.transcript_pair_ttl_sec);
    return cfg;
}

BridgeSession::BridgeSession(uint64_t connection_id,
                             std::optional<std::string> query_call_sid,
                             SessionDependencies deps,
                             TelephonyLink link)
    : connection_id_(connection_id),
      deps_(deps),
      link_(std::move(link)),
      loop_("session-" + std::to_string(connection_id)),
      telephony_(std::move(query_call_sid)) {
    turn::TurnHooks hooks;
    hooks.forward_to_session = [this](const audio::AudioFrame& frame) { forward_to_session(frame); };
    hooks.play_to_caller = [this](const audio::AudioFrame& frame) {
        if (auto message = telephony_.media_message(frame)) {
            Metrics::instance().increment(Counter::FramesOutbound);
            send_to_caller(*message);
        }
    };
    hooks.clear_caller_audio = [this]() {
        if (auto message = telephony_.clear_message()) {
            send_to_caller(*message);
        }
    };
    hooks.request_response = [this]() { send_to_session(realtime::response_create(), "response.create"); };
    hooks.cancel_response = [this]() { send_to_session(realtime::response_cancel(), "response.cancel"); };
    hooks.record_transcript = [this](turn::Speaker speaker, const std::string& text) {
        record_transcript(speaker, text);
    };
    hooks.notify = [this](const std::string& event, const nlohmann::json& payload) {
        notify(event, payload);
    };
    turn_ = std::make_unique<turn::TurnStateMachine>(make_turn_config(deps_.config),
                                                     make_detector_config(deps_.config),
                                                     make_validator_config(deps_.config),
                                                     loop_, std::move(hooks));
}

BridgeSession::~BridgeSession() {
    loop_.stop();
    if (speech_) {
        speech_->stop();
    }
}

void BridgeSession::start() {
    Metrics::instance().increment(Counter::SessionsStarted);
    loop_.start();
}

void BridgeSession::post_telephony_message(std::string message) {
    loop_.post([this, message = std::move(message)]() { handle_telephony_message(message); });
}

void BridgeSession::post_telephony_closed() {
    loop_.post([this]() { teardown("telephony connection closed"); });
}

void BridgeSession::handle_telephony_message(const std::string& message) {
    if (closing_) {
        return;
    }
    telephony::StreamEvent event;
    try {
        event = telephony_.handle_message(message);
    } catch (const ProtocolError& ex) {
        Metrics::instance().increment(Counter::DecodeErrors);
        logging::warn(
            "Malformed media stream message",
            {kv("connection", connection_id_),
             kv("error", ex.what())});
        return;
    }

    switch (event.type) {
        case telephony::StreamEventType::Connected:
            logging::debug("Media stream handshake", {kv("connection", connection_id_)});
            break;
        case telephony::StreamEventType::Start:
            handle_stream_start(event);
            break;
        case telephony::StreamEventType::Media:
            handle_media(event);
            break;
        case telephony::StreamEventType::Stop:
            teardown("media stream stopped");
            break;
        case telephony::StreamEventType::Mark:
        case telephony::StreamEventType::Unknown:
            break;
    }
}

void BridgeSession::handle_stream_start(const telephony::StreamEvent& event) {
    if (record_) {
        logging::warn("Duplicate media stream start ignored", {kv("stream_sid", event.stream_sid)});
        return;
    }
    const auto& call_sid = telephony_.call_sid();
    if (!call_sid) {
        logging::error("No call sid in start event or connection query",
                       {kv("stream_sid", event.stream_sid)});
        teardown("missing call sid");
        return;
    }
    logging::set_thread_context("session-" + std::to_string(connection_id_) + " " + *call_sid);

    std::optional<backend::CallRecord> record;
    try {
        record = deps_.directory.lookup_by_sid(*call_sid);
    } catch (const std::exception& ex) {
        logging::error(
            "Call record lookup failed",
            {kv("call_sid", *call_sid),
             kv("error", ex.what())});
        teardown("call lookup failed");
        return;
    }
    if (!record) {
        logging::error("Call not found", {kv("call_sid", *call_sid)});
        teardown("call not found");
        return;
    }
    record_ = std::move(record);
    logging::info(
        "Session initialized",
        {kv("call_id", record_->id),
         kv("call_sid", *call_sid),
         kv("stream_sid", telephony_.stream_sid())});
    connect_speech_session(*record_);
}

void BridgeSession::handle_media(const telephony::StreamEvent& event) {
    if (!record_) {
        return;
    }
    auto frame = telephony_.to_frame(event);
    if (!frame) {
        return;
    }
    turn_->on_inbound_audio(*frame);
}

void BridgeSession::connect_speech_session(const backend::CallRecord& record) {
    const auto url = realtime::session_url(deps_.config);
    speech_ = std::make_unique<realtime::RealtimeWsClient>(
        url, std::vector<std::pair<std::string, std::string>>{
                 {"Authorization", "Bearer " + deps_.config.openai_api_key},
                 {"OpenAI-Beta", "realtime=v1"},
             });

    realtime::RealtimeWsClient::Handlers handlers;
    handlers.on_open = [this]() { loop_.post([this]() { handle_session_open(); }); };
    handlers.on_message = [this](const std::string& message) {
        loop_.post([this, message]() { handle_session_message(message); });
    };
    handlers.on_close = [this]() { loop_.post([this]() { teardown("speech session closed"); }); };
    handlers.on_fail = [this](const std::string& reason) {
        loop_.post([this, reason]() {
            logging::error(
                "Speech session connection failed",
                {kv("connection", connection_id_),
                 kv("error", reason)});
            teardown("speech session failed");
        });
    };
    logging::info(
        "Connecting speech session",
        {kv("call_id", record.id),
         kv("model", deps_.config.realtime_model)});
    speech_->connect(std::move(handlers));
}

void BridgeSession::handle_session_open() {
    if (closing_ || !record_) {
        return;
    }
    const auto profile = extract_profile(*record_);
    const auto voice = voice_for(record_->voice_preference);
    const auto settings = realtime::SessionSettings::from_config(
        deps_.config, build_instructions(profile), voice);
    send_to_session(realtime::session_update(settings), "session.update");
    session_ready_ = true;
    logging::info(
        "Speech session connected",
        {kv("call_id", record_->id),
         kv("voice", voice),
         kv("buffered_frames", inbound_buffer_.size())});
    flush_inbound_buffer();
    turn_->start_conversation();
}

void BridgeSession::handle_session_message(const std::string& message) {
    if (closing_) {
        return;
    }
    try {
        dispatch(realtime::parse_event(message));
    } catch (const ProtocolError& ex) {
        logging::warn(
            "Malformed speech session event",
            {kv("connection", connection_id_),
             kv("error", ex.what())});
    }
}

void BridgeSession::dispatch(const realtime::SessionEvent& event) {
    using realtime::EventType;
    switch (event.type) {
        case EventType::SessionCreated:
            logging::debug("Speech session created");
            break;
        case EventType::SessionUpdated:
            logging::info("Speech session configured");
            break;
        case EventType::ResponseCreated:
            turn_->on_response_created();
            break;
        case EventType::ResponseAudioDelta: {
            if (event.audio.empty()) {
                break;
            }
            audio::AudioFrame frame;
            frame.samples = event.audio;
            frame.sample_rate = audio::kSessionSampleRate;
            frame.direction = audio::Direction::Outbound;
            turn_->on_response_audio(frame);
            break;
        }
        case EventType::ResponseAudioDone:
            turn_->on_response_audio_done();
            break;
        case EventType::ResponseTranscriptDelta:
            break;
        case EventType::ResponseTranscriptDone:
            turn_->on_response_transcript_done(event.text);
            break;
        case EventType::ResponseDone:
            turn_->on_response_done();
            break;
        case EventType::ResponseCancelled:
            turn_->on_response_cancelled();
            break;
        case EventType::UserTranscriptCompleted:
            turn_->on_user_transcript(event.text);
            break;
        case EventType::UserTranscriptFailed:
            turn_->on_user_transcript_failed(event.error_message.empty() ? event.error_code
                                                                         : event.error_message);
            break;
        case EventType::SpeechStarted:
            turn_->on_speech_started();
            break;
        case EventType::SpeechStopped:
            turn_->on_speech_stopped();
            break;
        case EventType::Error:
            turn_->on_session_error(event.error_code, event.error_message);
            break;
        case EventType::Other:
            logging::trace("Speech session event ignored", {kv("type", event.name)});
            break;
    }
}

void BridgeSession::forward_to_session(const audio::AudioFrame& frame) {
    Metrics::instance().increment(Counter::FramesInbound);
    if (session_ready_) {
        send_to_session(realtime::input_audio_append(frame), "input_audio_buffer.append");
        return;
    }
    inbound_buffer_.push_back(frame);
    Metrics::instance().increment(Counter::FramesBuffered);
    const auto limit = static_cast<size_t>(deps_.config.inbound_buffer_frames);
    while (inbound_buffer_.size() > limit) {
        inbound_buffer_.pop_front();
        Metrics::instance().increment(Counter::FramesDropped);
    }
}

void BridgeSession::flush_inbound_buffer() {
    while (!inbound_buffer_.empty()) {
        send_to_session(realtime::input_audio_append(inbound_buffer_.front()),
                        "input_audio_buffer.append");
        inbound_buffer_.pop_front();
    }
}

void BridgeSession::send_to_session(const nlohmann::json& payload, const char* what) {
    if (!speech_ || !speech_->send_json(payload)) {
        logging::debug(
            "Speech session not open, message dropped",
            {kv("connection", connection_id_),
             kv("message", what)});
    }
}

void BridgeSession::send_to_caller(const std::string& message) {
    if (link_.send && !link_.send(message)) {
        logging::trace("Telephony connection not open, message dropped",
                       {kv("connection", connection_id_)});
    }
}

void BridgeSession::record_transcript(turn::Speaker speaker, const std::string& text) {
    if (!record_ || text.empty()) {
        return;
    }
    backend::TranscriptEntry entry;
    entry.call_id = record_->id;
    entry.speaker = turn::to_string(speaker);
    entry.message = text;
    deps_.transcripts.append(entry);
}

void BridgeSession::notify(const std::string& event, const nlohmann::json& payload) {
    if (!record_) {
        return;
    }
    deps_.notifier.notify(record_->id, event, payload);
}

void BridgeSession::teardown(const std::string& reason) {
    if (closing_) {
        return;
    }
    closing_ = true;
    logging::info(
        "Session closing",
        {kv("connection", connection_id_),
         kv("reason", reason),
         kv("call_id", record_ ? record_->id : std::string("none"))});

    turn_->shutdown();
    if (speech_) {
        speech_->stop();
    }
    session_ready_ = false;
    inbound_buffer_.clear();
    if (link_.close) {
        link_.close(reason);
    }
    Metrics::instance().increment(Counter::SessionsClosed);
    finished_ = true;
    if (link_.on_finished) {
        link_.on_finished();
    }
}

}
