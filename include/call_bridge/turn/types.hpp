#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace call_bridge {
namespace turn {

using Clock = std::chrono::steady_clock;

enum class ResponseState {
    Idle,
    Responding,
    Interrupted,
    Closing
};

enum class Speaker {
    Ai,
    Human
};

const char* to_string(ResponseState state);
const char* to_string(Speaker speaker);

struct TurnTiming {
    std::optional<Clock::time_point> response_started;
    std::optional<Clock::time_point> response_ended;
    std::optional<Clock::time_point> suspected_speech;
    std::optional<Clock::time_point> reply_requested;
    uint64_t latest_speech_seq = 0;
};

struct PendingTranscript {
    std::string text;
    uint64_t seq = 0;
    Clock::time_point received_at;
};

}
}
