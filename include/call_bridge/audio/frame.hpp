#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

namespace call_bridge {
namespace audio {

constexpr int kTelephonySampleRate = 8000;
constexpr int kSessionSampleRate = 24000;

enum class Direction {
    Inbound,
    Outbound
};

struct AudioFrame {
    std::vector<int16_t> samples;
    int sample_rate = kSessionSampleRate;
    Direction direction = Direction::Inbound;
    std::chrono::steady_clock::time_point received_at = std::chrono::steady_clock::now();
};

}
}
