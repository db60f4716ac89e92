#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace call_bridge {

enum class Counter : size_t {
    SessionsStarted,
    SessionsClosed,
    FramesInbound,
    FramesOutbound,
    FramesBuffered,
    FramesDropped,
    DecodeErrors,
    TranscriptsAccepted,
    TranscriptsRejected,
    EchoSuppressed,
    RepliesRequested,
    RepliesCancelled,
    Interruptions,
    AccuracyFlags,
    TranscriptionFailures,
    Count
};

class Metrics {
public:
    static Metrics& instance();

    void increment(Counter counter, uint64_t amount = 1);
    uint64_t value(Counter counter) const;
    void set_active_sessions(int64_t value);
    void observe_response_time(const std::string& stage, double seconds);
    std::string render_prometheus() const;
    void reset();

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    HistogramSeries& histogram_for(const std::string& stage);

    static constexpr size_t kCounterCount = static_cast<size_t>(Counter::Count);

    mutable std::mutex mutex_;
    std::array<uint64_t, kCounterCount> counters_{};
    int64_t active_sessions_ = 0;
    std::unordered_map<std::string, HistogramSeries> response_histograms_;
    std::vector<double> histogram_bounds_;
};

}
