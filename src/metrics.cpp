#include "call_bridge/metrics.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace call_bridge {

namespace {

struct CounterInfo {
    const char* name;
    const char* help;
};

constexpr CounterInfo kCounterInfo[] = {
    {"bridge_sessions_started_total", "Bridge sessions started"},
    {"bridge_sessions_closed_total", "Bridge sessions torn down"},
    {"bridge_frames_inbound_total", "Telephony frames received"},
    {"bridge_frames_outbound_total", "Frames sent back to telephony"},
    {"bridge_frames_buffered_total", "Inbound frames buffered before session ready"},
    {"bridge_frames_dropped_total", "Inbound frames dropped on buffer overflow"},
    {"bridge_decode_errors_total", "Malformed media payloads skipped"},
    {"bridge_transcripts_accepted_total", "User transcripts accepted"},
    {"bridge_transcripts_rejected_total", "User transcripts rejected by validation"},
    {"bridge_echo_suppressed_total", "User transcripts discarded as echo"},
    {"bridge_replies_requested_total", "Replies requested from the speech session"},
    {"bridge_replies_cancelled_total", "Replies cancelled"},
    {"bridge_interruptions_total", "Explicit caller interruptions"},
    {"bridge_accuracy_flags_total", "Transcript and reply pairs flagged as inconsistent"},
    {"bridge_transcription_failures_total", "Upstream transcription failures"},
};

static_assert(sizeof(kCounterInfo) / sizeof(kCounterInfo[0]) ==
                  static_cast<size_t>(Counter::Count),
              "counter table out of sync");

}

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.05, 0.1, 0.25, 0.5, 0.75, 1.0, 1.5, 2.0, 3.0, 5.0, 10.0};
}

void Metrics::increment(Counter counter, uint64_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[static_cast<size_t>(counter)] += amount;
}

uint64_t Metrics::value(Counter counter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_[static_cast<size_t>(counter)];
}

void Metrics::set_active_sessions(int64_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_sessions_ = value;
}

Metrics::HistogramSeries& Metrics::histogram_for(const std::string& stage) {
    auto& series = response_histograms_[stage];
    if (series.buckets.empty()) {
        series.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    return series;
}

void Metrics::observe_response_time(const std::string& stage, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = histogram_for(stage);
    histogram.count += 1;
    histogram.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            histogram.buckets[i] += 1;
        }
    }
    histogram.buckets.back() += 1;
}

void Metrics::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.fill(0);
    active_sessions_ = 0;
    response_histograms_.clear();
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    for (size_t i = 0; i < kCounterCount; ++i) {
        out << "# HELP " << kCounterInfo[i].name << " " << kCounterInfo[i].help << "\n";
        out << "# TYPE " << kCounterInfo[i].name << " counter\n";
        out << kCounterInfo[i].name << " " << counters_[i] << "\n";
    }

    out << "# HELP bridge_active_sessions Bridge sessions currently open\n";
    out << "# TYPE bridge_active_sessions gauge\n";
    out << "bridge_active_sessions " << active_sessions_ << "\n";

    out << "# HELP bridge_response_latency_seconds Time from reply request to first audio\n";
    out << "# TYPE bridge_response_latency_seconds histogram\n";
    std::vector<std::string> stages;
    stages.reserve(response_histograms_.size());
    for (const auto& item : response_histograms_) {
        stages.push_back(item.first);
    }
    std::sort(stages.begin(), stages.end());
    for (const auto& stage : stages) {
        const auto& series = response_histograms_.at(stage);
        for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
            out << "bridge_response_latency_seconds_bucket{stage=\"" << stage
                << "\",le=\"" << histogram_bounds_[i] << "\"} "
                << series.buckets[i] << "\n";
        }
        out << "bridge_response_latency_seconds_bucket{stage=\"" << stage
            << "\",le=\"+Inf\"} " << series.buckets.back() << "\n";
        out << "bridge_response_latency_seconds_count{stage=\"" << stage << "\"} "
            << series.count << "\n";
        out << "bridge_response_latency_seconds_sum{stage=\"" << stage << "\"} "
            << series.sum << "\n";
    }

    return out.str();
}

}
