#include "call_bridge/vad/energy_detector.hpp"

#include <algorithm>
#include <numeric>

#include "call_bridge/audio/codec.hpp"
#include "call_bridge/logging.hpp"

namespace call_bridge {
namespace vad {

SpeechActivityDetector::SpeechActivityDetector(SpeechDetectorConfig cfg)
    : cfg_(cfg) {}

void SpeechActivityDetector::reset() {
    energy_buf_.clear();
    baseline_buf_.clear();
    baseline_.reset();
    consecutive_frames_ = 0;
    frame_index_ = 0;
}

std::optional<double> SpeechActivityDetector::echo_baseline() const {
    return baseline_;
}

void SpeechActivityDetector::update_baseline(double energy) {
    baseline_buf_.push_back(energy);
    if (baseline_buf_.size() > cfg_.baseline_window) {
        baseline_buf_.pop_front();
    }
    if (baseline_buf_.size() < cfg_.baseline_min_samples) {
        return;
    }
    std::vector<double> sorted(baseline_buf_.begin(), baseline_buf_.end());
    const auto middle = sorted.begin() + static_cast<std::ptrdiff_t>(sorted.size() / 2);
    std::nth_element(sorted.begin(), middle, sorted.end());
    baseline_ = *middle;
}

double SpeechActivityDetector::average_energy() const {
    if (energy_buf_.empty()) {
        return 0.0;
    }
    const double sum = std::accumulate(energy_buf_.begin(), energy_buf_.end(), 0.0);
    return sum / static_cast<double>(energy_buf_.size());
}

DetectionResult SpeechActivityDetector::process_frame(const std::vector<int16_t>& samples,
                                                      bool idle,
                                                      bool echo_period) {
    DetectionResult result;
    if (samples.empty()) {
        return result;
    }

    const double energy = audio::rms_energy(samples);
    if (idle) {
        update_baseline(energy);
    }

    energy_buf_.push_back(energy);
    if (energy_buf_.size() > cfg_.energy_window) {
        energy_buf_.pop_front();
    }
    const double avg = average_energy();

    result.energy = energy;
    result.average_energy = avg;

    double min_avg = 0.0;
    if (echo_period) {
        result.threshold = std::max(baseline_.value_or(0.0) * cfg_.echo_baseline_multiplier,
                                    cfg_.echo_min_threshold);
        min_avg = result.threshold * cfg_.echo_avg_energy_ratio;
        if (energy > cfg_.high_energy_threshold && avg > cfg_.high_energy_avg_threshold) {
            result.high_energy = true;
        }
    } else {
        result.threshold = cfg_.speech_threshold;
        min_avg = result.threshold * cfg_.min_avg_energy_ratio;
    }

    const bool loud = energy > result.threshold && avg > min_avg;
    if (loud || result.high_energy) {
        ++consecutive_frames_;
        int required = cfg_.frames_required;
        if (result.high_energy ||
            (echo_period && energy > cfg_.interruption_energy_threshold)) {
            required = cfg_.frames_required_high_energy;
        }
        result.suspected_speech = consecutive_frames_ >= required;
    } else {
        consecutive_frames_ = 0;
    }

    if (cfg_.debug) {
        logging::debug(
            "Energy detector frame",
            {kv("frame", frame_index_),
             kv("energy", energy),
             kv("avg", avg),
             kv("threshold", result.threshold),
             kv("echo_period", echo_period),
             kv("speech", result.suspected_speech)});
    }
    ++frame_index_;
    return result;
}

}
}
