#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

namespace call_bridge {
namespace vad {

struct SpeechDetectorConfig {
    double speech_threshold = 2000.0;
    double min_avg_energy_ratio = 0.7;

    double echo_baseline_multiplier = 2.0;
    double echo_min_threshold = 2500.0;
    double echo_avg_energy_ratio = 0.75;

    double high_energy_threshold = 4000.0;
    double high_energy_avg_threshold = 3000.0;
    double interruption_energy_threshold = 3500.0;

    size_t energy_window = 5;
    size_t baseline_window = 20;
    size_t baseline_min_samples = 10;

    int frames_required = 2;
    int frames_required_high_energy = 1;

    bool debug = false;
};

struct DetectionResult {
    bool suspected_speech = false;
    double energy = 0.0;
    double average_energy = 0.0;
    double threshold = 0.0;
    bool high_energy = false;
};

// Energy-based speech detector. It only raises a suspicion; confirmation
// comes from a transcript.
class SpeechActivityDetector {
public:
    explicit SpeechActivityDetector(SpeechDetectorConfig cfg = {});

    // idle: no response in flight, baseline may adapt.
    // echo_period: AI audio may be leaking back into the inbound stream.
    DetectionResult process_frame(const std::vector<int16_t>& samples,
                                  bool idle,
                                  bool echo_period);

    std::optional<double> echo_baseline() const;
    void reset();

private:
    void update_baseline(double energy);
    double average_energy() const;

    SpeechDetectorConfig cfg_;
    std::deque<double> energy_buf_;
    std::deque<double> baseline_buf_;
    std::optional<double> baseline_;
    int consecutive_frames_ = 0;
    uint64_t frame_index_ = 0;
};

}
}
