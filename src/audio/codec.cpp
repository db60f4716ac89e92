#include "call_bridge/audio/codec.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace call_bridge::audio {

namespace {

constexpr int kMulawBias = 0x84;
constexpr int kMulawClip = 32635;

constexpr int kSincHalfWidth = 16;
constexpr double kPi = 3.14159265358979323846;

constexpr double kNoiseFloorRms = 100.0;
constexpr int kHealthyPeakLow = 20000;
constexpr int kHealthyPeakHigh = 32767;
constexpr double kTargetPeak = 27852.0;
constexpr double kMaxGain = 2.0;

int16_t clamp_sample(double value) {
    const double rounded = std::round(value);
    if (rounded > 32767.0) {
        return 32767;
    }
    if (rounded < -32768.0) {
        return -32768;
    }
    return static_cast<int16_t>(rounded);
}

std::vector<double> lowpass(const std::vector<int16_t>& samples, double cutoff) {
    // cutoff is relative to the source Nyquist frequency.
    std::vector<double> kernel(2 * kSincHalfWidth + 1);
    double weight_sum = 0.0;
    for (int k = -kSincHalfWidth; k <= kSincHalfWidth; ++k) {
        double sinc = cutoff;
        if (k != 0) {
            const double x = kPi * cutoff * static_cast<double>(k);
            sinc = std::sin(x) / (kPi * static_cast<double>(k));
        }
        const double window = 0.54 + 0.46 * std::cos(kPi * k / kSincHalfWidth);
        kernel[static_cast<size_t>(k + kSincHalfWidth)] = sinc * window;
        weight_sum += sinc * window;
    }
    for (auto& tap : kernel) {
        tap /= weight_sum;
    }

    const auto last = static_cast<long>(samples.size()) - 1;
    std::vector<double> filtered(samples.size());
    for (long i = 0; i <= last; ++i) {
        double acc = 0.0;
        for (int k = -kSincHalfWidth; k <= kSincHalfWidth; ++k) {
            const long idx = std::clamp(i + k, 0L, last);
            acc += kernel[static_cast<size_t>(k + kSincHalfWidth)] *
                   static_cast<double>(samples[static_cast<size_t>(idx)]);
        }
        filtered[static_cast<size_t>(i)] = acc;
    }
    return filtered;
}

double catmull_rom(double p0, double p1, double p2, double p3, double t) {
    const double t2 = t * t;
    const double t3 = t2 * t;
    return 0.5 * (2.0 * p1 +
                  (-p0 + p2) * t +
                  (2.0 * p0 - 5.0 * p1 + 4.0 * p2 - p3) * t2 +
                  (-p0 + 3.0 * p1 - 3.0 * p2 + p3) * t3);
}

}

int16_t mulaw_to_linear(uint8_t value) {
    value = static_cast<uint8_t>(~value);
    const int sign = value & 0x80;
    const int exponent = (value >> 4) & 0x07;
    const int mantissa = value & 0x0F;
    int sample = (((mantissa << 3) + kMulawBias) << exponent) - kMulawBias;
    return static_cast<int16_t>(sign ? -sample : sample);
}

uint8_t linear_to_mulaw(int16_t sample) {
    int pcm = sample;
    const int sign = pcm < 0 ? 0x80 : 0x00;
    if (sign) {
        pcm = -pcm;
    }
    if (pcm > kMulawClip) {
        pcm = kMulawClip;
    }
    pcm += kMulawBias;

    int exponent = 7;
    for (int mask = 0x4000; (pcm & mask) == 0 && exponent > 0; mask >>= 1) {
        --exponent;
    }
    const int mantissa = (pcm >> (exponent + 3)) & 0x0F;
    return static_cast<uint8_t>(~(sign | (exponent << 4) | mantissa));
}

std::vector<int16_t> decode_mulaw(const std::string& bytes) {
    std::vector<int16_t> samples;
    samples.reserve(bytes.size());
    for (char byte : bytes) {
        samples.push_back(mulaw_to_linear(static_cast<uint8_t>(byte)));
    }
    return samples;
}

std::string encode_mulaw(const std::vector<int16_t>& samples) {
    std::string bytes;
    bytes.reserve(samples.size());
    for (int16_t sample : samples) {
        bytes.push_back(static_cast<char>(linear_to_mulaw(sample)));
    }
    return bytes;
}

std::vector<int16_t> resample(const std::vector<int16_t>& samples, int from_rate, int to_rate) {
    if (from_rate <= 0 || to_rate <= 0) {
        throw std::invalid_argument("sample rates must be positive");
    }
    if (from_rate == to_rate || samples.empty()) {
        return samples;
    }

    const double ratio = static_cast<double>(to_rate) / static_cast<double>(from_rate);
    std::vector<double> source;
    if (ratio < 1.0) {
        source = lowpass(samples, ratio);
    } else {
        source.assign(samples.begin(), samples.end());
    }

    const auto out_len = static_cast<size_t>(
        static_cast<uint64_t>(samples.size()) * static_cast<uint64_t>(to_rate) /
        static_cast<uint64_t>(from_rate));
    const auto last = static_cast<long>(source.size()) - 1;
    auto at = [&](long idx) { return source[static_cast<size_t>(std::clamp(idx, 0L, last))]; };

    std::vector<int16_t> output(out_len);
    for (size_t i = 0; i < out_len; ++i) {
        const double position = static_cast<double>(i) / ratio;
        const auto index = static_cast<long>(std::floor(position));
        const double t = position - static_cast<double>(index);
        output[i] = clamp_sample(catmull_rom(at(index - 1), at(index), at(index + 1),
                                             at(index + 2), t));
    }
    return output;
}

double rms_energy(const std::vector<int16_t>& samples) {
    if (samples.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (int16_t sample : samples) {
        const double value = static_cast<double>(sample);
        sum += value * value;
    }
    return std::sqrt(sum / static_cast<double>(samples.size()));
}

int16_t peak_amplitude(const std::vector<int16_t>& samples) {
    int peak = 0;
    for (int16_t sample : samples) {
        peak = std::max(peak, std::abs(static_cast<int>(sample)));
    }
    return static_cast<int16_t>(std::min(peak, 32767));
}

std::vector<int16_t> normalize(const std::vector<int16_t>& samples) {
    if (samples.empty()) {
        return samples;
    }
    const int peak = peak_amplitude(samples);
    if (peak == 0 || rms_energy(samples) < kNoiseFloorRms) {
        return samples;
    }
    if (peak > kHealthyPeakLow && peak < kHealthyPeakHigh) {
        return samples;
    }

    const double gain = std::min(kMaxGain, kTargetPeak / static_cast<double>(peak));
    std::vector<int16_t> output(samples.size());
    std::transform(samples.begin(), samples.end(), output.begin(), [gain](int16_t sample) {
        return clamp_sample(static_cast<double>(sample) * gain);
    });
    return output;
}

std::vector<int16_t> pcm_from_bytes(const std::string& bytes) {
    const size_t count = bytes.size() / 2;
    std::vector<int16_t> samples(count);
    for (size_t i = 0; i < count; ++i) {
        const auto lo = static_cast<uint8_t>(bytes[2 * i]);
        const auto hi = static_cast<uint8_t>(bytes[2 * i + 1]);
        samples[i] = static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8)));
    }
    return samples;
}

std::string pcm_to_bytes(const std::vector<int16_t>& samples) {
    std::string bytes(samples.size() * 2, '\0');
    for (size_t i = 0; i < samples.size(); ++i) {
        const auto value = static_cast<uint16_t>(samples[i]);
        bytes[2 * i] = static_cast<char>(value & 0xFF);
        bytes[2 * i + 1] = static_cast<char>((value >> 8) & 0xFF);
    }
    return bytes;
}

}
