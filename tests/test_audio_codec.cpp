#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "call_bridge/audio/codec.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr double kPi = 3.14159265358979323846;

std::vector<int16_t> sine(double frequency, int sample_rate, size_t count, double amplitude) {
    std::vector<int16_t> samples(count);
    for (size_t i = 0; i < count; ++i) {
        samples[i] = static_cast<int16_t>(
            amplitude * std::sin(2.0 * kPi * frequency * static_cast<double>(i) / sample_rate));
    }
    return samples;
}

// Magnitude of one DFT bin, normalized by the sample count.
double tone_magnitude(const std::vector<int16_t>& samples, double frequency, int sample_rate) {
    double re = 0.0;
    double im = 0.0;
    for (size_t i = 0; i < samples.size(); ++i) {
        const double phase = 2.0 * kPi * frequency * static_cast<double>(i) / sample_rate;
        re += samples[i] * std::cos(phase);
        im += samples[i] * std::sin(phase);
    }
    return std::sqrt(re * re + im * im) / static_cast<double>(samples.size());
}

}

TEST_CASE("mulaw decode of silence and extremes") {
    REQUIRE(call_bridge::audio::mulaw_to_linear(0xFF) == 0);
    REQUIRE(call_bridge::audio::mulaw_to_linear(0x80) == 32124);
    REQUIRE(call_bridge::audio::mulaw_to_linear(0x00) == -32124);
    REQUIRE(call_bridge::audio::linear_to_mulaw(0) == 0xFF);
}

TEST_CASE("mulaw encode of decoded bytes reproduces the byte stream") {
    for (int value = 0; value < 256; ++value) {
        if (value == 0x7F) {
            // Negative zero decodes to 0, which encodes as positive zero.
            REQUIRE(call_bridge::audio::linear_to_mulaw(call_bridge::audio::mulaw_to_linear(0x7F)) ==
                    0xFF);
            continue;
        }
        const auto byte = static_cast<uint8_t>(value);
        REQUIRE(call_bridge::audio::linear_to_mulaw(call_bridge::audio::mulaw_to_linear(byte)) ==
                byte);
    }
}

TEST_CASE("mulaw round trip stays within quantization error") {
    for (int value = -32768; value <= 32767; value += 37) {
        const auto sample = static_cast<int16_t>(value);
        const auto decoded =
            call_bridge::audio::mulaw_to_linear(call_bridge::audio::linear_to_mulaw(sample));
        const int error = std::abs(static_cast<int>(decoded) - value);
        REQUIRE(error <= std::abs(value) / 8 + 8);
    }
}

TEST_CASE("decode_mulaw and encode_mulaw keep one sample per byte") {
    const std::string bytes = {'\xFF', '\x80', '\x00', '\x15'};
    const auto samples = call_bridge::audio::decode_mulaw(bytes);
    REQUIRE(samples.size() == 4);
    REQUIRE(call_bridge::audio::encode_mulaw(samples) == bytes);
    REQUIRE(call_bridge::audio::decode_mulaw("").empty());
}

TEST_CASE("resample at the same rate returns the input") {
    const auto input = sine(440.0, 8000, 160, 8000.0);
    REQUIRE(call_bridge::audio::resample(input, 8000, 8000) == input);
    REQUIRE(call_bridge::audio::resample({}, 8000, 24000).empty());
}

TEST_CASE("resample scales the sample count with the rate ratio") {
    const auto input = sine(300.0, 8000, 160, 6000.0);
    REQUIRE(call_bridge::audio::resample(input, 8000, 24000).size() == 480);
    REQUIRE(call_bridge::audio::resample(input, 8000, 16000).size() == 320);

    const auto wide = sine(300.0, 24000, 480, 6000.0);
    REQUIRE(call_bridge::audio::resample(wide, 24000, 8000).size() == 160);
    REQUIRE(call_bridge::audio::resample({1, 2, 3, 4, 5}, 24000, 8000).size() == 1);
}

TEST_CASE("resample rejects non-positive rates") {
    REQUIRE_THROWS_AS(call_bridge::audio::resample({1, 2, 3}, 0, 8000), std::invalid_argument);
    REQUIRE_THROWS_AS(call_bridge::audio::resample({1, 2, 3}, 8000, -1), std::invalid_argument);
}

TEST_CASE("upsampling preserves a low frequency tone") {
    const auto input = sine(400.0, 8000, 800, 10000.0);
    const auto output = call_bridge::audio::resample(input, 8000, 24000);
    const double in_level = tone_magnitude(input, 400.0, 8000);
    const double out_level = tone_magnitude(output, 400.0, 24000);
    REQUIRE(out_level == Catch::Approx(in_level).epsilon(0.05));
}

TEST_CASE("downsampling keeps the tone and suppresses content above the new Nyquist") {
    SECTION("low tone survives") {
        const auto input = sine(500.0, 24000, 2400, 10000.0);
        const auto output = call_bridge::audio::resample(input, 24000, 8000);
        const double in_level = tone_magnitude(input, 500.0, 24000);
        const double out_level = tone_magnitude(output, 500.0, 8000);
        REQUIRE(out_level == Catch::Approx(in_level).epsilon(0.1));
    }
    SECTION("tone above 4 kHz does not alias into the output") {
        // 7 kHz at 24 kHz would fold to 1 kHz at 8 kHz without filtering.
        const auto input = sine(7000.0, 24000, 2400, 10000.0);
        const auto output = call_bridge::audio::resample(input, 24000, 8000);
        const double in_level = tone_magnitude(input, 7000.0, 24000);
        const double alias_level = tone_magnitude(output, 1000.0, 8000);
        REQUIRE(alias_level < in_level * 0.1);
    }
}

TEST_CASE("normalize leaves healthy and near-silent frames alone") {
    const auto healthy = sine(300.0, 24000, 480, 25000.0);
    REQUIRE(call_bridge::audio::normalize(healthy) == healthy);

    const std::vector<int16_t> hiss(480, 40);
    REQUIRE(call_bridge::audio::normalize(hiss) == hiss);

    const std::vector<int16_t> silence(480, 0);
    REQUIRE(call_bridge::audio::normalize(silence) == silence);
}

TEST_CASE("normalize gain is capped at two") {
    const auto quiet = sine(300.0, 24000, 480, 4000.0);
    const auto boosted = call_bridge::audio::normalize(quiet);
    REQUIRE(boosted.size() == quiet.size());
    const auto peak_before = call_bridge::audio::peak_amplitude(quiet);
    const auto peak_after = call_bridge::audio::peak_amplitude(boosted);
    REQUIRE(std::abs(peak_after - 2 * peak_before) <= 1);
}

TEST_CASE("normalize pulls a clipped frame down to about 85 percent") {
    std::vector<int16_t> clipped = sine(300.0, 24000, 480, 32767.0);
    clipped[10] = 32767;
    const auto output = call_bridge::audio::normalize(clipped);
    const auto peak = call_bridge::audio::peak_amplitude(output);
    REQUIRE(peak >= 27800);
    REQUIRE(peak <= 27900);
}

TEST_CASE("rms_energy of a constant frame is its magnitude") {
    REQUIRE(call_bridge::audio::rms_energy({}) == 0.0);
    REQUIRE(call_bridge::audio::rms_energy({-300, 300, -300, 300}) == Catch::Approx(300.0));
    REQUIRE(call_bridge::audio::peak_amplitude({-32768, 5}) == 32767);
}

TEST_CASE("pcm byte packing is little endian and drops a trailing odd byte") {
    const std::vector<int16_t> samples = {1, -2, 0x1234};
    const auto bytes = call_bridge::audio::pcm_to_bytes(samples);
    REQUIRE(bytes.size() == 6);
    REQUIRE(static_cast<uint8_t>(bytes[0]) == 0x01);
    REQUIRE(static_cast<uint8_t>(bytes[1]) == 0x00);
    REQUIRE(static_cast<uint8_t>(bytes[4]) == 0x34);
    REQUIRE(static_cast<uint8_t>(bytes[5]) == 0x12);

    REQUIRE(call_bridge::audio::pcm_from_bytes(bytes) == samples);
    REQUIRE(call_bridge::audio::pcm_from_bytes(bytes + "\x7F") == samples);
    REQUIRE(call_bridge::audio::pcm_from_bytes("\x01").empty());
}
