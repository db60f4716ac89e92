#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "call_bridge/vad/energy_detector.hpp"

#include <vector>

namespace {

std::vector<int16_t> frame_with_energy(int16_t level) {
    std::vector<int16_t> samples(480);
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = static_cast<int16_t>(i % 2 == 0 ? level : -level);
    }
    return samples;
}

}

TEST_CASE("silence is never suspected speech") {
    call_bridge::vad::SpeechActivityDetector detector;
    for (int i = 0; i < 10; ++i) {
        const auto result = detector.process_frame(frame_with_energy(50), true, false);
        REQUIRE_FALSE(result.suspected_speech);
        REQUIRE(result.threshold == Catch::Approx(2000.0));
    }
}

TEST_CASE("idle speech needs two consecutive loud frames") {
    call_bridge::vad::SpeechActivityDetector detector;
    const auto first = detector.process_frame(frame_with_energy(3000), false, false);
    REQUIRE_FALSE(first.suspected_speech);
    const auto second = detector.process_frame(frame_with_energy(3000), false, false);
    REQUIRE(second.suspected_speech);
    REQUIRE(second.energy == Catch::Approx(3000.0));
}

TEST_CASE("a quiet frame resets the consecutive count") {
    call_bridge::vad::SpeechActivityDetector detector;
    REQUIRE_FALSE(detector.process_frame(frame_with_energy(3000), false, false).suspected_speech);
    REQUIRE_FALSE(detector.process_frame(frame_with_energy(10), false, false).suspected_speech);
    REQUIRE_FALSE(detector.process_frame(frame_with_energy(3000), false, false).suspected_speech);
}

TEST_CASE("baseline is the idle median and needs ten samples") {
    call_bridge::vad::SpeechActivityDetector detector;
    for (int i = 0; i < 9; ++i) {
        detector.process_frame(frame_with_energy(800), true, false);
    }
    REQUIRE_FALSE(detector.echo_baseline().has_value());
    detector.process_frame(frame_with_energy(800), true, false);
    REQUIRE(detector.echo_baseline().has_value());
    REQUIRE(*detector.echo_baseline() == Catch::Approx(800.0));

    SECTION("frames outside idle do not move the baseline") {
        for (int i = 0; i < 30; ++i) {
            detector.process_frame(frame_with_energy(5000), false, true);
        }
        REQUIRE(*detector.echo_baseline() == Catch::Approx(800.0));
    }

    SECTION("reset forgets the baseline") {
        detector.reset();
        REQUIRE_FALSE(detector.echo_baseline().has_value());
    }
}

TEST_CASE("echo period raises the threshold above the baseline") {
    call_bridge::vad::SpeechActivityDetector detector;
    for (int i = 0; i < 20; ++i) {
        detector.process_frame(frame_with_energy(1500), true, false);
    }
    REQUIRE(*detector.echo_baseline() == Catch::Approx(1500.0));

    // 2 x 1500 = 3000 beats the 2500 floor. A 2800 frame passes the idle
    // threshold but not the echo one.
    for (int i = 0; i < 5; ++i) {
        const auto result = detector.process_frame(frame_with_energy(2800), false, true);
        REQUIRE(result.threshold == Catch::Approx(3000.0));
        REQUIRE_FALSE(result.suspected_speech);
    }
}

TEST_CASE("echo period without a baseline uses the floor") {
    call_bridge::vad::SpeechActivityDetector detector;
    const auto result = detector.process_frame(frame_with_energy(100), false, true);
    REQUIRE(result.threshold == Catch::Approx(2500.0));
}

TEST_CASE("unmistakable speech during echo needs a single frame") {
    call_bridge::vad::SpeechActivityDetector loud;
    const auto result = loud.process_frame(frame_with_energy(6000), false, true);
    REQUIRE(result.high_energy);
    REQUIRE(result.suspected_speech);

    SECTION("a spike over quiet history is not enough") {
        call_bridge::vad::SpeechActivityDetector detector;
        for (int i = 0; i < 4; ++i) {
            detector.process_frame(frame_with_energy(100), true, false);
        }
        // avg = (4 x 100 + 6000) / 5 = 1280, under both average gates.
        const auto spike = detector.process_frame(frame_with_energy(6000), false, true);
        REQUIRE_FALSE(spike.high_energy);
        REQUIRE_FALSE(spike.suspected_speech);
    }
}

TEST_CASE("interruption-level energy during echo needs a single frame") {
    call_bridge::vad::SpeechActivityDetector detector;
    // 3600 > 3500 interruption threshold, above the 2500 floor, but below the
    // 4000 unmistakable threshold.
    const auto result = detector.process_frame(frame_with_energy(3600), false, true);
    REQUIRE_FALSE(result.high_energy);
    REQUIRE(result.suspected_speech);
}

TEST_CASE("moderate energy during echo needs two frames") {
    call_bridge::vad::SpeechActivityDetector detector;
    REQUIRE_FALSE(detector.process_frame(frame_with_energy(3000), false, true).suspected_speech);
    REQUIRE(detector.process_frame(frame_with_energy(3000), false, true).suspected_speech);
}

TEST_CASE("empty frames are ignored") {
    call_bridge::vad::SpeechActivityDetector detector;
    const auto result = detector.process_frame({}, true, false);
    REQUIRE_FALSE(result.suspected_speech);
    REQUIRE(result.energy == 0.0);
}
