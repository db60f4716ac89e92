#include <catch2/catch_test_macros.hpp>

#include "call_bridge/metrics.hpp"

#include <string>

namespace {

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

}

TEST_CASE("counters increment and reset") {
    auto& metrics = call_bridge::Metrics::instance();
    metrics.reset();
    metrics.increment(call_bridge::Counter::RepliesRequested);
    metrics.increment(call_bridge::Counter::RepliesRequested, 2);
    REQUIRE(metrics.value(call_bridge::Counter::RepliesRequested) == 3);
    REQUIRE(metrics.value(call_bridge::Counter::Interruptions) == 0);

    metrics.reset();
    REQUIRE(metrics.value(call_bridge::Counter::RepliesRequested) == 0);
}

TEST_CASE("prometheus output lists counters, gauge and histogram") {
    auto& metrics = call_bridge::Metrics::instance();
    metrics.reset();
    metrics.increment(call_bridge::Counter::EchoSuppressed, 4);
    metrics.set_active_sessions(2);
    metrics.observe_response_time("first_audio", 0.3);

    const auto text = metrics.render_prometheus();
    REQUIRE(contains(text, "# TYPE bridge_echo_suppressed_total counter\n"));
    REQUIRE(contains(text, "bridge_echo_suppressed_total 4\n"));
    REQUIRE(contains(text, "bridge_sessions_started_total 0\n"));
    REQUIRE(contains(text, "bridge_active_sessions 2\n"));
    REQUIRE(contains(text, "# TYPE bridge_response_latency_seconds histogram\n"));
    REQUIRE(contains(text,
                     "bridge_response_latency_seconds_bucket{stage=\"first_audio\",le=\"0.250000\"} 0\n"));
    REQUIRE(contains(text,
                     "bridge_response_latency_seconds_bucket{stage=\"first_audio\",le=\"0.500000\"} 1\n"));
    REQUIRE(contains(text,
                     "bridge_response_latency_seconds_bucket{stage=\"first_audio\",le=\"+Inf\"} 1\n"));
    REQUIRE(contains(text, "bridge_response_latency_seconds_count{stage=\"first_audio\"} 1\n"));
    REQUIRE(contains(text, "bridge_response_latency_seconds_sum{stage=\"first_audio\"} 0.300000\n"));
    metrics.reset();
}
