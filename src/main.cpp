#include "call_bridge/app.hpp"
#include "call_bridge/config.hpp"
#include "call_bridge/logging.hpp"

#include <atomic>
#include <csignal>
#include <string>

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) {
    g_stop_requested = true;
}

}

int main() {
    try {
        const auto config = call_bridge::Config::load();
        config.validate();
        call_bridge::logging::init(config);
        call_bridge::info(
            "Starting call-bridge",
            {call_bridge::kv("backend_url", config.backend_url),
             call_bridge::kv("media_port", config.media_stream_port),
             call_bridge::kv("rest_port", config.rest_api_port),
             call_bridge::kv("model", config.realtime_model)});
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        call_bridge::BridgeApp app(config);
        app.init();
        app.run(g_stop_requested);
        app.stop();
    } catch (const std::exception& ex) {
        call_bridge::error(
            "Startup failed",
            {call_bridge::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
