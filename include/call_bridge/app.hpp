#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "call_bridge/backend/gateway.hpp"
#include "call_bridge/config.hpp"
#include "call_bridge/server/rest_server.hpp"
#include "call_bridge/session/session.hpp"
#include "call_bridge/telephony/media_server.hpp"

namespace call_bridge {

class BridgeApp {
public:
    explicit BridgeApp(Config config);
    ~BridgeApp();

    void init();
    // Blocks until stop_requested becomes true, reaping finished sessions.
    void run(const std::atomic<bool>& stop_requested);
    void stop();
    const Config& config() const;

private:
    void handle_open(uint64_t connection_id, const std::string& resource);
    void handle_message(uint64_t connection_id, const std::string& message);
    void handle_close(uint64_t connection_id);
    std::shared_ptr<session::BridgeSession> find_session(uint64_t connection_id);
    void reap_finished_sessions();
    nlohmann::json status() const;

    Config config_;
    backend::HttpBackendGateway gateway_;
    std::unique_ptr<telephony::MediaStreamServer> media_server_;
    std::unique_ptr<RestServer> rest_server_;
    std::unordered_map<uint64_t, std::shared_ptr<session::BridgeSession>> sessions_;
    mutable std::mutex sessions_mutex_;
    std::condition_variable sessions_cv_;
    std::atomic<bool> quitting_{false};
};

}
