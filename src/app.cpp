#include "call_bridge/app.hpp"

#include <chrono>
#include <thread>
#include <vector>

#include "call_bridge/logging.hpp"
#include "call_bridge/metrics.hpp"
#include "call_bridge/utils/http.hpp"

namespace call_bridge {

BridgeApp::BridgeApp(Config config)
    : config_(std::move(config)),
      gateway_(config_) {}

BridgeApp::~BridgeApp() {
    stop();
}

const Config& BridgeApp::config() const {
    return config_;
}

void BridgeApp::init() {
    telephony::MediaStreamServer::Handlers handlers;
    handlers.on_open = [this](uint64_t id, const std::string& resource) { handle_open(id, resource); };
    handlers.on_message = [this](uint64_t id, const std::string& message) {
        handle_message(id, message);
    };
    handlers.on_close = [this](uint64_t id) { handle_close(id); };

    media_server_ = std::make_unique<telephony::MediaStreamServer>(
        config_.media_stream_port, config_.media_stream_path, std::move(handlers));
    media_server_->start();

    rest_server_ = std::make_unique<RestServer>(config_, [this]() { return status(); });
    rest_server_->start();
}

void BridgeApp::run(const std::atomic<bool>& stop_requested) {
    while (!stop_requested && !quitting_) {
        {
            std::unique_lock<std::mutex> lock(sessions_mutex_);
            sessions_cv_.wait_for(lock, std::chrono::milliseconds(200));
        }
        reap_finished_sessions();
    }
}

void BridgeApp::stop() {
    if (quitting_.exchange(true)) {
        return;
    }
    logging::info("Shutting down");
    if (media_server_) {
        media_server_->stop();
    }
    if (rest_server_) {
        rest_server_->stop();
    }
    std::unordered_map<uint64_t, std::shared_ptr<session::BridgeSession>> remaining;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        remaining.swap(sessions_);
    }
    for (auto& [id, session] : remaining) {
        session->post_telephony_closed();
    }
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    for (auto& [id, session] : remaining) {
        while (!session->finished() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (!session->finished()) {
            logging::warn("Session did not finish teardown in time", {kv("connection", id)});
        }
    }
    remaining.clear();
    Metrics::instance().set_active_sessions(0);
}

void BridgeApp::handle_open(uint64_t connection_id, const std::string& resource) {
    session::SessionDependencies deps{config_, gateway_, gateway_, gateway_};
    session::TelephonyLink link;
    link.send = [this, connection_id](const std::string& message) {
        return media_server_ && media_server_->send(connection_id, message);
    };
    link.close = [this, connection_id](const std::string& reason) {
        if (media_server_) {
            media_server_->close(connection_id, reason);
        }
    };
    link.on_finished = [this]() { sessions_cv_.notify_one(); };

    auto session = std::make_shared<session::BridgeSession>(
        connection_id, utils::query_param(resource, "callSid"), deps, std::move(link));
    size_t active = 0;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_[connection_id] = session;
        active = sessions_.size();
    }
    Metrics::instance().set_active_sessions(static_cast<int64_t>(active));
    session->start();
}

void BridgeApp::handle_message(uint64_t connection_id, const std::string& message) {
    if (auto session = find_session(connection_id)) {
        session->post_telephony_message(message);
    }
}

void BridgeApp::handle_close(uint64_t connection_id) {
    if (auto session = find_session(connection_id)) {
        session->post_telephony_closed();
    }
}

std::shared_ptr<session::BridgeSession> BridgeApp::find_session(uint64_t connection_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    const auto it = sessions_.find(connection_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

void BridgeApp::reap_finished_sessions() {
    std::vector<std::shared_ptr<session::BridgeSession>> finished;
    size_t active = 0;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second->finished()) {
                finished.push_back(std::move(it->second));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
        active = sessions_.size();
    }
    if (finished.empty()) {
        return;
    }
    Metrics::instance().set_active_sessions(static_cast<int64_t>(active));
    for (const auto& session : finished) {
        logging::debug("Session released", {kv("connection", session->connection_id())});
    }
}

nlohmann::json BridgeApp::status() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return {
        {"active_sessions", sessions_.size()},
        {"media_stream_path", config_.media_stream_path},
    };
}

}
