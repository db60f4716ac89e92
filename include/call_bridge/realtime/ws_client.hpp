#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/ssl/context.hpp>
#include <nlohmann/json.hpp>

namespace call_bridge::realtime {

// Client context for wss:// sessions: system trust store, peer certificate
// required and checked against `host`.
std::shared_ptr<boost::asio::ssl::context> make_tls_context(const std::string& host);

// Outbound WebSocket (ws:// or wss://) to the speech session. Connects once;
// there is no reconnection. Handlers run on the client's own thread.
class RealtimeWsClient {
public:
    using MessageHandler = std::function<void(const std::string&)>;
    using EventHandler = std::function<void()>;
    using FailHandler = std::function<void(const std::string&)>;

    struct Handlers {
        EventHandler on_open;
        MessageHandler on_message;
        EventHandler on_close;
        FailHandler on_fail;
    };

    RealtimeWsClient(std::string url, std::vector<std::pair<std::string, std::string>> headers);
    ~RealtimeWsClient();

    RealtimeWsClient(const RealtimeWsClient&) = delete;
    RealtimeWsClient& operator=(const RealtimeWsClient&) = delete;

    void connect(Handlers handlers);
    // Dropped silently when the connection is not open.
    bool send_json(const nlohmann::json& payload);
    bool is_open() const;
    void stop();

private:
    void run_loop();

    std::string url_;
    std::vector<std::pair<std::string, std::string>> headers_;
    Handlers handlers_;
    std::atomic<bool> running_{false};
    std::atomic<bool> open_{false};
    std::thread worker_;
    mutable std::mutex ws_mutex_;
    struct WsState;
    std::unique_ptr<WsState> ws_state_;
};

}
