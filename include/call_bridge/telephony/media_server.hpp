#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace call_bridge::telephony {

// WebSocket endpoint for telephony media streams. Callbacks run on the
// server thread and must not block.
class MediaStreamServer {
public:
    using ConnectionId = uint64_t;

    struct Handlers {
        // resource is the request target, query string included.
        std::function<void(ConnectionId, const std::string& resource)> on_open;
        std::function<void(ConnectionId, const std::string& message)> on_message;
        std::function<void(ConnectionId)> on_close;
    };

    MediaStreamServer(int port, std::string path, Handlers handlers);
    ~MediaStreamServer();

    MediaStreamServer(const MediaStreamServer&) = delete;
    MediaStreamServer& operator=(const MediaStreamServer&) = delete;

    void start();
    void stop();

    // Dropped silently when the connection is gone.
    bool send(ConnectionId id, const std::string& message);
    void close(ConnectionId id, const std::string& reason);
    size_t connection_count() const;

private:
    struct ServerState;

    int port_;
    std::string path_;
    Handlers handlers_;
    std::unique_ptr<ServerState> state_;
    std::thread server_thread_;
};

}
