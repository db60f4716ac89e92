#include "call_bridge/telephony/media_server.hpp"

#include <optional>
#include <utility>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "call_bridge/logging.hpp"
#include "call_bridge/utils/http.hpp"

namespace call_bridge::telephony {

namespace {

using WsServer = websocketpp::server<websocketpp::config::asio>;

}

struct MediaStreamServer::ServerState {
    WsServer server;
    mutable std::mutex mutex;
    std::map<ConnectionId, websocketpp::connection_hdl> connections;
    std::map<websocketpp::connection_hdl, ConnectionId,
             std::owner_less<websocketpp::connection_hdl>>
        ids;
    ConnectionId next_id = 1;

    std::optional<ConnectionId> id_for(websocketpp::connection_hdl hdl) const {
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = ids.find(hdl);
        if (it == ids.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

MediaStreamServer::MediaStreamServer(int port, std::string path, Handlers handlers)
    : port_(port),
      path_(std::move(path)),
      handlers_(std::move(handlers)),
      state_(std::make_unique<ServerState>()) {}

MediaStreamServer::~MediaStreamServer() {
    stop();
}

void MediaStreamServer::start() {
    auto& server = state_->server;
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.clear_error_channels(websocketpp::log::elevel::all);
    server.init_asio();
    server.set_reuse_addr(true);

    server.set_validate_handler([this](websocketpp::connection_hdl hdl) {
        auto conn = state_->server.get_con_from_hdl(hdl);
        const auto resource = conn->get_resource();
        if (utils::strip_query(resource) != path_) {
            logging::warn("Rejected media stream connection", {kv("resource", resource)});
            return false;
        }
        return true;
    });

    server.set_open_handler([this](websocketpp::connection_hdl hdl) {
        ConnectionId id = 0;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            id = state_->next_id++;
            state_->connections.emplace(id, hdl);
            state_->ids.emplace(hdl, id);
        }
        const auto resource = state_->server.get_con_from_hdl(hdl)->get_resource();
        logging::info(
            "Media stream connected",
            {kv("connection", id),
             kv("resource", resource)});
        if (handlers_.on_open) {
            handlers_.on_open(id, resource);
        }
    });

    server.set_message_handler([this](websocketpp::connection_hdl hdl, WsServer::message_ptr msg) {
        const auto id = state_->id_for(hdl);
        if (id && handlers_.on_message) {
            handlers_.on_message(*id, msg->get_payload());
        }
    });

    auto on_gone = [this](websocketpp::connection_hdl hdl) {
        std::optional<ConnectionId> id;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            const auto it = state_->ids.find(hdl);
            if (it != state_->ids.end()) {
                id = it->second;
                state_->connections.erase(it->second);
                state_->ids.erase(it);
            }
        }
        if (!id) {
            return;
        }
        logging::info("Media stream disconnected", {kv("connection", *id)});
        if (handlers_.on_close) {
            handlers_.on_close(*id);
        }
    };
    server.set_close_handler(on_gone);
    server.set_fail_handler(on_gone);

    server.listen(static_cast<uint16_t>(port_));
    server.start_accept();
    server_thread_ = std::thread([this]() {
        logging::info(
            "Media stream server listening",
            {kv("port", port_),
             kv("path", path_)});
        state_->server.run();
    });
}

void MediaStreamServer::stop() {
    if (!server_thread_.joinable()) {
        return;
    }
    websocketpp::lib::error_code ec;
    state_->server.stop_listening(ec);
    std::map<ConnectionId, websocketpp::connection_hdl> open;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        open = state_->connections;
    }
    for (const auto& [id, hdl] : open) {
        state_->server.close(hdl, websocketpp::close::status::going_away, "shutdown", ec);
    }
    state_->server.stop();
    server_thread_.join();
}

bool MediaStreamServer::send(ConnectionId id, const std::string& message) {
    websocketpp::connection_hdl hdl;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        const auto it = state_->connections.find(id);
        if (it == state_->connections.end()) {
            return false;
        }
        hdl = it->second;
    }
    websocketpp::lib::error_code ec;
    state_->server.send(hdl, message, websocketpp::frame::opcode::text, ec);
    return !ec;
}

void MediaStreamServer::close(ConnectionId id, const std::string& reason) {
    websocketpp::connection_hdl hdl;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        const auto it = state_->connections.find(id);
        if (it == state_->connections.end()) {
            return;
        }
        hdl = it->second;
    }
    websocketpp::lib::error_code ec;
    state_->server.close(hdl, websocketpp::close::status::normal, reason, ec);
    if (ec) {
        logging::debug(
            "Media stream close failed",
            {kv("connection", id),
             kv("error", ec.message())});
    }
}

size_t MediaStreamServer::connection_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->connections.size();
}

}
