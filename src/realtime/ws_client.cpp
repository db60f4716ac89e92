#include "call_bridge/realtime/ws_client.hpp"

#include <exception>
#include <utility>

#include <boost/asio/ssl.hpp>
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "call_bridge/logging.hpp"
#include "call_bridge/utils/http.hpp"
#include "call_bridge/utils/text.hpp"

namespace call_bridge::realtime {

namespace {

using TlsClient = websocketpp::client<websocketpp::config::asio_tls_client>;
using PlainClient = websocketpp::client<websocketpp::config::asio_client>;
using SslContext = boost::asio::ssl::context;

bool is_secure(const std::string& url) {
    return utils::starts_with(url, "wss://");
}

}

struct RealtimeWsClient::WsState {
    std::shared_ptr<TlsClient> tls_client;
    std::shared_ptr<PlainClient> plain_client;
    websocketpp::connection_hdl connection;
};

namespace {

template <typename Client>
void configure(Client& client,
               const RealtimeWsClient::Handlers& handlers,
               std::atomic<bool>& open) {
    client.clear_access_channels(websocketpp::log::alevel::all);
    client.clear_error_channels(websocketpp::log::elevel::all);
    client.init_asio();

    client.set_open_handler([&handlers, &open](websocketpp::connection_hdl) {
        open = true;
        if (handlers.on_open) {
            handlers.on_open();
        }
    });
    client.set_message_handler([&handlers](websocketpp::connection_hdl,
                                           typename Client::message_ptr msg) {
        if (handlers.on_message) {
            handlers.on_message(msg->get_payload());
        }
    });
    client.set_close_handler([&handlers, &open](websocketpp::connection_hdl) {
        open = false;
        if (handlers.on_close) {
            handlers.on_close();
        }
    });
    client.set_fail_handler([&client, &handlers, &open](websocketpp::connection_hdl hdl) {
        open = false;
        std::string reason = "connection failed";
        websocketpp::lib::error_code ec;
        auto conn = client.get_con_from_hdl(hdl, ec);
        if (!ec && conn) {
            reason = conn->get_ec().message();
        }
        if (handlers.on_fail) {
            handlers.on_fail(reason);
        }
    });
}

// Closes an open connection; a handshake still in progress is abandoned by
// stopping the client's io_service, which also makes a later run() return.
template <typename Client>
void shutdown_client(Client& client,
                     const websocketpp::connection_hdl& handle,
                     const std::atomic<bool>& open) {
    if (!open) {
        client.stop();
        return;
    }
    websocketpp::lib::error_code ec;
    client.close(handle, websocketpp::close::status::going_away, "shutdown", ec);
    if (ec) {
        client.stop();
    }
}

template <typename Client>
bool open_connection(Client& client,
                     const std::string& url,
                     const std::vector<std::pair<std::string, std::string>>& headers,
                     websocketpp::connection_hdl& handle,
                     std::string& error) {
    websocketpp::lib::error_code ec;
    auto conn = client.get_connection(url, ec);
    if (ec) {
        error = ec.message();
        return false;
    }
    for (const auto& [name, value] : headers) {
        conn->append_header(name, value);
    }
    handle = conn->get_handle();
    client.connect(conn);
    return true;
}

}

std::shared_ptr<boost::asio::ssl::context> make_tls_context(const std::string& host) {
    auto ctx = std::make_shared<SslContext>(SslContext::tls_client);
    boost::system::error_code ec;
    ctx->set_options(SslContext::default_workarounds | SslContext::no_sslv2 |
                         SslContext::no_sslv3 | SslContext::single_dh_use,
                     ec);
    ctx->set_default_verify_paths(ec);
    if (ec) {
        logging::warn("TLS default verify paths unavailable", {kv("error", ec.message())});
    }
    ctx->set_verify_mode(boost::asio::ssl::verify_peer, ec);
    ctx->set_verify_callback(boost::asio::ssl::host_name_verification(host), ec);
    return ctx;
}

RealtimeWsClient::RealtimeWsClient(std::string url,
                                   std::vector<std::pair<std::string, std::string>> headers)
    : url_(std::move(url)),
      headers_(std::move(headers)) {}

RealtimeWsClient::~RealtimeWsClient() {
    stop();
}

void RealtimeWsClient::connect(Handlers handlers) {
    if (running_) {
        return;
    }
    handlers_ = std::move(handlers);
    running_ = true;
    worker_ = std::thread([this]() { run_loop(); });
}

bool RealtimeWsClient::send_json(const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(ws_mutex_);
    if (!open_ || !ws_state_ || ws_state_->connection.expired()) {
        return false;
    }
    websocketpp::lib::error_code ec;
    if (ws_state_->tls_client) {
        ws_state_->tls_client->send(ws_state_->connection, payload.dump(),
                                    websocketpp::frame::opcode::text, ec);
    } else if (ws_state_->plain_client) {
        ws_state_->plain_client->send(ws_state_->connection, payload.dump(),
                                      websocketpp::frame::opcode::text, ec);
    }
    if (ec) {
        logging::debug("Speech session send dropped", {kv("error", ec.message())});
        return false;
    }
    return true;
}

bool RealtimeWsClient::is_open() const {
    return open_;
}

void RealtimeWsClient::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (ws_state_) {
            if (ws_state_->tls_client) {
                shutdown_client(*ws_state_->tls_client, ws_state_->connection, open_);
            } else if (ws_state_->plain_client) {
                shutdown_client(*ws_state_->plain_client, ws_state_->connection, open_);
            }
        }
    }
    if (!worker_.joinable()) {
        return;
    }
    if (std::this_thread::get_id() == worker_.get_id()) {
        worker_.detach();
        return;
    }
    worker_.join();
}

void RealtimeWsClient::run_loop() {
    std::string error;
    bool connected = false;
    bool cancelled = false;
    if (is_secure(url_)) {
        std::string scheme;
        std::string host;
        int port = 0;
        std::string base_path;
        try {
            utils::parse_url(url_, scheme, host, port, base_path);
        } catch (const std::exception& ex) {
            logging::warn("Speech session URL port unreadable", {kv("url", url_), kv("error", ex.what())});
        }

        auto client = std::make_shared<TlsClient>();
        configure(*client, handlers_, open_);
        client->set_tls_init_handler([host](websocketpp::connection_hdl) {
            return make_tls_context(host);
        });
        {
            std::lock_guard<std::mutex> lock(ws_mutex_);
            cancelled = !running_;
            if (!cancelled) {
                ws_state_ = std::make_unique<WsState>();
                ws_state_->tls_client = client;
                connected = open_connection(*client, url_, headers_, ws_state_->connection, error);
            }
        }
        if (connected) {
            client->run();
        }
    } else {
        auto client = std::make_shared<PlainClient>();
        configure(*client, handlers_, open_);
        {
            std::lock_guard<std::mutex> lock(ws_mutex_);
            cancelled = !running_;
            if (!cancelled) {
                ws_state_ = std::make_unique<WsState>();
                ws_state_->plain_client = client;
                connected = open_connection(*client, url_, headers_, ws_state_->connection, error);
            }
        }
        if (connected) {
            client->run();
        }
    }

    if (cancelled) {
        logging::debug("Speech session stopped before connecting", {kv("url", url_)});
    } else if (!connected) {
        logging::error(
            "Speech session connection could not be created",
            {kv("url", url_),
             kv("error", error)});
        if (handlers_.on_fail) {
            handlers_.on_fail(error);
        }
    }
    open_ = false;
    std::lock_guard<std::mutex> lock(ws_mutex_);
    ws_state_.reset();
}

}
