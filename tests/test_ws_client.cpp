#include <catch2/catch_test_macros.hpp>

#include "call_bridge/realtime/ws_client.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <openssl/ssl.h>

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>

using namespace std::chrono_literals;

TEST_CASE("send_json is dropped before the session connects") {
    call_bridge::realtime::RealtimeWsClient client("ws://127.0.0.1:9/v1/realtime", {});
    REQUIRE_FALSE(client.is_open());
    REQUIRE_FALSE(client.send_json({{"type", "response.create"}}));
}

TEST_CASE("TLS sessions require a verified peer") {
    const auto ctx = call_bridge::realtime::make_tls_context("api.openai.com");
    REQUIRE(ctx);
    REQUIRE((SSL_CTX_get_verify_mode(ctx->native_handle()) & SSL_VERIFY_PEER) != 0);
}

TEST_CASE("an unusable URL is reported through on_fail") {
    call_bridge::realtime::RealtimeWsClient client("not a url", {});
    std::promise<std::string> failure;
    call_bridge::realtime::RealtimeWsClient::Handlers handlers;
    handlers.on_fail = [&failure](const std::string& reason) { failure.set_value(reason); };
    client.connect(handlers);

    auto future = failure.get_future();
    REQUIRE(future.wait_for(2s) == std::future_status::ready);
    REQUIRE_FALSE(future.get().empty());
    client.stop();
    REQUIRE_FALSE(client.is_open());
}

TEST_CASE("stop returns promptly while the handshake is unanswered") {
    // The listener never accepts, so the upgrade request gets no reply.
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor(
        io, boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    const auto url = "ws://127.0.0.1:" + std::to_string(acceptor.local_endpoint().port()) +
                     "/v1/realtime";

    for (int attempt = 0; attempt < 6; ++attempt) {
        call_bridge::realtime::RealtimeWsClient client(url, {{"OpenAI-Beta", "realtime=v1"}});
        std::atomic<bool> opened{false};
        call_bridge::realtime::RealtimeWsClient::Handlers handlers;
        handlers.on_open = [&opened]() { opened = true; };
        client.connect(handlers);

        if (attempt % 2 == 1) {
            std::this_thread::sleep_for(100ms);
        }

        const auto started = std::chrono::steady_clock::now();
        client.stop();
        REQUIRE(std::chrono::steady_clock::now() - started < 1s);
        REQUIRE_FALSE(client.is_open());
        REQUIRE_FALSE(opened);
    }
}
