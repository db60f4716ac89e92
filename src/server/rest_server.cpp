#include "call_bridge/server/rest_server.hpp"

#include <utility>

#include "call_bridge/logging.hpp"
#include "call_bridge/metrics.hpp"

namespace call_bridge {

RestServer::RestServer(const Config& config, StatusProvider status)
    : config_(config),
      status_(std::move(status)) {}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"status", "ok"}};
        if (status_) {
            try {
                payload.update(status_());
            } catch (const std::exception& ex) {
                logging::error(
                    "Failed to collect health status",
                    {kv("error", ex.what())});
                res.status = 500;
                payload["status"] = "error";
            }
        }
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_thread_ = std::thread([this]() {
        logging::info(
            "REST server listening",
            {kv("port", config_.rest_api_port)});
        if (!server_->listen("0.0.0.0", config_.rest_api_port)) {
            logging::error(
                "REST server failed to listen",
                {kv("port", config_.rest_api_port)});
        }
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

}
