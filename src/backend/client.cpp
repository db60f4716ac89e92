#include "call_bridge/backend/client.hpp"

#include <utility>

#include "call_bridge/utils/http.hpp"

namespace call_bridge {

BackendClient::BackendClient(std::string base_url,
                             std::optional<std::string> authorization_token,
                             BackendRequestOptions options)
    : authorization_token_(std::move(authorization_token)),
      options_(options) {
    utils::parse_url(base_url, scheme_, host_, port_, base_path_);
    if (base_path_ == "/") {
        base_path_.clear();
    }

    if (scheme_ == "https") {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        client_https_ = std::make_unique<httplib::SSLClient>(host_, port_);
        client_https_->enable_server_certificate_verification(false);
#else
        throw BackendError("HTTPS backend requires CPPHTTPLIB_OPENSSL_SUPPORT");
#endif
    } else {
        client_http_ = std::make_unique<httplib::Client>(host_, port_);
    }
    apply_timeouts();
}

nlohmann::json BackendClient::get_json(const std::string& path) {
    const auto full_path = build_path(path);
    const auto headers = make_headers(false);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (client_https_) {
        return handle_response(client_https_->Get(full_path.c_str(), headers), full_path);
    }
#endif
    return handle_response(client_http_->Get(full_path.c_str(), headers), full_path);
}

nlohmann::json BackendClient::post_json(const std::string& path, const nlohmann::json& body) {
    const auto full_path = build_path(path);
    const auto headers = make_headers(true);
    const auto payload = body.dump();
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (client_https_) {
        return handle_response(
            client_https_->Post(full_path.c_str(), headers, payload, "application/json"),
            full_path);
    }
#endif
    return handle_response(
        client_http_->Post(full_path.c_str(), headers, payload, "application/json"), full_path);
}

httplib::Headers BackendClient::make_headers(bool with_body) const {
    httplib::Headers headers{{"Accept", "application/json"}};
    if (with_body) {
        headers.emplace("Content-Type", "application/json");
    }
    if (authorization_token_) {
        headers.emplace("Authorization", "Bearer " + *authorization_token_);
    }
    return headers;
}

nlohmann::json BackendClient::handle_response(const httplib::Result& response,
                                              const std::string& path) const {
    if (!response) {
        throw BackendError("Backend request failed: " + path + " (" +
                           httplib::to_string(response.error()) + ")");
    }
    if (response->status == 404) {
        throw BackendNotFoundError("Not found: " + path);
    }
    if (response->status < 200 || response->status >= 300) {
        throw BackendError("Backend returned " + std::to_string(response->status) + " for " +
                           path + ": " + response->body);
    }
    if (response->body.empty()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(response->body);
    } catch (const nlohmann::json::parse_error& ex) {
        throw BackendError("Invalid JSON from backend for " + path + ": " + ex.what());
    }
}

std::string BackendClient::build_path(const std::string& path) const {
    if (base_path_.empty()) {
        return path;
    }
    if (path.empty()) {
        return base_path_;
    }
    if (base_path_.back() == '/' && path.front() == '/') {
        return base_path_ + path.substr(1);
    }
    if (base_path_.back() != '/' && path.front() != '/') {
        return base_path_ + "/" + path;
    }
    return base_path_ + path;
}

void BackendClient::apply_timeouts() {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (client_https_) {
        client_https_->set_connection_timeout(options_.connect_timeout.count(), 0);
        client_https_->set_read_timeout(options_.sock_read_timeout.count(), 0);
        client_https_->set_write_timeout(options_.request_timeout.count(), 0);
        return;
    }
#endif
    if (client_http_) {
        client_http_->set_connection_timeout(options_.connect_timeout.count(), 0);
        client_http_->set_read_timeout(options_.sock_read_timeout.count(), 0);
        client_http_->set_write_timeout(options_.request_timeout.count(), 0);
    }
}

}
