#pragma once

#include <chrono>
#include <httplib.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace call_bridge {

class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& message) : std::runtime_error(message) {}
};

class BackendNotFoundError : public BackendError {
public:
    explicit BackendNotFoundError(const std::string& message) : BackendError(message) {}
};

struct BackendRequestOptions {
    std::chrono::seconds request_timeout{30};
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds sock_read_timeout{30};
};

class BackendClient {
public:
    BackendClient(std::string base_url,
                  std::optional<std::string> authorization_token,
                  BackendRequestOptions options);

    nlohmann::json get_json(const std::string& path);
    nlohmann::json post_json(const std::string& path, const nlohmann::json& body);

    std::string build_path(const std::string& path) const;

private:
    httplib::Headers make_headers(bool with_body) const;
    nlohmann::json handle_response(const httplib::Result& response, const std::string& path) const;
    void apply_timeouts();

    std::string scheme_;
    std::string host_;
    int port_ = 0;
    std::string base_path_;
    std::optional<std::string> authorization_token_;
    BackendRequestOptions options_;
    std::unique_ptr<httplib::Client> client_http_;
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    std::unique_ptr<httplib::SSLClient> client_https_;
#endif
};

}
