#include "call_bridge/backend/gateway.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "call_bridge/logging.hpp"
#include "call_bridge/utils/async.hpp"
#include "call_bridge/utils/http.hpp"

namespace call_bridge::backend {

namespace {

std::string optional_string(const nlohmann::json& payload, const char* key) {
    const auto it = payload.find(key);
    if (it == payload.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

BackendRequestOptions make_options(const Config& config) {
    BackendRequestOptions options;
    options.request_timeout = std::chrono::seconds(static_cast<int>(config.backend_request_timeout));
    options.connect_timeout = std::chrono::seconds(static_cast<int>(config.backend_connect_timeout));
    options.sock_read_timeout =
        std::chrono::seconds(static_cast<int>(config.backend_sock_read_timeout));
    return options;
}

}

CallRecord CallRecord::from_json(const nlohmann::json& payload) {
    const auto& body = payload.contains("call") && payload["call"].is_object() ? payload["call"] : payload;
    CallRecord record;
    if (body.contains("id") && body["id"].is_number_integer()) {
        record.id = std::to_string(body["id"].get<int64_t>());
    } else {
        record.id = optional_string(body, "id");
    }
    if (record.id.empty()) {
        throw BackendError("Call record has no id");
    }
    record.call_sid = optional_string(body, "call_sid");
    record.phone_number = optional_string(body, "phone_number");
    record.purpose = optional_string(body, "purpose");
    record.additional_instructions = optional_string(body, "additional_instructions");
    record.voice_preference = optional_string(body, "voice_preference");
    return record;
}

std::string format_timestamp(std::chrono::system_clock::time_point timestamp) {
    const auto seconds = std::chrono::system_clock::to_time_t(timestamp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            timestamp.time_since_epoch()) %
                        1000;
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << millis.count() << 'Z';
    return out.str();
}

HttpBackendGateway::HttpBackendGateway(const Config& config)
    : client_(std::make_shared<BackendClient>(config.backend_url, config.authorization_token,
                                              make_options(config))) {}

std::optional<CallRecord> HttpBackendGateway::lookup_by_sid(const std::string& call_sid) {
    try {
        const auto payload = client_->get_json("/calls/by-sid/" + utils::url_encode(call_sid));
        return CallRecord::from_json(payload);
    } catch (const BackendNotFoundError&) {
        return std::nullopt;
    }
}

void HttpBackendGateway::append(const TranscriptEntry& entry) {
    if (entry.message.empty()) {
        return;
    }
    nlohmann::json body{
        {"speaker", entry.speaker},
        {"message", entry.message},
        {"timestamp", format_timestamp(entry.timestamp)},
    };
    const auto path = "/calls/" + utils::url_encode(entry.call_id) + "/transcripts";
    auto client = client_;
    utils::run_async([client, path, body, entry]() {
        try {
            client->post_json(path, body);
            logging::debug(
                "Transcript saved",
                {kv("call_id", entry.call_id),
                 kv("speaker", entry.speaker)});
        } catch (const std::exception& ex) {
            logging::error(
                "Failed to save transcript",
                {kv("call_id", entry.call_id),
                 kv("speaker", entry.speaker),
                 kv("error", ex.what())});
        }
    });
}

void HttpBackendGateway::notify(const std::string& call_id,
                                const std::string& event,
                                const nlohmann::json& payload) {
    nlohmann::json body = payload.is_object() ? payload : nlohmann::json{{"data", payload}};
    body["event"] = event;
    const auto path = "/calls/" + utils::url_encode(call_id) + "/events";
    auto client = client_;
    utils::run_async([client, path, body, call_id, event]() {
        try {
            client->post_json(path, body);
        } catch (const std::exception& ex) {
            logging::warn(
                "Failed to deliver call event",
                {kv("call_id", call_id),
                 kv("event", event),
                 kv("error", ex.what())});
        }
    });
}

}
