#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "call_bridge/backend/client.hpp"
#include "call_bridge/config.hpp"

namespace call_bridge::backend {

struct CallRecord {
    std::string id;
    std::string call_sid;
    std::string phone_number;
    std::string purpose;
    std::string additional_instructions;
    std::string voice_preference;

    // Throws BackendError when "id" is missing.
    static CallRecord from_json(const nlohmann::json& payload);
};

struct TranscriptEntry {
    std::string call_id;
    std::string speaker;
    std::string message;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

class CallDirectory {
public:
    virtual ~CallDirectory() = default;

    // Empty when the backend has no call with this sid. Other failures throw.
    virtual std::optional<CallRecord> lookup_by_sid(const std::string& call_sid) = 0;
};

class TranscriptSink {
public:
    virtual ~TranscriptSink() = default;

    // Never throws; delivery failures are logged.
    virtual void append(const TranscriptEntry& entry) = 0;
};

class EventNotifier {
public:
    virtual ~EventNotifier() = default;

    // Never throws; delivery failures are logged.
    virtual void notify(const std::string& call_id,
                        const std::string& event,
                        const nlohmann::json& payload) = 0;
};

std::string format_timestamp(std::chrono::system_clock::time_point timestamp);

// All three collaborators over the backend HTTP API. Appends and
// notifications are posted from background threads.
class HttpBackendGateway : public CallDirectory,
                           public TranscriptSink,
                           public EventNotifier {
public:
    explicit HttpBackendGateway(const Config& config);

    std::optional<CallRecord> lookup_by_sid(const std::string& call_sid) override;
    void append(const TranscriptEntry& entry) override;
    void notify(const std::string& call_id,
                const std::string& event,
                const nlohmann::json& payload) override;

private:
    std::shared_ptr<BackendClient> client_;
};

}
