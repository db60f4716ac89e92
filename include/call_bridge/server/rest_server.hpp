#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "call_bridge/config.hpp"

namespace call_bridge {

class RestServer {
public:
    using StatusProvider = std::function<nlohmann::json()>;

    RestServer(const Config& config, StatusProvider status);

    void start();
    void stop();

private:
    const Config& config_;
    StatusProvider status_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}
