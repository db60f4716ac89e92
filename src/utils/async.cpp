#include "call_bridge/utils/async.hpp"

#include <exception>
#include <thread>

#include "call_bridge/logging.hpp"

namespace call_bridge::utils {

void run_async(std::function<void()> task) {
    std::thread worker([task = std::move(task)]() mutable {
        try {
            task();
        } catch (const std::exception& ex) {
            logging::error(
                "Background task failed",
                {kv("error", ex.what())});
        }
    });
    worker.detach();
}

}
