#pragma once

#include <functional>

namespace call_bridge::utils {

// Runs `task` on a detached thread. Exceptions are logged, never propagated.
void run_async(std::function<void()> task);

}
