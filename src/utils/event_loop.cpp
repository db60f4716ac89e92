#include "call_bridge/utils/event_loop.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "call_bridge/logging.hpp"

namespace call_bridge::utils {

EventLoop::EventLoop(std::string name)
    : name_(std::move(name)) {}

EventLoop::~EventLoop() {
    stop();
}

void EventLoop::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    stopping_ = false;
    worker_ = std::thread([this]() { worker_loop(); });
    worker_id_ = worker_.get_id();
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        stopping_ = true;
        timers_.clear();
    }
    cv_.notify_all();
    if (!worker_.joinable()) {
        return;
    }
    if (in_loop_thread()) {
        logging::warn("Event loop stopped from its own thread", {kv("loop", name_)});
        worker_.detach();
        return;
    }
    worker_.join();
}

bool EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

Scheduler::TimerId EventLoop::schedule(std::chrono::milliseconds delay, Task task) {
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return 0;
        }
        id = next_timer_id_++;
        timers_.emplace(id, Timer{Clock::now() + delay, std::move(task)});
    }
    cv_.notify_one();
    return id;
}

void EventLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    timers_.erase(id);
}

bool EventLoop::in_loop_thread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::this_thread::get_id() == worker_id_;
}

size_t EventLoop::pending_timers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void EventLoop::run_task(const Task& task) {
    try {
        task();
    } catch (const std::exception& ex) {
        logging::error(
            "Event loop task failed",
            {kv("loop", name_),
             kv("error", ex.what())});
    }
}

void EventLoop::worker_loop() {
    logging::set_thread_context(name_);
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            while (true) {
                if (stopping_) {
                    return;
                }
                if (!tasks_.empty()) {
                    task = std::move(tasks_.front());
                    tasks_.pop_front();
                    break;
                }
                if (timers_.empty()) {
                    cv_.wait(lock);
                    continue;
                }
                auto next = std::min_element(timers_.begin(), timers_.end(),
                                             [](const auto& lhs, const auto& rhs) {
                                                 return lhs.second.due < rhs.second.due;
                                             });
                if (next->second.due <= Clock::now()) {
                    task = std::move(next->second.task);
                    timers_.erase(next);
                    break;
                }
                const auto due = next->second.due;
                cv_.wait_until(lock, due);
            }
        }
        if (task) {
            run_task(task);
        }
    }
}

}
