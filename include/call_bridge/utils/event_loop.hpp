#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace call_bridge::utils {

class Scheduler {
public:
    using TimerId = uint64_t;
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;

    virtual TimerId schedule(std::chrono::milliseconds delay, Task task) = 0;
    // Unknown or already fired ids are ignored.
    virtual void cancel(TimerId id) = 0;
};

// Single consumer thread running posted tasks in order, plus delayed timers.
class EventLoop : public Scheduler {
public:
    explicit EventLoop(std::string name);
    ~EventLoop() override;

    void start();
    void stop();

    bool post(Task task);
    TimerId schedule(std::chrono::milliseconds delay, Task task) override;
    void cancel(TimerId id) override;

    bool in_loop_thread() const;
    size_t pending_timers() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Timer {
        Clock::time_point due;
        Task task;
    };

    void worker_loop();
    void run_task(const Task& task);

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    std::map<TimerId, Timer> timers_;
    TimerId next_timer_id_ = 1;
    bool running_ = false;
    bool stopping_ = false;
    std::thread worker_;
    std::thread::id worker_id_;
};

}
