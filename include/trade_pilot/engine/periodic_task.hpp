// include/trade_pilot/engine/periodic_task.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include "trade_pilot/core/error.hpp"

namespace trade_pilot {

/**
 * @brief Fixed-period worker thread
 *
 * The handler first runs one period after start(). stop() wakes the sleeping
 * worker and joins it, so no handler invocation is in flight once it returns.
 * The task registers itself with the StateManager under its name.
 */
class PeriodicTask {
public:
    using Handler = std::function<void()>;

    PeriodicTask(std::string name, std::chrono::milliseconds period, Handler handler);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /**
     * @brief Launch the worker; a no-op when already running
     * @return INVALID_ARGUMENT for a non-positive period or an empty handler
     */
    Result<void> start();

    void stop();

    bool is_running() const {
        return running_.load();
    }

    uint64_t tick_count() const {
        return ticks_.load();
    }

    uint64_t failure_count() const {
        return failures_.load();
    }

    const std::string& name() const {
        return name_;
    }

    std::chrono::milliseconds period() const {
        return period_;
    }

private:
    void run();

    std::string name_;
    std::chrono::milliseconds period_;
    Handler handler_;

    std::thread worker_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_{false};
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> failures_{0};
};

}  // namespace trade_pilot
