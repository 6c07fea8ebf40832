// include/trade_pilot/advisory/first_wins_slot.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace trade_pilot {

/**
 * @brief Single-assignment slot shared between a producer and a waiter
 *
 * The first offer wins; later offers, and any offer after close(), are
 * dropped. Shared through std::shared_ptr so an abandoned producer can still
 * complete safely after the waiter has left.
 */
template <typename T>
class FirstWinsSlot {
public:
    /**
     * @return true when this offer filled the slot
     */
    bool offer(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || value_) {
                return false;
            }
            value_.emplace(std::move(value));
        }
        cv_.notify_all();
        return true;
    }

    /**
     * @brief Wait for a value until the timeout elapses, then close the slot
     * @return The winning value, or nullopt when the timeout won
     */
    std::optional<T> wait_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() { return value_.has_value(); });
        closed_ = true;
        return value_;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<T> value_;
    bool closed_{false};
};

}  // namespace trade_pilot
