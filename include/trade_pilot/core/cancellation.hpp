// include/trade_pilot/core/cancellation.hpp
#pragma once

#include <atomic>
#include <memory>

namespace trade_pilot {

/**
 * @brief Shared flag used to abandon a long-running external call
 *
 * Copies share the same flag. Cancellation is best effort: the callee polls
 * is_cancelled() at its own pace.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() {
        flag_->store(true, std::memory_order_release);
    }

    bool is_cancelled() const {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace trade_pilot
