// src/engine/periodic_task.cpp
#include "trade_pilot/engine/periodic_task.hpp"
#include <exception>
#include "trade_pilot/core/logger.hpp"
#include "trade_pilot/core/state_manager.hpp"

namespace trade_pilot {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds period, Handler handler)
    : name_(std::move(name)), period_(period), handler_(std::move(handler)) {}

PeriodicTask::~PeriodicTask() {
    stop();
    auto result = StateManager::instance().unregister_component(name_);
    if (result.is_error()) {
        DEBUG("Task " << name_ << " was not registered: " << result.error()->what());
    }
}

Result<void> PeriodicTask::start() {
    if (period_.count() <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Task " + name_ + " needs a positive period", "PeriodicTask");
    }
    if (!handler_) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Task " + name_ + " has no handler",
                                "PeriodicTask");
    }
    if (running_.load()) {
        return Result<void>();
    }
    if (worker_.joinable()) {
        worker_.join();
    }

    auto& state_manager = StateManager::instance();
    ComponentInfo info{ComponentType::SCHEDULER,
                       ComponentState::INITIALIZED,
                       name_,
                       "",
                       std::chrono::system_clock::now(),
                       {}};
    auto registered = state_manager.register_component(info);
    if (registered.is_error()) {
        // Restart after stop(): STOPPED -> INITIALIZED
        auto reset = state_manager.update_state(name_, ComponentState::INITIALIZED);
        if (reset.is_error()) {
            return make_error<void>(reset.error()->code(), reset.error()->what(), "PeriodicTask");
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    running_ = true;
    worker_ = std::thread(&PeriodicTask::run, this);

    auto running = state_manager.update_state(name_, ComponentState::RUNNING);
    if (running.is_error()) {
        WARN("Task " << name_ << " state update failed: " << running.error()->what());
    }
    INFO("Started task " << name_ << " every " << period_.count() << "ms");
    return Result<void>();
}

void PeriodicTask::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_requested_ && !worker_.joinable()) {
            return;
        }
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            // Stopped from inside the handler; the loop exits on its own
            worker_.detach();
        } else {
            worker_.join();
        }
    }

    if (running_.exchange(false)) {
        auto stopped = StateManager::instance().update_state(name_, ComponentState::STOPPED);
        if (stopped.is_error()) {
            WARN("Task " << name_ << " state update failed: " << stopped.error()->what());
        }
        INFO("Stopped task " << name_ << " after " << ticks_.load() << " ticks");
    }
}

void PeriodicTask::run() {
    Logger::register_component(name_);
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, period_, [this]() { return stop_requested_; })) {
            break;
        }
        lock.unlock();
        try {
            handler_();
            ++ticks_;
        } catch (const std::exception& e) {
            ++failures_;
            ERROR("Task " << name_ << " tick failed: " << e.what());
        }
        lock.lock();
    }
}

}  // namespace trade_pilot
