//===== state_manager.cpp =====
#include "trade_pilot/core/state_manager.hpp"
#include <algorithm>
#include <chrono>
#include <initializer_list>

namespace trade_pilot {

namespace {

constexpr const char* kComponent = "StateManager";

template <typename T>
Result<T> unknown_component(const std::string& id) {
    return make_error<T>(ErrorCode::INVALID_ARGUMENT, "Unknown component '" + id + "'",
                         kComponent);
}

}  // namespace

std::string component_state_to_string(ComponentState state) {
    switch (state) {
        case ComponentState::INITIALIZED:
            return "INITIALIZED";
        case ComponentState::RUNNING:
            return "RUNNING";
        case ComponentState::PAUSED:
            return "PAUSED";
        case ComponentState::ERR_STATE:
            return "ERR_STATE";
        case ComponentState::STOPPED:
            return "STOPPED";
    }
    return "UNKNOWN";
}

StateManager& StateManager::instance() {
    static StateManager manager;
    return manager;
}

void StateManager::reset_instance() {
    auto& manager = instance();
    std::lock_guard<std::mutex> lock(manager.mutex_);
    manager.components_.clear();
}

bool StateManager::transition_allowed(ComponentState from, ComponentState to) {
    auto any_of = [to](std::initializer_list<ComponentState> targets) {
        return std::find(targets.begin(), targets.end(), to) != targets.end();
    };
    switch (from) {
        case ComponentState::INITIALIZED:
            return any_of({ComponentState::RUNNING, ComponentState::ERR_STATE});
        case ComponentState::RUNNING:
            return any_of(
                {ComponentState::PAUSED, ComponentState::STOPPED, ComponentState::ERR_STATE});
        case ComponentState::PAUSED:
            return any_of(
                {ComponentState::RUNNING, ComponentState::STOPPED, ComponentState::ERR_STATE});
        case ComponentState::ERR_STATE:
            return any_of({ComponentState::INITIALIZED, ComponentState::STOPPED});
        case ComponentState::STOPPED:
            return to == ComponentState::INITIALIZED;
    }
    return false;
}

Result<void> StateManager::register_component(const ComponentInfo& info) {
    if (info.id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Component id must not be empty",
                                kComponent);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = components_.emplace(info.id, info);
    if (!inserted) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Component '" + info.id + "' is already registered", kComponent);
    }
    it->second.last_update = std::chrono::system_clock::now();
    return Result<void>();
}

Result<void> StateManager::unregister_component(const std::string& component_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (components_.erase(component_id) == 0) {
        return unknown_component<void>(component_id);
    }
    return Result<void>();
}

Result<ComponentInfo> StateManager::get_state(const std::string& component_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return unknown_component<ComponentInfo>(component_id);
    }
    return Result<ComponentInfo>(it->second);
}

Result<void> StateManager::update_state(const std::string& component_id,
                                        ComponentState new_state,
                                        const std::string& error_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return unknown_component<void>(component_id);
    }

    ComponentInfo& info = it->second;
    if (!transition_allowed(info.state, new_state)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                component_id + " cannot move from " +
                                    component_state_to_string(info.state) + " to " +
                                    component_state_to_string(new_state),
                                kComponent);
    }

    info.state = new_state;
    info.error_message = new_state == ComponentState::ERR_STATE ? error_message : "";
    info.last_update = std::chrono::system_clock::now();
    ++info.transitions;
    return Result<void>();
}

bool StateManager::is_healthy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !components_.empty() &&
           std::all_of(components_.begin(), components_.end(), [](const auto& entry) {
               return entry.second.state == ComponentState::INITIALIZED ||
                      entry.second.state == ComponentState::RUNNING;
           });
}

}  // namespace trade_pilot
