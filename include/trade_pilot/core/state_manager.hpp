//===== state_manager.hpp =====
#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include "trade_pilot/core/error.hpp"
#include "trade_pilot/core/types.hpp"

namespace trade_pilot {

enum class ComponentState { INITIALIZED, RUNNING, PAUSED, ERR_STATE, STOPPED };

enum class ComponentType {
    MARKET_DATA,
    DECISION_PIPELINE,
    TRADE_LEDGER,
    RISK_GOVERNOR,
    SCHEDULER,
    PERSISTENCE,
    ENGINE
};

std::string component_state_to_string(ComponentState state);

struct ComponentInfo {
    ComponentType type;
    ComponentState state;
    std::string id;
    std::string error_message;  // set only while in ERR_STATE
    Timestamp last_update;
    uint64_t transitions{0};
};

/**
 * @brief Lifecycle registry for the engine and its periodic tasks
 *
 * Allowed moves:
 *   INITIALIZED -> RUNNING, ERR_STATE
 *   RUNNING     -> PAUSED, STOPPED, ERR_STATE
 *   PAUSED      -> RUNNING, STOPPED, ERR_STATE
 *   ERR_STATE   -> INITIALIZED, STOPPED
 *   STOPPED     -> INITIALIZED
 */
class StateManager {
public:
    static StateManager& instance();

    Result<void> register_component(const ComponentInfo& info);
    Result<void> unregister_component(const std::string& component_id);

    Result<ComponentInfo> get_state(const std::string& component_id) const;
    Result<void> update_state(const std::string& component_id, ComponentState new_state,
                              const std::string& error_message = "");

    /// True when at least one component is registered and none is paused, failed or stopped
    bool is_healthy() const;

    static void reset_instance();

private:
    StateManager() = default;
    StateManager(const StateManager&) = delete;
    StateManager& operator=(const StateManager&) = delete;

    static bool transition_allowed(ComponentState from, ComponentState to);

    std::unordered_map<std::string, ComponentInfo> components_;
    mutable std::mutex mutex_;
};
}  // namespace trade_pilot
