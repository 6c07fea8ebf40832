// include/trade_pilot/risk/risk_governor.hpp
#pragma once

#include <optional>
#include <string>
#include "trade_pilot/core/types.hpp"

namespace trade_pilot {

/**
 * @brief Session-scoped safety counters and kill-switch state
 */
struct SafetyState {
    int consecutive_losses{0};
    double cumulative_pnl{0.0};
    bool autopilot_enabled{false};
    std::optional<std::string> alert;
};

enum class GateStatus { ALLOWED, CONSECUTIVE_LOSSES, DRAWDOWN_LIMIT };

inline std::string gate_status_to_string(GateStatus status) {
    switch (status) {
        case GateStatus::ALLOWED:
            return "ALLOWED";
        case GateStatus::CONSECUTIVE_LOSSES:
            return "CONSECUTIVE_LOSSES";
        case GateStatus::DRAWDOWN_LIMIT:
            return "DRAWDOWN_LIMIT";
    }
    return "ALLOWED";
}

/**
 * @brief Outcome of a pre-entry gate check
 */
struct GateDecision {
    GateStatus status{GateStatus::ALLOWED};
    double drawdown_pct{0.0};

    bool allowed() const {
        return status == GateStatus::ALLOWED;
    }
};

/**
 * @brief Kill-switch for autonomous trading
 *
 * Settlements feed the loss streak and the cumulative PnL. The gate is
 * evaluated before every autonomous entry decision; a breach disables the
 * autopilot and raises an alert that stays until the operator dismisses it.
 * Dismissal resets the loss streak only; cumulative PnL is never reset.
 */
class RiskGovernor {
public:
    static constexpr const char* kConsecutiveLossAlert =
        "SAFETY TRIGGERED: max consecutive losses reached";
    static constexpr const char* kDrawdownAlert = "SAFETY TRIGGERED: drawdown limit reached";

    explicit RiskGovernor(int max_consecutive_losses = 3);

    /**
     * @brief Record the realized PnL of a settled trade
     */
    void on_settlement(double pnl_value);

    /**
     * @brief Evaluate the kill-switch rules
     * @param current_balance Balance of the active account mode
     * @param max_drawdown_pct Drawdown limit in percent (positive)
     * @return Decision; on breach autopilot is disabled and the alert raised
     */
    GateDecision check_gate(double current_balance, double max_drawdown_pct);

    /**
     * @brief Operator acknowledgement of the active alert
     */
    void dismiss_alert();

    void set_autopilot(bool enabled) {
        state_.autopilot_enabled = enabled;
    }

    bool autopilot_enabled() const {
        return state_.autopilot_enabled;
    }

    const SafetyState& state() const {
        return state_;
    }

    int max_consecutive_losses() const {
        return max_consecutive_losses_;
    }

private:
    void trip(GateStatus status, const std::string& alert);

    int max_consecutive_losses_;
    SafetyState state_;
};

}  // namespace trade_pilot
