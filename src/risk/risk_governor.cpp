// src/risk/risk_governor.cpp
#include "trade_pilot/risk/risk_governor.hpp"
#include "trade_pilot/core/logger.hpp"

namespace trade_pilot {

RiskGovernor::RiskGovernor(int max_consecutive_losses)
    : max_consecutive_losses_(max_consecutive_losses > 0 ? max_consecutive_losses : 1) {}

void RiskGovernor::on_settlement(double pnl_value) {
    if (pnl_value < 0.0) {
        state_.consecutive_losses++;
    } else {
        state_.consecutive_losses = 0;
    }
    state_.cumulative_pnl += pnl_value;

    DEBUG("Settlement recorded: pnl=" << pnl_value
                                      << " streak=" << state_.consecutive_losses
                                      << " cumulative=" << state_.cumulative_pnl);
}

GateDecision RiskGovernor::check_gate(double current_balance, double max_drawdown_pct) {
    GateDecision decision;

    if (state_.consecutive_losses >= max_consecutive_losses_) {
        decision.status = GateStatus::CONSECUTIVE_LOSSES;
        trip(decision.status, std::string(kConsecutiveLossAlert) + " (" +
                                  std::to_string(max_consecutive_losses_) + ")");
        return decision;
    }

    if (current_balance > 0.0) {
        decision.drawdown_pct = state_.cumulative_pnl / current_balance * 100.0;
        if (decision.drawdown_pct <= -max_drawdown_pct) {
            decision.status = GateStatus::DRAWDOWN_LIMIT;
        }
    } else if (state_.cumulative_pnl < 0.0) {
        // An exhausted balance with realized losses is treated as a full drawdown
        decision.drawdown_pct = -100.0;
        decision.status = GateStatus::DRAWDOWN_LIMIT;
    }

    if (decision.status == GateStatus::DRAWDOWN_LIMIT) {
        trip(decision.status, kDrawdownAlert);
    }

    return decision;
}

void RiskGovernor::dismiss_alert() {
    state_.alert.reset();
    state_.consecutive_losses = 0;
}

void RiskGovernor::trip(GateStatus status, const std::string& alert) {
    bool was_enabled = state_.autopilot_enabled;
    state_.autopilot_enabled = false;
    state_.alert = alert;

    if (was_enabled) {
        WARN("Kill switch engaged (" << gate_status_to_string(status) << "): " << alert);
    }
}

}  // namespace trade_pilot
