// src/engine/autopilot_scheduler.cpp
#include "trade_pilot/engine/autopilot_scheduler.hpp"
#include "trade_pilot/core/logger.hpp"
#include "trade_pilot/strategy/position_sizer.hpp"

namespace trade_pilot {

AutopilotScheduler::AutopilotScheduler(AutopilotConfig config, TrendAnalyzerConfig trend)
    : config_(std::move(config)), trend_(trend) {}

AutopilotReport AutopilotScheduler::tick(TradeLedger& ledger, RiskGovernor& governor,
                                         const QuoteBook& quotes, const RiskConfiguration& risk,
                                         AccountMode mode, EventLog& events) const {
    AutopilotReport report;
    if (!governor.autopilot_enabled()) {
        return report;
    }
    report.evaluated = true;

    report.gate = governor.check_gate(ledger.balance(mode), risk.max_drawdown_pct);
    switch (report.gate.status) {
        case GateStatus::ALLOWED:
            break;
        case GateStatus::CONSECUTIVE_LOSSES:
            events.append("Safety kill switch: consecutive loss limit reached",
                          EventKind::WARNING);
            return report;
        case GateStatus::DRAWDOWN_LIMIT:
            events.append("Safety kill switch: drawdown limit reached", EventKind::WARNING);
            return report;
    }

    for (const auto& pair : quotes.pairs()) {
        PriceHistory history = quotes.history(pair);
        if (history.size() < config_.min_history) {
            report.skipped.push_back(pair);
            continue;
        }
        if (ledger.has_open_position(pair, mode)) {
            report.skipped.push_back(pair);
            continue;
        }
        Price price = quotes.latest_price(pair);
        if (price <= 0.0) {
            report.skipped.push_back(pair);
            continue;
        }

        TrendSignal signal = analyze_trend(history, trend_);
        switch (signal.action) {
            case SignalAction::BUY:
                break;
            case SignalAction::SELL:
            case SignalAction::HOLD:
                TRACE("Autopilot " << pair << " " << signal_action_to_string(signal.action)
                                   << ", no entry");
                continue;
        }

        Notional size = safe_size(ledger.balance(mode), price, risk.advisory_risk_fraction(),
                                  risk.advisory_max_position);
        if (size <= config_.min_notional) {
            DEBUG("Autopilot " << pair << " size " << size << " below minimum");
            report.skipped.push_back(pair);
            continue;
        }

        events.append("AUTOPILOT: Opening LONG position on " + pair, EventKind::ADVISORY);
        auto trade = ledger.open(pair, Side::BUY, size, price, risk, mode);
        if (trade.is_error()) {
            ERROR("Autopilot entry on " << pair << " rejected: " << trade.error()->to_string());
            report.skipped.push_back(pair);
            continue;
        }
        report.opened.push_back(trade.value());
    }

    return report;
}

}  // namespace trade_pilot
