// include/trade_pilot/engine/autopilot_scheduler.hpp
#pragma once

#include <string>
#include <vector>
#include "trade_pilot/core/engine_config.hpp"
#include "trade_pilot/core/event_log.hpp"
#include "trade_pilot/core/types.hpp"
#include "trade_pilot/data/quote_book.hpp"
#include "trade_pilot/ledger/trade_ledger.hpp"
#include "trade_pilot/risk/risk_governor.hpp"
#include "trade_pilot/strategy/trend_analyzer.hpp"

namespace trade_pilot {

/**
 * @brief What one autopilot tick did
 */
struct AutopilotReport {
    bool evaluated{false};  // false when autopilot was off
    GateDecision gate;
    std::vector<Trade> opened;
    std::vector<std::string> skipped;
};

/**
 * @brief Autonomous entry logic run on every autopilot period
 *
 * Only long entries are generated. Each tick checks the risk gate first; a
 * blocked gate ends the tick without looking at any pair.
 */
class AutopilotScheduler {
public:
    explicit AutopilotScheduler(AutopilotConfig config,
                                TrendAnalyzerConfig trend = TrendAnalyzerConfig{});

    /**
     * @brief Run one tick against the caller's state
     *
     * The caller holds the engine lock for the duration of the call.
     */
    AutopilotReport tick(TradeLedger& ledger, RiskGovernor& governor, const QuoteBook& quotes,
                         const RiskConfiguration& risk, AccountMode mode,
                         EventLog& events) const;

    const AutopilotConfig& config() const {
        return config_;
    }

private:
    AutopilotConfig config_;
    TrendAnalyzerConfig trend_;
};

}  // namespace trade_pilot
