// include/trade_pilot/engine/settlement_scheduler.hpp
#pragma once

#include <vector>
#include "trade_pilot/core/event_log.hpp"
#include "trade_pilot/core/types.hpp"
#include "trade_pilot/data/quote_book.hpp"
#include "trade_pilot/ledger/trade_ledger.hpp"

namespace trade_pilot {

/**
 * @brief Closes open trades that reached their stop-loss or take-profit
 *
 * Runs regardless of autopilot and across both account modes. Thresholds are
 * the percentages snapshotted into each trade at open time.
 */
class SettlementScheduler {
public:
    /**
     * @brief True when the move from entry to price crosses a snapshotted threshold
     */
    static bool should_settle(const Trade& trade, Price price);

    /**
     * @brief Settle every qualifying trade at its pair's latest quote
     *
     * Trades whose pair has no quote are left untouched. The caller holds the
     * engine lock.
     */
    std::vector<Settlement> tick(TradeLedger& ledger, const QuoteBook& quotes,
                                 EventLog& events) const;
};

}  // namespace trade_pilot
