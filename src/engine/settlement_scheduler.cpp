// src/engine/settlement_scheduler.cpp
#include "trade_pilot/engine/settlement_scheduler.hpp"
#include "trade_pilot/core/logger.hpp"

namespace trade_pilot {

bool SettlementScheduler::should_settle(const Trade& trade, Price price) {
    if (!trade.is_open() || price <= 0.0) {
        return false;
    }
    double pct = pnl_percent(trade.side, trade.entry_price, price);
    return pct <= -trade.stop_loss_pct || pct >= trade.take_profit_pct;
}

std::vector<Settlement> SettlementScheduler::tick(TradeLedger& ledger, const QuoteBook& quotes,
                                                  EventLog& events) const {
    std::vector<Settlement> settled;
    for (const auto& trade : ledger.open_trades()) {
        auto quote = quotes.quote(trade.pair);
        if (!quote || quote->price <= 0.0) {
            TRACE("No quote for " << trade.pair << ", leaving " << trade.id << " open");
            continue;
        }
        if (!should_settle(trade, quote->price)) {
            continue;
        }

        auto settlement = ledger.settle(trade.id, quote->price);
        if (!settlement) {
            continue;
        }
        events.append("Trade Closed: " + trade.pair + " | PnL: " +
                          format_pnl(settlement->pnl_value),
                      settlement->pnl_value >= 0.0 ? EventKind::SUCCESS : EventKind::WARNING);
        settled.push_back(*settlement);
    }
    return settled;
}

}  // namespace trade_pilot
