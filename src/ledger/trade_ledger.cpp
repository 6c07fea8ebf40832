// src/ledger/trade_ledger.cpp
#include "trade_pilot/ledger/trade_ledger.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include "trade_pilot/core/logger.hpp"
#include "trade_pilot/core/time_utils.hpp"

namespace trade_pilot {

double pnl_percent(Side side, Price entry_price, Price price) {
    if (entry_price <= 0.0) {
        return 0.0;
    }
    return side_sign(side) * (price - entry_price) / entry_price * 100.0;
}

TradeLedger::TradeLedger(AccountBalances initial_balances, std::shared_ptr<RiskGovernor> governor)
    : balances_(initial_balances),
      governor_(std::move(governor)),
      session_token_(std::to_string(core::to_epoch_ms(std::chrono::system_clock::now()))) {}

Result<Trade> TradeLedger::open(const std::string& pair, Side side, Notional amount, Price price,
                                const RiskConfiguration& risk, AccountMode mode) {
    if (pair.empty()) {
        return make_error<Trade>(ErrorCode::INVALID_ARGUMENT, "Pair cannot be empty",
                                 "TradeLedger");
    }
    if (!std::isfinite(amount) || amount <= 0.0) {
        return make_error<Trade>(ErrorCode::INVALID_ARGUMENT,
                                 "Trade amount must be positive, got " + std::to_string(amount),
                                 "TradeLedger");
    }
    if (!std::isfinite(price) || price <= 0.0) {
        return make_error<Trade>(ErrorCode::INVALID_ARGUMENT,
                                 "Entry price must be positive, got " + std::to_string(price),
                                 "TradeLedger");
    }

    Trade trade;
    trade.id = generate_trade_id();
    trade.pair = pair;
    trade.side = side;
    trade.entry_price = price;
    trade.amount = amount;
    trade.status = TradeStatus::OPEN;
    trade.timestamp = std::chrono::system_clock::now();
    trade.stop_loss_pct = risk.stop_loss_pct;
    trade.take_profit_pct = risk.take_profit_pct;
    trade.mode = mode;

    // Levels sit on the losing/winning side of entry for the trade's direction
    double sign = side_sign(side);
    trade.stop_loss = price * (1.0 - sign * risk.stop_loss_pct / 100.0);
    trade.take_profit = price * (1.0 + sign * risk.take_profit_pct / 100.0);

    balances_.at(mode) -= amount;
    trades_.push_back(trade);

    INFO("Opened " << side_to_string(side) << " " << pair << " id=" << trade.id
                   << " amount=" << amount << " entry=" << price
                   << " mode=" << account_mode_to_string(mode));

    return Result<Trade>(trade);
}

std::optional<Settlement> TradeLedger::settle(const std::string& trade_id, Price exit_price) {
    return close_trade(trade_id, exit_price, false);
}

std::optional<Settlement> TradeLedger::manual_close(const std::string& trade_id,
                                                    Price latest_price) {
    return close_trade(trade_id, latest_price, true);
}

std::optional<Settlement> TradeLedger::close_trade(const std::string& trade_id, Price exit_price,
                                                   bool manual) {
    auto it = std::find_if(trades_.begin(), trades_.end(),
                           [&](const Trade& t) { return t.id == trade_id; });
    if (it == trades_.end()) {
        DEBUG("Close ignored, unknown trade id " << trade_id);
        return std::nullopt;
    }

    Trade& trade = *it;
    switch (trade.status) {
        case TradeStatus::CLOSED:
            DEBUG("Close ignored, trade already closed " << trade_id);
            return std::nullopt;
        case TradeStatus::OPEN:
            break;
    }

    if (!std::isfinite(exit_price) || exit_price <= 0.0) {
        WARN("Close ignored for " << trade_id << ", invalid exit price " << exit_price);
        return std::nullopt;
    }

    Settlement settlement;
    settlement.trade_id = trade.id;
    settlement.pair = trade.pair;
    settlement.mode = trade.mode;
    settlement.exit_price = exit_price;
    settlement.pnl_percent = pnl_percent(trade.side, trade.entry_price, exit_price);
    settlement.pnl_value = trade.amount * settlement.pnl_percent / 100.0;
    settlement.credited = trade.amount + settlement.pnl_value;
    settlement.manual = manual;

    balances_.at(trade.mode) += settlement.credited;

    trade.exit_price = exit_price;
    trade.pnl = settlement.pnl_value;
    trade.status = TradeStatus::CLOSED;

    if (governor_) {
        governor_->on_settlement(settlement.pnl_value);
    }

    INFO((manual ? "Manually closed " : "Settled ")
         << trade.pair << " id=" << trade.id << " exit=" << exit_price
         << " pnl=" << settlement.pnl_value << " (" << settlement.pnl_percent << "%)");

    return settlement;
}

std::vector<Trade> TradeLedger::trades_for_mode(AccountMode mode) const {
    std::vector<Trade> result;
    for (const auto& trade : trades_) {
        if (trade.mode == mode) {
            result.push_back(trade);
        }
    }
    return result;
}

std::vector<Trade> TradeLedger::open_trades() const {
    std::vector<Trade> result;
    for (const auto& trade : trades_) {
        if (trade.is_open()) {
            result.push_back(trade);
        }
    }
    return result;
}

bool TradeLedger::has_open_position(const std::string& pair, AccountMode mode) const {
    return std::any_of(trades_.begin(), trades_.end(), [&](const Trade& t) {
        return t.pair == pair && t.mode == mode && t.is_open();
    });
}

std::optional<Trade> TradeLedger::find(const std::string& trade_id) const {
    auto it = std::find_if(trades_.begin(), trades_.end(),
                           [&](const Trade& t) { return t.id == trade_id; });
    if (it == trades_.end()) {
        return std::nullopt;
    }
    return *it;
}

void TradeLedger::restore(std::vector<Trade> trades, AccountBalances balances) {
    trades_ = std::move(trades);
    balances_ = balances;
    INFO("Ledger restored with " << trades_.size() << " trades, TRIAL=" << balances_.trial
                                 << " LIVE=" << balances_.live);
}

std::string TradeLedger::generate_trade_id() {
    return "TP-" + session_token_ + "-" + std::to_string(++trade_counter_);
}

}  // namespace trade_pilot
