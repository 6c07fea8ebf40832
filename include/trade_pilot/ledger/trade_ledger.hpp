// include/trade_pilot/ledger/trade_ledger.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "trade_pilot/core/engine_config.hpp"
#include "trade_pilot/core/error.hpp"
#include "trade_pilot/core/types.hpp"
#include "trade_pilot/risk/risk_governor.hpp"

namespace trade_pilot {

/**
 * @brief One balance per account mode
 */
struct AccountBalances {
    double trial{10000.00};
    double live{2450.75};

    double get(AccountMode mode) const {
        switch (mode) {
            case AccountMode::TRIAL:
                return trial;
            case AccountMode::LIVE:
                return live;
        }
        return trial;
    }

    double& at(AccountMode mode) {
        switch (mode) {
            case AccountMode::TRIAL:
                return trial;
            case AccountMode::LIVE:
                return live;
        }
        return trial;
    }
};

/**
 * @brief Outcome of closing a trade
 */
struct Settlement {
    std::string trade_id;
    std::string pair;
    AccountMode mode{AccountMode::TRIAL};
    Price exit_price{0.0};
    double pnl_percent{0.0};
    double pnl_value{0.0};
    Notional credited{0.0};
    bool manual{false};
};

/**
 * @brief PnL in percent of a position at a given price; positive is a gain
 */
double pnl_percent(Side side, Price entry_price, Price price);

/**
 * @brief Owner of trade records and per-mode balances
 *
 * Trades move OPEN -> CLOSED exactly once. Opening debits the notional from
 * the trade's account mode; settling credits notional + PnL back to the same
 * mode and reports the PnL to the risk governor. The ledger performs no
 * locking; its owner serializes access.
 */
class TradeLedger {
public:
    TradeLedger(AccountBalances initial_balances, std::shared_ptr<RiskGovernor> governor);

    /**
     * @brief Open a new position
     * @param pair Pair symbol, e.g. "BTC/USDT"
     * @param side BUY or SELL
     * @param amount Notional to commit, must be positive
     * @param price Entry price, must be positive
     * @param risk Risk configuration snapshotted into the trade
     * @param mode Account mode to debit
     * @return The created trade, or INVALID_ARGUMENT
     */
    Result<Trade> open(const std::string& pair, Side side, Notional amount, Price price,
                       const RiskConfiguration& risk, AccountMode mode);

    /**
     * @brief Close an OPEN trade at exit_price
     * @return Settlement, or nullopt when the id is unknown or already CLOSED
     */
    std::optional<Settlement> settle(const std::string& trade_id, Price exit_price);

    /**
     * @brief Operator-initiated close at the latest known quote
     */
    std::optional<Settlement> manual_close(const std::string& trade_id, Price latest_price);

    std::vector<Trade> trades_for_mode(AccountMode mode) const;

    /**
     * @brief All OPEN trades across both account modes
     */
    std::vector<Trade> open_trades() const;

    bool has_open_position(const std::string& pair, AccountMode mode) const;

    std::optional<Trade> find(const std::string& trade_id) const;

    const std::vector<Trade>& all_trades() const {
        return trades_;
    }

    double balance(AccountMode mode) const {
        return balances_.get(mode);
    }

    const AccountBalances& balances() const {
        return balances_;
    }

    /**
     * @brief Replace trades and balances with persisted state
     */
    void restore(std::vector<Trade> trades, AccountBalances balances);

private:
    std::optional<Settlement> close_trade(const std::string& trade_id, Price exit_price,
                                          bool manual);
    std::string generate_trade_id();

    std::vector<Trade> trades_;
    AccountBalances balances_;
    std::shared_ptr<RiskGovernor> governor_;
    std::string session_token_;
    uint64_t trade_counter_{0};
};

}  // namespace trade_pilot
