// include/trade_pilot/core/types.hpp

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace trade_pilot {

/**
 * @brief Timestamp type for consistent time representation
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Notional (monetary) size of a position
 */
using Notional = double;

/**
 * @brief Trading side enumeration
 */
enum class Side { BUY, SELL };

/**
 * @brief Lifecycle status of a trade; CLOSED is terminal
 */
enum class TradeStatus { OPEN, CLOSED };

/**
 * @brief Account mode a trade and a balance belong to
 */
enum class AccountMode { TRIAL, LIVE };

/**
 * @brief Action recommended by a signal or an insight
 */
enum class SignalAction { BUY, SELL, HOLD };

/**
 * @brief Origin of an insight or an audit
 */
enum class Provenance { EXTERNAL, FALLBACK };

inline std::string side_to_string(Side side) {
    switch (side) {
        case Side::BUY:
            return "BUY";
        case Side::SELL:
            return "SELL";
    }
    return "BUY";
}

inline std::optional<Side> side_from_string(const std::string& str) {
    if (str == "BUY")
        return Side::BUY;
    if (str == "SELL")
        return Side::SELL;
    return std::nullopt;
}

inline std::string trade_status_to_string(TradeStatus status) {
    switch (status) {
        case TradeStatus::OPEN:
            return "OPEN";
        case TradeStatus::CLOSED:
            return "CLOSED";
    }
    return "OPEN";
}

inline std::optional<TradeStatus> trade_status_from_string(const std::string& str) {
    if (str == "OPEN")
        return TradeStatus::OPEN;
    if (str == "CLOSED")
        return TradeStatus::CLOSED;
    return std::nullopt;
}

inline std::string account_mode_to_string(AccountMode mode) {
    switch (mode) {
        case AccountMode::TRIAL:
            return "TRIAL";
        case AccountMode::LIVE:
            return "LIVE";
    }
    return "TRIAL";
}

inline std::optional<AccountMode> account_mode_from_string(const std::string& str) {
    if (str == "TRIAL")
        return AccountMode::TRIAL;
    if (str == "LIVE")
        return AccountMode::LIVE;
    return std::nullopt;
}

inline std::string signal_action_to_string(SignalAction action) {
    switch (action) {
        case SignalAction::BUY:
            return "BUY";
        case SignalAction::SELL:
            return "SELL";
        case SignalAction::HOLD:
            return "HOLD";
    }
    return "HOLD";
}

inline std::optional<SignalAction> signal_action_from_string(const std::string& str) {
    if (str == "BUY")
        return SignalAction::BUY;
    if (str == "SELL")
        return SignalAction::SELL;
    if (str == "HOLD")
        return SignalAction::HOLD;
    return std::nullopt;
}

inline std::string provenance_to_string(Provenance provenance) {
    switch (provenance) {
        case Provenance::EXTERNAL:
            return "EXTERNAL";
        case Provenance::FALLBACK:
            return "FALLBACK";
    }
    return "FALLBACK";
}

/**
 * @brief +1 for long positions, -1 for short positions
 */
inline double side_sign(Side side) {
    switch (side) {
        case Side::BUY:
            return 1.0;
        case Side::SELL:
            return -1.0;
    }
    return 1.0;
}

/**
 * @brief Trade record
 * Stop-loss/take-profit levels and percentages are snapshotted at open time.
 */
struct Trade {
    std::string id;
    std::string pair;
    Side side{Side::BUY};
    Price entry_price{0.0};
    std::optional<Price> exit_price;
    Notional amount{0.0};
    TradeStatus status{TradeStatus::OPEN};
    std::optional<double> pnl;
    Timestamp timestamp;
    Price stop_loss{0.0};
    Price take_profit{0.0};
    double stop_loss_pct{0.0};
    double take_profit_pct{0.0};
    AccountMode mode{AccountMode::TRIAL};

    bool is_open() const {
        return status == TradeStatus::OPEN;
    }
};

/**
 * @brief Latest quote for a pair
 */
struct Quote {
    Price price{0.0};
    double pct_change_24h{0.0};
    Timestamp timestamp;
    bool synthetic{false};
};

/**
 * @brief Raw feed sample for a pair, before it is timestamped into a Quote
 */
struct TickerSample {
    Price price{0.0};
    double pct_change_24h{0.0};
};

/**
 * @brief Support/resistance pair
 */
struct KeyLevels {
    Price support{0.0};
    Price resistance{0.0};
};

/**
 * @brief Advisory output for a single pair
 */
struct Insight {
    std::string pair;
    double confidence{0.0};
    SignalAction action{SignalAction::HOLD};
    std::string reasoning;
    KeyLevels key_levels;
    Timestamp timestamp;
    Provenance provenance{Provenance::FALLBACK};
};

/**
 * @brief Performance audit over closed trades
 */
struct Audit {
    std::string rating;
    double efficiency_score{0.0};
    std::string critique;
    std::string recommended_adjustment;
    Provenance provenance{Provenance::FALLBACK};
};

/**
 * @brief Operator session metadata, persisted opaquely
 */
struct SessionInfo {
    std::string user_id;
    std::string name;
    std::string email;
    std::string role;
};

using PriceHistory = std::vector<Price>;

}  // namespace trade_pilot
