// include/trade_pilot/data/market_data_feed.hpp
#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include "trade_pilot/core/error.hpp"
#include "trade_pilot/core/types.hpp"

namespace trade_pilot {

using TickerSnapshot = std::unordered_map<std::string, TickerSample>;

/**
 * @brief Source of current prices for the tracked pairs
 */
class MarketDataFeed {
public:
    virtual ~MarketDataFeed() = default;

    /**
     * @brief Fetch the latest sample for every requested pair
     * @param pairs Pair symbols such as "BTC/USDT"
     * @return One sample per pair; any missing pair fails the whole poll
     */
    virtual Result<TickerSnapshot> poll(const std::vector<std::string>& pairs) = 0;
};

}  // namespace trade_pilot
