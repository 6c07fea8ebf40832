// include/trade_pilot/data/binance_ticker_feed.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "trade_pilot/core/engine_config.hpp"
#include "trade_pilot/data/http_client.hpp"
#include "trade_pilot/data/market_data_feed.hpp"

namespace trade_pilot {

/**
 * @brief MarketDataFeed backed by the public 24h ticker endpoint
 *
 * One GET per pair against <base>/api/v3/ticker/24hr?symbol=<SYMBOL>, all
 * pairs fetched concurrently. Any failed pair fails the whole poll.
 */
class BinanceTickerFeed : public MarketDataFeed {
public:
    explicit BinanceTickerFeed(FeedConfig config,
                               std::shared_ptr<HttpClient> http = std::make_shared<HttpClient>());

    Result<TickerSnapshot> poll(const std::vector<std::string>& pairs) override;

    /**
     * @brief "BTC/USDT" -> "BTCUSDT"
     */
    static std::string to_symbol(const std::string& pair);

    /**
     * @brief Full request URL for a pair, including the proxy prefix
     */
    std::string ticker_url(const std::string& pair) const;

    /**
     * @brief Parse one ticker response body
     * @return Sample, or JSON_PARSE_ERROR / INVALID_DATA
     */
    static Result<TickerSample> parse_ticker(const std::string& body);

private:
    Result<TickerSample> fetch(const std::string& pair) const;

    FeedConfig config_;
    std::shared_ptr<HttpClient> http_;
};

}  // namespace trade_pilot
