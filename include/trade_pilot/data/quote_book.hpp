// include/trade_pilot/data/quote_book.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>
#include "trade_pilot/core/engine_config.hpp"
#include "trade_pilot/core/types.hpp"
#include "trade_pilot/data/market_data_feed.hpp"

namespace trade_pilot {

/**
 * @brief Latest quote and bounded price history for every tracked pair
 *
 * The book keeps the last history_limit previous prices plus the newest one.
 * Quote timestamps are strictly increasing per pair. When the feed fails the
 * book advances each pair with a bounded random walk instead. The book
 * performs no locking; its owner serializes access.
 */
class QuoteBook {
public:
    /**
     * @param assets Tracked pairs and their walk parameters
     * @param history_limit Number of previous prices retained
     * @param seed Seed of the synthetic walk generator
     */
    QuoteBook(std::vector<AssetProfile> assets, size_t history_limit = 100,
              uint32_t seed = std::random_device{}());

    /**
     * @brief Load the startup histories and quotes
     */
    void seed_defaults();

    /**
     * @brief Apply a successful feed poll
     */
    void apply_samples(const TickerSnapshot& samples);

    /**
     * @brief Advance every pair by one synthetic random-walk step
     */
    void apply_synthetic_walk();

    /**
     * @brief Set a quote directly and append it to the history
     */
    void set_quote(const std::string& pair, Price price, double pct_change_24h,
                   bool synthetic = false);

    void set_history(const std::string& pair, PriceHistory history);

    std::optional<Quote> quote(const std::string& pair) const;

    /**
     * @brief Latest price, or 0 when the pair has no quote
     */
    Price latest_price(const std::string& pair) const;

    PriceHistory history(const std::string& pair) const;

    const std::unordered_map<std::string, Quote>& quotes() const {
        return quotes_;
    }

    std::vector<std::string> pairs() const;

    void record_latency(int64_t latency_ms) {
        latency_ms_ = latency_ms;
    }

    int64_t latency_ms() const {
        return latency_ms_;
    }

    size_t history_limit() const {
        return history_limit_;
    }

private:
    void push_price(const std::string& pair, Price price, double pct_change_24h, bool synthetic);
    Timestamp next_timestamp(const std::string& pair) const;

    std::vector<AssetProfile> assets_;
    size_t history_limit_;
    std::mt19937 rng_;
    std::unordered_map<std::string, Quote> quotes_;
    std::unordered_map<std::string, PriceHistory> histories_;
    int64_t latency_ms_{0};
};

}  // namespace trade_pilot
