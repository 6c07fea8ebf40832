// src/data/quote_book.cpp
#include "trade_pilot/data/quote_book.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include "trade_pilot/core/logger.hpp"

namespace trade_pilot {

namespace {

// Startup curve: base + sin(i / 10) * amplitude + i * drift
struct SeedCurve {
    const char* pair;
    double base;
    double amplitude;
    double drift;
    Price quote;
    double pct_change_24h;
};

constexpr size_t kSeedPoints = 60;

const SeedCurve kSeedCurves[] = {
    {"BTC/USDT", 96000.0, 200.0, 15.0, 96450.00, 1.20},
    {"ETH/USDT", 2600.0, 10.0, 3.0, 2680.00, 0.45},
    {"SOL/USDT", 190.0, 5.0, 0.8, 198.50, -0.15},
};

}  // namespace

QuoteBook::QuoteBook(std::vector<AssetProfile> assets, size_t history_limit, uint32_t seed)
    : assets_(std::move(assets)), history_limit_(history_limit), rng_(seed) {}

void QuoteBook::seed_defaults() {
    auto now = std::chrono::system_clock::now();
    for (const auto& asset : assets_) {
        const SeedCurve* curve = nullptr;
        for (const auto& c : kSeedCurves) {
            if (asset.pair == c.pair) {
                curve = &c;
                break;
            }
        }

        Quote quote;
        quote.timestamp = now;
        if (curve) {
            PriceHistory history;
            history.reserve(kSeedPoints);
            for (size_t i = 0; i < kSeedPoints; ++i) {
                double x = static_cast<double>(i);
                history.push_back(curve->base + std::sin(x / 10.0) * curve->amplitude +
                                  x * curve->drift);
            }
            histories_[asset.pair] = std::move(history);
            quote.price = curve->quote;
            quote.pct_change_24h = curve->pct_change_24h;
        } else {
            histories_[asset.pair] = PriceHistory{};
            quote.price = asset.reference_price;
        }
        quotes_[asset.pair] = quote;
    }
    DEBUG("Quote book seeded for " << assets_.size() << " pairs");
}

void QuoteBook::apply_samples(const TickerSnapshot& samples) {
    for (const auto& entry : samples) {
        push_price(entry.first, entry.second.price, entry.second.pct_change_24h, false);
    }
}

void QuoteBook::apply_synthetic_walk() {
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    for (const auto& asset : assets_) {
        auto it = quotes_.find(asset.pair);
        if (it == quotes_.end()) {
            continue;
        }
        double movement = (unit(rng_) - 0.5) * asset.walk_step;
        Price next = std::max(0.0, it->second.price + movement);
        push_price(asset.pair, next, it->second.pct_change_24h, true);
    }
}

void QuoteBook::set_quote(const std::string& pair, Price price, double pct_change_24h,
                          bool synthetic) {
    push_price(pair, price, pct_change_24h, synthetic);
}

void QuoteBook::set_history(const std::string& pair, PriceHistory history) {
    if (history.size() > history_limit_ + 1) {
        history.erase(history.begin(),
                      history.begin() + static_cast<std::ptrdiff_t>(history.size() -
                                                                    (history_limit_ + 1)));
    }
    histories_[pair] = std::move(history);
}

std::optional<Quote> QuoteBook::quote(const std::string& pair) const {
    auto it = quotes_.find(pair);
    if (it == quotes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Price QuoteBook::latest_price(const std::string& pair) const {
    auto it = quotes_.find(pair);
    return it == quotes_.end() ? 0.0 : it->second.price;
}

PriceHistory QuoteBook::history(const std::string& pair) const {
    auto it = histories_.find(pair);
    return it == histories_.end() ? PriceHistory{} : it->second;
}

std::vector<std::string> QuoteBook::pairs() const {
    std::vector<std::string> result;
    result.reserve(assets_.size());
    for (const auto& asset : assets_) {
        result.push_back(asset.pair);
    }
    return result;
}

void QuoteBook::push_price(const std::string& pair, Price price, double pct_change_24h,
                           bool synthetic) {
    if (!std::isfinite(price) || price < 0.0) {
        WARN("Rejected price " << price << " for " << pair);
        return;
    }

    Quote quote;
    quote.price = price;
    quote.pct_change_24h = pct_change_24h;
    quote.timestamp = next_timestamp(pair);
    quote.synthetic = synthetic;
    quotes_[pair] = quote;

    auto& history = histories_[pair];
    if (history.size() > history_limit_) {
        history.erase(history.begin(),
                      history.begin() +
                          static_cast<std::ptrdiff_t>(history.size() - history_limit_));
    }
    history.push_back(price);
}

Timestamp QuoteBook::next_timestamp(const std::string& pair) const {
    auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    Timestamp candidate(now);
    auto it = quotes_.find(pair);
    if (it != quotes_.end() && candidate <= it->second.timestamp) {
        candidate = it->second.timestamp + std::chrono::milliseconds(1);
    }
    return candidate;
}

}  // namespace trade_pilot
