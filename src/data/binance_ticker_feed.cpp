// src/data/binance_ticker_feed.cpp
#include "trade_pilot/data/binance_ticker_feed.hpp"
#include <cmath>
#include <future>
#include <nlohmann/json.hpp>
#include "trade_pilot/core/logger.hpp"

namespace trade_pilot {

namespace {

// The ticker endpoint encodes numbers as strings; accept plain numbers too
Result<double> numeric_field(const nlohmann::json& j, const std::string& field) {
    if (!j.contains(field)) {
        return make_error<double>(ErrorCode::INVALID_DATA, "Ticker field missing: " + field,
                                  "BinanceTickerFeed");
    }
    const auto& value = j.at(field);
    double parsed = 0.0;
    if (value.is_number()) {
        parsed = value.get<double>();
    } else if (value.is_string()) {
        try {
            parsed = std::stod(value.get<std::string>());
        } catch (const std::exception& e) {
            return make_error<double>(ErrorCode::INVALID_DATA,
                                      "Ticker field " + field + " is not numeric: " + e.what(),
                                      "BinanceTickerFeed");
        }
    } else {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  "Ticker field " + field + " has unexpected type",
                                  "BinanceTickerFeed");
    }
    if (!std::isfinite(parsed)) {
        return make_error<double>(ErrorCode::INVALID_DATA, "Ticker field " + field + " not finite",
                                  "BinanceTickerFeed");
    }
    return parsed;
}

}  // namespace

BinanceTickerFeed::BinanceTickerFeed(FeedConfig config, std::shared_ptr<HttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {}

std::string BinanceTickerFeed::to_symbol(const std::string& pair) {
    std::string symbol;
    symbol.reserve(pair.size());
    for (char c : pair) {
        if (c != '/') {
            symbol.push_back(c);
        }
    }
    return symbol;
}

std::string BinanceTickerFeed::ticker_url(const std::string& pair) const {
    return config_.proxy_prefix + config_.base_url + "/api/v3/ticker/24hr?symbol=" +
           to_symbol(pair);
}

Result<TickerSample> BinanceTickerFeed::parse_ticker(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        return make_error<TickerSample>(ErrorCode::JSON_PARSE_ERROR,
                                        std::string("Failed to parse ticker: ") + e.what(),
                                        "BinanceTickerFeed");
    }
    if (!j.is_object()) {
        return make_error<TickerSample>(ErrorCode::INVALID_DATA, "Ticker is not an object",
                                        "BinanceTickerFeed");
    }

    auto price = numeric_field(j, "lastPrice");
    if (price.is_error()) {
        return make_error<TickerSample>(price.error()->code(), price.error()->what(),
                                        "BinanceTickerFeed");
    }
    auto change = numeric_field(j, "priceChangePercent");
    if (change.is_error()) {
        return make_error<TickerSample>(change.error()->code(), change.error()->what(),
                                        "BinanceTickerFeed");
    }

    TickerSample sample;
    sample.price = price.value();
    sample.pct_change_24h = change.value();
    return sample;
}

Result<TickerSample> BinanceTickerFeed::fetch(const std::string& pair) const {
    HttpRequest request;
    request.url = ticker_url(pair);
    request.timeout_ms = config_.request_timeout_ms;

    auto response = http_->perform(request);
    if (response.is_error()) {
        return make_error<TickerSample>(response.error()->code(),
                                        "Ticker request failed for " + pair + ": " +
                                            response.error()->what(),
                                        "BinanceTickerFeed");
    }
    if (response.value().status != 200) {
        return make_error<TickerSample>(ErrorCode::MARKET_DATA_ERROR,
                                        "Ticker request for " + pair + " returned HTTP " +
                                            std::to_string(response.value().status),
                                        "BinanceTickerFeed");
    }

    auto sample = parse_ticker(response.value().body);
    if (sample.is_error()) {
        return make_error<TickerSample>(sample.error()->code(),
                                        "Bad ticker for " + pair + ": " + sample.error()->what(),
                                        "BinanceTickerFeed");
    }
    return sample.value();
}

Result<TickerSnapshot> BinanceTickerFeed::poll(const std::vector<std::string>& pairs) {
    // All pairs in flight at once, so a poll costs one request timeout at most
    std::vector<std::future<Result<TickerSample>>> pending;
    pending.reserve(pairs.size());
    for (const auto& pair : pairs) {
        pending.push_back(
            std::async(std::launch::async, [this, &pair]() { return fetch(pair); }));
    }

    std::vector<Result<TickerSample>> samples;
    samples.reserve(pending.size());
    for (auto& future : pending) {
        samples.push_back(future.get());
    }

    TickerSnapshot snapshot;
    for (size_t i = 0; i < pairs.size(); ++i) {
        if (samples[i].is_error()) {
            return make_error<TickerSnapshot>(samples[i].error()->code(),
                                              samples[i].error()->what(), "BinanceTickerFeed");
        }
        const TickerSample& sample = samples[i].value();
        snapshot[pairs[i]] = sample;
        TRACE("Ticker " << pairs[i] << " price=" << sample.price
                        << " change=" << sample.pct_change_24h << "%");
    }
    return snapshot;
}

}  // namespace trade_pilot
