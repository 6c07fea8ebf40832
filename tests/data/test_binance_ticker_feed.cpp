#include <gtest/gtest.h>
#include <chrono>
#include <map>
#include <mutex>
#include <thread>
#include <vector>
#include "core/test_base.hpp"
#include "trade_pilot/data/binance_ticker_feed.hpp"

using namespace trade_pilot;
using namespace trade_pilot::testing;

namespace {

class FakeHttpClient : public HttpClient {
public:
    std::map<std::string, HttpResponse> responses;
    std::chrono::milliseconds latency{0};

    Result<HttpResponse> perform(const HttpRequest& request,
                                 const CancellationToken*) const override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requested_.push_back(request.url);
        }
        if (latency.count() > 0) {
            std::this_thread::sleep_for(latency);
        }
        auto it = responses.find(request.url);
        if (it == responses.end()) {
            return make_error<HttpResponse>(ErrorCode::CONNECTION_ERROR, "unreachable",
                                            "FakeHttpClient");
        }
        return it->second;
    }

    std::vector<std::string> requested() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requested_;
    }

private:
    mutable std::mutex mutex_;
    mutable std::vector<std::string> requested_;
};

}  // namespace

class BinanceTickerFeedTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        http = std::make_shared<FakeHttpClient>();
        config.base_url = "https://api.test";
    }

    FeedConfig config;
    std::shared_ptr<FakeHttpClient> http;
};

TEST_F(BinanceTickerFeedTest, SymbolDropsSeparator) {
    EXPECT_EQ(BinanceTickerFeed::to_symbol("BTC/USDT"), "BTCUSDT");
    EXPECT_EQ(BinanceTickerFeed::to_symbol("SOLUSDT"), "SOLUSDT");
}

TEST_F(BinanceTickerFeedTest, UrlIncludesProxyPrefix) {
    BinanceTickerFeed direct(config, http);
    EXPECT_EQ(direct.ticker_url("ETH/USDT"),
              "https://api.test/api/v3/ticker/24hr?symbol=ETHUSDT");

    config.proxy_prefix = "https://proxy.local/?u=";
    BinanceTickerFeed proxied(config, http);
    EXPECT_EQ(proxied.ticker_url("ETH/USDT"),
              "https://proxy.local/?u=https://api.test/api/v3/ticker/24hr?symbol=ETHUSDT");
}

TEST_F(BinanceTickerFeedTest, ParsesStringAndNumericFields) {
    auto strings = BinanceTickerFeed::parse_ticker(
        R"({"symbol":"BTCUSDT","lastPrice":"96512.34","priceChangePercent":"-1.25"})");
    ASSERT_TRUE(strings.is_ok());
    EXPECT_DOUBLE_EQ(strings.value().price, 96512.34);
    EXPECT_DOUBLE_EQ(strings.value().pct_change_24h, -1.25);

    auto numbers = BinanceTickerFeed::parse_ticker(R"({"lastPrice":198.5,"priceChangePercent":0.4})");
    ASSERT_TRUE(numbers.is_ok());
    EXPECT_DOUBLE_EQ(numbers.value().price, 198.5);
}

TEST_F(BinanceTickerFeedTest, RejectsMalformedTickers) {
    EXPECT_EQ(BinanceTickerFeed::parse_ticker("not json").error()->code(),
              ErrorCode::JSON_PARSE_ERROR);
    EXPECT_EQ(BinanceTickerFeed::parse_ticker("[1,2]").error()->code(), ErrorCode::INVALID_DATA);
    EXPECT_EQ(BinanceTickerFeed::parse_ticker(R"({"priceChangePercent":"1"})").error()->code(),
              ErrorCode::INVALID_DATA);
    EXPECT_EQ(
        BinanceTickerFeed::parse_ticker(R"({"lastPrice":"abc","priceChangePercent":"1"})")
            .error()
            ->code(),
        ErrorCode::INVALID_DATA);
}

TEST_F(BinanceTickerFeedTest, PollCollectsEveryPair) {
    BinanceTickerFeed feed(config, http);
    http->responses[feed.ticker_url("BTC/USDT")] =
        HttpResponse{200, R"({"lastPrice":"97000","priceChangePercent":"1.5"})", 12};
    http->responses[feed.ticker_url("ETH/USDT")] =
        HttpResponse{200, R"({"lastPrice":"2700","priceChangePercent":"0.2"})", 14};

    auto snapshot = feed.poll({"BTC/USDT", "ETH/USDT"});
    ASSERT_TRUE(snapshot.is_ok());
    ASSERT_EQ(snapshot.value().size(), 2u);
    EXPECT_DOUBLE_EQ(snapshot.value().at("BTC/USDT").price, 97000.0);
    EXPECT_DOUBLE_EQ(snapshot.value().at("ETH/USDT").pct_change_24h, 0.2);
    EXPECT_EQ(http->requested().size(), 2u);
}

TEST_F(BinanceTickerFeedTest, AnyFailureFailsThePoll) {
    BinanceTickerFeed feed(config, http);
    http->responses[feed.ticker_url("BTC/USDT")] =
        HttpResponse{200, R"({"lastPrice":"97000","priceChangePercent":"1.5"})", 12};

    auto unreachable = feed.poll({"BTC/USDT", "ETH/USDT"});
    ASSERT_TRUE(unreachable.is_error());
    EXPECT_EQ(unreachable.error()->code(), ErrorCode::CONNECTION_ERROR);

    http->responses[feed.ticker_url("ETH/USDT")] = HttpResponse{429, "{}", 3};
    auto throttled = feed.poll({"BTC/USDT", "ETH/USDT"});
    ASSERT_TRUE(throttled.is_error());
    EXPECT_EQ(throttled.error()->code(), ErrorCode::MARKET_DATA_ERROR);
}

TEST_F(BinanceTickerFeedTest, PairsAreFetchedConcurrently) {
    BinanceTickerFeed feed(config, http);
    http->latency = std::chrono::milliseconds(300);
    for (const auto& pair : {"BTC/USDT", "ETH/USDT", "SOL/USDT"}) {
        http->responses[feed.ticker_url(pair)] =
            HttpResponse{200, R"({"lastPrice":"100","priceChangePercent":"0"})", 300};
    }

    auto start = std::chrono::steady_clock::now();
    auto snapshot = feed.poll({"BTC/USDT", "ETH/USDT", "SOL/USDT"});
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(snapshot.is_ok());
    EXPECT_EQ(snapshot.value().size(), 3u);
    EXPECT_EQ(http->requested().size(), 3u);
    EXPECT_LT(elapsed, std::chrono::milliseconds(800));
}
