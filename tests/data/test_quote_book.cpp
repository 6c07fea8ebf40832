#include <gtest/gtest.h>
#include <cmath>
#include "core/test_base.hpp"
#include "trade_pilot/data/quote_book.hpp"

using namespace trade_pilot;
using namespace trade_pilot::testing;

class QuoteBookTest : public TestBase {
protected:
    QuoteBook make_book(size_t history_limit = 100) {
        return QuoteBook(EngineConfig::default_assets(), history_limit, 42);
    }
};

TEST_F(QuoteBookTest, SeedsStartupQuotesAndHistories) {
    auto book = make_book();
    book.seed_defaults();

    EXPECT_DOUBLE_EQ(book.latest_price("BTC/USDT"), 96450.0);
    EXPECT_DOUBLE_EQ(book.latest_price("ETH/USDT"), 2680.0);
    EXPECT_DOUBLE_EQ(book.latest_price("SOL/USDT"), 198.5);
    EXPECT_DOUBLE_EQ(book.quote("SOL/USDT")->pct_change_24h, -0.15);

    auto history = book.history("BTC/USDT");
    ASSERT_EQ(history.size(), 60u);
    EXPECT_DOUBLE_EQ(history.front(), 96000.0);
    EXPECT_NEAR(history[10], 96000.0 + std::sin(1.0) * 200.0 + 150.0, 1e-9);
}

TEST_F(QuoteBookTest, UnknownPairSeedsFromReferencePrice) {
    QuoteBook book({{"DOGE/USDT", 0.04, 0.35, 0.01}}, 100, 7);
    book.seed_defaults();
    EXPECT_DOUBLE_EQ(book.latest_price("DOGE/USDT"), 0.35);
    EXPECT_TRUE(book.history("DOGE/USDT").empty());
}

TEST_F(QuoteBookTest, MissingPairReportsZero) {
    auto book = make_book();
    EXPECT_DOUBLE_EQ(book.latest_price("XRP/USDT"), 0.0);
    EXPECT_FALSE(book.quote("XRP/USDT").has_value());
    EXPECT_TRUE(book.history("XRP/USDT").empty());
}

TEST_F(QuoteBookTest, HistoryIsBounded) {
    auto book = make_book(5);
    for (int i = 1; i <= 20; ++i) {
        book.set_quote("ETH/USDT", 100.0 + i, 0.0);
    }
    auto history = book.history("ETH/USDT");
    ASSERT_EQ(history.size(), 6u);
    EXPECT_DOUBLE_EQ(history.front(), 115.0);
    EXPECT_DOUBLE_EQ(history.back(), 120.0);
}

TEST_F(QuoteBookTest, TimestampsStrictlyIncrease) {
    auto book = make_book();
    book.set_quote("BTC/USDT", 96000.0, 0.1);
    auto previous = book.quote("BTC/USDT")->timestamp;
    for (int i = 0; i < 50; ++i) {
        book.set_quote("BTC/USDT", 96000.0 + i, 0.1);
        auto current = book.quote("BTC/USDT")->timestamp;
        EXPECT_GT(current, previous);
        previous = current;
    }
}

TEST_F(QuoteBookTest, AppliesFeedSamples) {
    auto book = make_book();
    book.seed_defaults();
    TickerSnapshot samples;
    samples["BTC/USDT"] = TickerSample{97000.5, 2.5};
    book.apply_samples(samples);

    auto quote = book.quote("BTC/USDT");
    ASSERT_TRUE(quote.has_value());
    EXPECT_DOUBLE_EQ(quote->price, 97000.5);
    EXPECT_DOUBLE_EQ(quote->pct_change_24h, 2.5);
    EXPECT_FALSE(quote->synthetic);
    EXPECT_EQ(book.history("BTC/USDT").size(), 61u);
    EXPECT_DOUBLE_EQ(book.history("BTC/USDT").back(), 97000.5);
}

TEST_F(QuoteBookTest, SyntheticWalkStaysWithinStep) {
    auto book = make_book();
    book.seed_defaults();
    for (int i = 0; i < 200; ++i) {
        double before_btc = book.latest_price("BTC/USDT");
        double before_sol = book.latest_price("SOL/USDT");
        book.apply_synthetic_walk();
        EXPECT_LE(std::fabs(book.latest_price("BTC/USDT") - before_btc), 25.0);
        EXPECT_LE(std::fabs(book.latest_price("SOL/USDT") - before_sol), 2.5);
        EXPECT_GE(book.latest_price("SOL/USDT"), 0.0);
    }
    EXPECT_TRUE(book.quote("ETH/USDT")->synthetic);
    EXPECT_EQ(book.history("ETH/USDT").size(), 101u);
}

TEST_F(QuoteBookTest, SyntheticWalkNeverGoesNegative) {
    QuoteBook book({{"PENNY/USDT", 0.04, 0.01, 10.0}}, 100, 3);
    book.seed_defaults();
    for (int i = 0; i < 100; ++i) {
        book.apply_synthetic_walk();
        EXPECT_GE(book.latest_price("PENNY/USDT"), 0.0);
    }
}

TEST_F(QuoteBookTest, RejectsInvalidPrices) {
    auto book = make_book();
    book.set_quote("ETH/USDT", 2500.0, 0.0);
    book.set_quote("ETH/USDT", -1.0, 0.0);
    book.set_quote("ETH/USDT", std::nan(""), 0.0);
    EXPECT_DOUBLE_EQ(book.latest_price("ETH/USDT"), 2500.0);
    EXPECT_EQ(book.history("ETH/USDT").size(), 1u);
}

TEST_F(QuoteBookTest, RecordsLatency) {
    auto book = make_book();
    book.record_latency(183);
    EXPECT_EQ(book.latency_ms(), 183);
}
