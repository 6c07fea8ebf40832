#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <thread>
#include "engine/test_utils.hpp"
#include "trade_pilot/engine/trading_engine.hpp"

using namespace trade_pilot;
using namespace trade_pilot::testing;
using namespace std::chrono_literals;
using ::testing::Contains;

namespace {

class ScriptedFeed : public MarketDataFeed {
public:
    Result<TickerSnapshot> poll(const std::vector<std::string>&) override {
        polls++;
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_) {
            return make_error<TickerSnapshot>(ErrorCode::CONNECTION_ERROR, "feed offline",
                                              "ScriptedFeed");
        }
        return snapshot_;
    }

    void set_price(const std::string& pair, Price price, double change = 0.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot_[pair] = TickerSample{price, change};
    }

    void set_failing(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_ = fail;
    }

    std::atomic<int> polls{0};

private:
    std::mutex mutex_;
    TickerSnapshot snapshot_;
    bool fail_{false};
};

class FixedStore : public PersistenceStore {
public:
    explicit FixedStore(PersistedState state) : state_(std::move(state)) {}

    Result<PersistedState> load(const PersistedState&) override {
        return state_;
    }

    Result<void> save(const PersistedState&) override {
        return Result<void>();
    }

private:
    PersistedState state_;
};

}  // namespace

class TradingEngineTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        feed = std::make_shared<ScriptedFeed>();
        engine = std::make_unique<TradingEngine>(config, feed, nullptr, nullptr, 17);
        ASSERT_TRUE(engine->initialize().is_ok());
    }

    void TearDown() override {
        engine.reset();
        TestBase::TearDown();
    }

    bool has_event(const std::string& message) const {
        for (const auto& entry : engine->events()) {
            if (entry.message == message) {
                return true;
            }
        }
        return false;
    }

    void move_market(Price btc, Price eth, Price sol) {
        feed->set_price("BTC/USDT", btc);
        feed->set_price("ETH/USDT", eth);
        feed->set_price("SOL/USDT", sol);
        engine->refresh_market_data();
    }

    EngineConfig config;
    std::shared_ptr<ScriptedFeed> feed;
    std::unique_ptr<TradingEngine> engine;
};

TEST_F(TradingEngineTest, InitializesWithDefaults) {
    EXPECT_EQ(engine->mode(), AccountMode::TRIAL);
    EXPECT_DOUBLE_EQ(engine->balance(), 10000.0);
    EXPECT_DOUBLE_EQ(engine->balance(AccountMode::LIVE), 2450.75);
    EXPECT_TRUE(engine->all_trades().empty());
    EXPECT_DOUBLE_EQ(engine->quotes().at("BTC/USDT").price, 96450.0);
    EXPECT_EQ(engine->history("ETH/USDT").size(), 60u);
    EXPECT_TRUE(has_event("System initialized in TRIAL mode"));
    EXPECT_FALSE(engine->safety_state().autopilot_enabled);

    auto state = StateManager::instance().get_state(TradingEngine::kComponentId);
    ASSERT_TRUE(state.is_ok());
    EXPECT_EQ(state.value().state, ComponentState::INITIALIZED);
}

TEST_F(TradingEngineTest, ManualOpenAndClose) {
    auto opened = engine->open_trade("BTC/USDT", Side::BUY, 1000.0);
    ASSERT_TRUE(opened.is_ok());
    EXPECT_DOUBLE_EQ(opened.value().entry_price, 96450.0);
    EXPECT_DOUBLE_EQ(engine->balance(), 9000.0);
    EXPECT_TRUE(has_event("Order Executed: BUY BTC/USDT (TRIAL)"));

    move_market(97414.5, 2680.0, 198.5);  // BTC +1%
    auto closed = engine->close_trade(opened.value().id);
    ASSERT_TRUE(closed.is_ok());
    EXPECT_TRUE(closed.value().manual);
    EXPECT_NEAR(closed.value().pnl_value, 10.0, 1e-6);
    EXPECT_NEAR(engine->balance(), 10010.0, 1e-6);
    EXPECT_TRUE(has_event("Manual Override: Closed BTC/USDT | Final PnL: +$10.00"));

    auto again = engine->close_trade(opened.value().id);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error()->code(), ErrorCode::INVALID_ORDER);
}

TEST_F(TradingEngineTest, ManualOpenValidation) {
    auto too_big = engine->open_trade("BTC/USDT", Side::BUY, 20000.0);
    ASSERT_TRUE(too_big.is_error());
    EXPECT_EQ(too_big.error()->code(), ErrorCode::INSUFFICIENT_FUNDS);

    auto unknown = engine->open_trade("XRP/USDT", Side::BUY, 10.0);
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error()->code(), ErrorCode::DATA_NOT_FOUND);

    auto zero = engine->open_trade("BTC/USDT", Side::BUY, 0.0);
    ASSERT_TRUE(zero.is_error());
    EXPECT_EQ(zero.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto missing = engine->close_trade("no-such-trade");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::DATA_NOT_FOUND);

    EXPECT_DOUBLE_EQ(engine->balance(), 10000.0);
    EXPECT_TRUE(engine->all_trades().empty());
}

TEST_F(TradingEngineTest, ModesAreIsolated) {
    engine->set_mode(AccountMode::LIVE);
    EXPECT_TRUE(has_event("Switched to LIVE mode"));
    ASSERT_TRUE(engine->open_trade("SOL/USDT", Side::BUY, 450.75).is_ok());
    EXPECT_NEAR(engine->balance(), 2000.0, 1e-9);
    EXPECT_EQ(engine->active_trades().size(), 1u);

    engine->set_mode(AccountMode::TRIAL);
    EXPECT_DOUBLE_EQ(engine->balance(), 10000.0);
    EXPECT_TRUE(engine->active_trades().empty());
    EXPECT_EQ(engine->all_trades().size(), 1u);
}

TEST_F(TradingEngineTest, SettlementTickClosesStopLoss) {
    auto opened = engine->open_trade("BTC/USDT", Side::BUY, 1000.0);
    ASSERT_TRUE(opened.is_ok());

    move_market(96450.0 * 0.97, 2680.0, 198.5);
    auto settled = engine->run_settlement_tick();
    ASSERT_EQ(settled.size(), 1u);
    EXPECT_NEAR(settled[0].pnl_value, -30.0, 1e-6);
    EXPECT_NEAR(engine->balance(), 9970.0, 1e-6);
    EXPECT_THAT(engine->events(),
                Contains(HasEvent("Trade Closed: BTC/USDT | PnL: -$30.00", EventKind::WARNING)));
    EXPECT_EQ(engine->safety_state().consecutive_losses, 1);
}

TEST_F(TradingEngineTest, AutopilotOpensOnSeededTrend) {
    engine->toggle_autopilot(true);
    EXPECT_TRUE(has_event("Autopilot engaged"));

    auto report = engine->run_autopilot_tick();
    EXPECT_TRUE(report.evaluated);
    EXPECT_EQ(report.opened.size(), 3u);
    EXPECT_DOUBLE_EQ(engine->balance(), 9850.0);
    EXPECT_TRUE(has_event("AUTOPILOT: Opening LONG position on ETH/USDT"));

    engine->toggle_autopilot(false);
    EXPECT_TRUE(has_event("Autopilot disengaged"));
    EXPECT_FALSE(engine->run_autopilot_tick().evaluated);
}

TEST_F(TradingEngineTest, KillSwitchAfterConsecutiveLosses) {
    std::vector<std::string> ids;
    for (const auto& pair : {"BTC/USDT", "ETH/USDT", "SOL/USDT"}) {
        auto opened = engine->open_trade(pair, Side::BUY, 100.0);
        ASSERT_TRUE(opened.is_ok());
        ids.push_back(opened.value().id);
    }
    move_market(95000.0, 2600.0, 190.0);
    for (const auto& id : ids) {
        ASSERT_TRUE(engine->close_trade(id).is_ok());
    }

    engine->toggle_autopilot(true);
    auto report = engine->run_autopilot_tick();
    EXPECT_EQ(report.gate.status, GateStatus::CONSECUTIVE_LOSSES);
    EXPECT_TRUE(report.opened.empty());
    ASSERT_TRUE(engine->alert().has_value());
    EXPECT_EQ(*engine->alert(), "SAFETY TRIGGERED: max consecutive losses reached (3)");
    EXPECT_FALSE(engine->safety_state().autopilot_enabled);

    double cumulative = engine->safety_state().cumulative_pnl;
    engine->dismiss_alert();
    EXPECT_FALSE(engine->alert().has_value());
    EXPECT_EQ(engine->safety_state().consecutive_losses, 0);
    EXPECT_DOUBLE_EQ(engine->safety_state().cumulative_pnl, cumulative);
}

TEST_F(TradingEngineTest, RiskConfigurationUpdates) {
    RiskConfiguration invalid;
    invalid.stop_loss_pct = -1.0;
    auto rejected = engine->update_risk_configuration(invalid);
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_DOUBLE_EQ(engine->risk_configuration().stop_loss_pct, 2.0);

    RiskConfiguration tighter;
    tighter.stop_loss_pct = 1.0;
    ASSERT_TRUE(engine->update_risk_configuration(tighter).is_ok());
    EXPECT_TRUE(has_event("Risk configuration updated"));
    auto opened = engine->open_trade("ETH/USDT", Side::BUY, 100.0);
    ASSERT_TRUE(opened.is_ok());
    EXPECT_DOUBLE_EQ(opened.value().stop_loss_pct, 1.0);

    ASSERT_TRUE(engine->update_risk_configuration(RiskConfiguration{}).is_ok());
    EXPECT_THAT(engine->events(), Contains(HasEvent("Risk Protocol Reset: Factory Defaults Applied",
                                                    EventKind::WARNING)));
    // Open trades keep their snapshot
    EXPECT_DOUBLE_EQ(engine->all_trades().front().stop_loss_pct, 1.0);
}

TEST_F(TradingEngineTest, FeedFailureFallsBackToSyntheticWalk) {
    move_market(97000.0, 2700.0, 200.0);
    EXPECT_FALSE(engine->quotes().at("BTC/USDT").synthetic);
    EXPECT_DOUBLE_EQ(engine->quotes().at("BTC/USDT").price, 97000.0);

    feed->set_failing(true);
    engine->refresh_market_data();
    auto quote = engine->quotes().at("BTC/USDT");
    EXPECT_TRUE(quote.synthetic);
    EXPECT_LE(std::abs(quote.price - 97000.0), 25.0);
    EXPECT_EQ(engine->history("BTC/USDT").size(), 62u);
}

TEST_F(TradingEngineTest, InsightAndAuditWithoutAdvisoryService) {
    auto insight = engine->generate_insight("BTC/USDT");
    EXPECT_EQ(insight.provenance, Provenance::FALLBACK);
    EXPECT_EQ(insight.pair, "BTC/USDT");
    auto last = engine->events().back();
    EXPECT_EQ(last.kind, EventKind::ADVISORY);
    EXPECT_EQ(last.message.rfind("Insight BTC/USDT: ", 0), 0u);

    auto audit = engine->audit_performance();
    EXPECT_EQ(audit.rating, "C");
    EXPECT_THAT(engine->events(), Contains(HasEventMessage("Performance audit: rating C [FALLBACK]")));
}

TEST_F(TradingEngineTest, SessionAndEvents) {
    engine->set_session(SessionInfo{"u-7", "Desk", "desk@example.com", "trader"});
    ASSERT_TRUE(engine->session().has_value());
    EXPECT_EQ(engine->session()->name, "Desk");
    engine->clear_session();
    EXPECT_FALSE(engine->session().has_value());

    engine->clear_events();
    EXPECT_TRUE(engine->events().empty());
}

TEST_F(TradingEngineTest, StartRequiresInitialize) {
    engine.reset();
    TradingEngine fresh(config, nullptr, nullptr, nullptr, 3);
    auto started = fresh.start();
    ASSERT_TRUE(started.is_error());
    EXPECT_EQ(started.error()->code(), ErrorCode::NOT_INITIALIZED);
}

TEST_F(TradingEngineTest, PeriodicTasksDriveTheEngine) {
    engine.reset();
    config.scheduler.feed_period_ms = 10;
    config.scheduler.autopilot_period_ms = 10;
    config.scheduler.settlement_period_ms = 10;
    engine = std::make_unique<TradingEngine>(config, feed, nullptr, nullptr, 5);
    ASSERT_TRUE(engine->initialize().is_ok());
    feed->set_price("BTC/USDT", 96500.0);

    ASSERT_TRUE(engine->start().is_ok());
    EXPECT_TRUE(engine->is_running());
    EXPECT_EQ(StateManager::instance().get_state(TradingEngine::kComponentId).value().state,
              ComponentState::RUNNING);

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (feed->polls.load() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_GE(feed->polls.load(), 3);

    engine->stop();
    EXPECT_FALSE(engine->is_running());
    EXPECT_EQ(StateManager::instance().get_state(TradingEngine::kComponentId).value().state,
              ComponentState::STOPPED);
    int polls_after_stop = feed->polls.load();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(feed->polls.load(), polls_after_stop);

    ASSERT_TRUE(engine->start().is_ok());
    EXPECT_TRUE(engine->is_running());
    engine->stop();
}

TEST_F(TradingEngineTest, StateSurvivesRestart) {
    engine.reset();
    auto dir = std::filesystem::temp_directory_path() / "trade_pilot_engine_test";
    std::filesystem::remove_all(dir);
    auto store = std::make_shared<JsonFileStore>((dir / "state.json").string());

    std::string trade_id;
    {
        TradingEngine first(config, nullptr, nullptr, store, 1);
        ASSERT_TRUE(first.initialize().is_ok());
        auto opened = first.open_trade("ETH/USDT", Side::BUY, 500.0);
        ASSERT_TRUE(opened.is_ok());
        trade_id = opened.value().id;
        RiskConfiguration risk;
        risk.take_profit_pct = 7.5;
        ASSERT_TRUE(first.update_risk_configuration(risk).is_ok());
    }

    TradingEngine second(config, nullptr, nullptr, store, 2);
    ASSERT_TRUE(second.initialize().is_ok());
    EXPECT_DOUBLE_EQ(second.balance(), 9500.0);
    ASSERT_EQ(second.all_trades().size(), 1u);
    EXPECT_EQ(second.all_trades().front().id, trade_id);
    EXPECT_TRUE(second.all_trades().front().is_open());
    EXPECT_DOUBLE_EQ(second.risk_configuration().take_profit_pct, 7.5);
    // Safety counters are session-scoped
    EXPECT_EQ(second.safety_state().consecutive_losses, 0);

    std::filesystem::remove_all(dir);
}

TEST_F(TradingEngineTest, OutOfRangeStoredRiskDoesNotSettleAtEntry) {
    engine.reset();
    auto dir = std::filesystem::temp_directory_path() / "trade_pilot_engine_risk_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    {
        std::ofstream file(dir / "state.json");
        file << R"({"risk":{"stop_loss_pct":-5,"take_profit_pct":0}})";
    }

    TradingEngine restored(config, nullptr, nullptr,
                           std::make_shared<JsonFileStore>((dir / "state.json").string()), 3);
    ASSERT_TRUE(restored.initialize().is_ok());
    EXPECT_DOUBLE_EQ(restored.risk_configuration().stop_loss_pct, config.risk.stop_loss_pct);
    EXPECT_DOUBLE_EQ(restored.risk_configuration().take_profit_pct, config.risk.take_profit_pct);

    ASSERT_TRUE(restored.open_trade("BTC/USDT", Side::BUY, 100.0).is_ok());
    EXPECT_TRUE(restored.run_settlement_tick().empty());
    EXPECT_TRUE(restored.all_trades().front().is_open());

    std::filesystem::remove_all(dir);
}

TEST_F(TradingEngineTest, RejectsInvalidRiskFromAnyStore) {
    engine.reset();
    PersistedState stored;
    stored.risk.stop_loss_pct = -5.0;
    stored.risk.take_profit_pct = 0.0;
    stored.balances = AccountBalances{config.initial_trial_balance, config.initial_live_balance};

    TradingEngine restored(config, nullptr, nullptr, std::make_shared<FixedStore>(stored), 4);
    ASSERT_TRUE(restored.initialize().is_ok());
    EXPECT_TRUE(RiskConfigValidator().check(restored.risk_configuration()).is_ok());
    EXPECT_DOUBLE_EQ(restored.risk_configuration().stop_loss_pct, config.risk.stop_loss_pct);
}

TEST_F(TradingEngineTest, StartRefreshesQuotesImmediately) {
    config.scheduler.feed_period_ms = 60000;
    config.scheduler.autopilot_period_ms = 60000;
    config.scheduler.settlement_period_ms = 60000;
    engine = std::make_unique<TradingEngine>(config, feed, nullptr, nullptr, 5);
    ASSERT_TRUE(engine->initialize().is_ok());
    feed->set_price("BTC/USDT", 97123.0, 1.1);
    feed->set_price("ETH/USDT", 2701.0);
    feed->set_price("SOL/USDT", 201.0);

    int before = feed->polls.load();
    ASSERT_TRUE(engine->start().is_ok());
    EXPECT_EQ(feed->polls.load(), before + 1);
    EXPECT_DOUBLE_EQ(engine->quotes().at("BTC/USDT").price, 97123.0);
    engine->stop();
}
