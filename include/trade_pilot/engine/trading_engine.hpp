// include/trade_pilot/engine/trading_engine.hpp
#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>
#include "trade_pilot/advisory/advisory_service.hpp"
#include "trade_pilot/advisory/decision_pipeline.hpp"
#include "trade_pilot/core/engine_config.hpp"
#include "trade_pilot/core/error.hpp"
#include "trade_pilot/core/event_log.hpp"
#include "trade_pilot/core/state_manager.hpp"
#include "trade_pilot/core/types.hpp"
#include "trade_pilot/data/market_data_feed.hpp"
#include "trade_pilot/data/persistence_store.hpp"
#include "trade_pilot/data/quote_book.hpp"
#include "trade_pilot/engine/autopilot_scheduler.hpp"
#include "trade_pilot/engine/periodic_task.hpp"
#include "trade_pilot/engine/settlement_scheduler.hpp"
#include "trade_pilot/ledger/trade_ledger.hpp"
#include "trade_pilot/risk/risk_governor.hpp"

namespace trade_pilot {

/**
 * @brief Single owner of all mutable trading state
 *
 * Every command, read and tick handler runs under one mutex. Network calls
 * (feed polls and advisory requests) happen outside the lock and their
 * results are applied under it. Persistence is written after each mutation.
 */
class TradingEngine {
public:
    /**
     * @param config Engine configuration
     * @param feed Market data source, may be null to run on the synthetic walk only
     * @param advisory External advisory service, may be null to always fall back
     * @param store Persistence backend, may be null to keep state in memory
     * @param walk_seed Seed for the synthetic price walk
     */
    TradingEngine(EngineConfig config, std::shared_ptr<MarketDataFeed> feed,
                  std::shared_ptr<AdvisoryService> advisory,
                  std::shared_ptr<PersistenceStore> store,
                  uint32_t walk_seed = std::random_device{}());

    ~TradingEngine();

    TradingEngine(const TradingEngine&) = delete;
    TradingEngine& operator=(const TradingEngine&) = delete;

    /**
     * @brief Load persisted state and seed the quote book
     */
    Result<void> initialize();

    /**
     * @brief Launch the feed, autopilot and settlement tasks
     */
    Result<void> start();

    /**
     * @brief Cancel and join all periodic tasks
     */
    void stop();

    bool is_running() const;

    // Reads

    AccountMode mode() const;
    double balance() const;
    double balance(AccountMode mode) const;

    /**
     * @brief Trades of the active account mode
     */
    std::vector<Trade> active_trades() const;
    std::vector<Trade> all_trades() const;
    std::unordered_map<std::string, Quote> quotes() const;
    PriceHistory history(const std::string& pair) const;
    std::vector<EventLogEntry> events() const;
    std::optional<std::string> alert() const;
    SafetyState safety_state() const;
    RiskConfiguration risk_configuration() const;
    int64_t feed_latency_ms() const;
    std::optional<SessionInfo> session() const;

    // Commands

    /**
     * @brief Manual entry at the latest quote in the active mode
     * @return Trade, or DATA_NOT_FOUND (no quote), INSUFFICIENT_FUNDS, INVALID_ARGUMENT
     */
    Result<Trade> open_trade(const std::string& pair, Side side, Notional amount);

    /**
     * @brief Manual close at the latest quote
     * @return Settlement, or DATA_NOT_FOUND (unknown id or no quote), INVALID_ORDER (not open)
     */
    Result<Settlement> close_trade(const std::string& trade_id);

    void toggle_autopilot(bool enabled);

    /**
     * @brief Replace the risk configuration used for future trades
     * @return INVALID_ARGUMENT listing every rejected field
     */
    Result<void> update_risk_configuration(const RiskConfiguration& config);

    void dismiss_alert();
    void set_mode(AccountMode mode);
    void set_session(const SessionInfo& session);
    void clear_session();
    void clear_events();

    /**
     * @brief Advisory insight for a pair from the current quote and history
     *
     * Blocks for at most the advisory timeout; the engine lock is not held
     * while waiting.
     */
    Insight generate_insight(const std::string& pair);

    Audit audit_performance();

    // Tick handlers

    void refresh_market_data();
    AutopilotReport run_autopilot_tick();
    std::vector<Settlement> run_settlement_tick();

    static constexpr const char* kComponentId = "TRADING_ENGINE";

private:
    PersistedState default_state() const;
    void persist_unlocked();
    void update_component_state(ComponentState state);

    EngineConfig config_;
    std::shared_ptr<MarketDataFeed> feed_;
    std::shared_ptr<PersistenceStore> store_;

    std::shared_ptr<RiskGovernor> governor_;
    TradeLedger ledger_;
    QuoteBook quotes_;
    EventLog events_;
    DecisionPipeline pipeline_;
    AutopilotScheduler autopilot_;
    SettlementScheduler settlement_;
    RiskConfigValidator validator_;

    RiskConfiguration risk_;
    AccountMode mode_{AccountMode::TRIAL};
    std::optional<SessionInfo> session_;
    bool initialized_{false};

    std::unique_ptr<PeriodicTask> feed_task_;
    std::unique_ptr<PeriodicTask> autopilot_task_;
    std::unique_ptr<PeriodicTask> settlement_task_;

    mutable std::mutex mutex_;
    mutable std::mutex lifecycle_mutex_;
};

}  // namespace trade_pilot
