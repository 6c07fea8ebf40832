// src/engine/trading_engine.cpp
#include "trade_pilot/engine/trading_engine.hpp"
#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>
#include "trade_pilot/core/logger.hpp"

namespace trade_pilot {

TradingEngine::TradingEngine(EngineConfig config, std::shared_ptr<MarketDataFeed> feed,
                             std::shared_ptr<AdvisoryService> advisory,
                             std::shared_ptr<PersistenceStore> store, uint32_t walk_seed)
    : config_(std::move(config)),
      feed_(std::move(feed)),
      store_(std::move(store)),
      governor_(std::make_shared<RiskGovernor>(config_.autopilot.max_consecutive_losses)),
      ledger_(AccountBalances{config_.initial_trial_balance, config_.initial_live_balance},
              governor_),
      quotes_(config_.assets, config_.feed.history_limit, walk_seed),
      events_(50),
      pipeline_(std::move(advisory), config_.advisory, config_.assets),
      autopilot_(config_.autopilot),
      risk_(config_.risk) {}

TradingEngine::~TradingEngine() {
    stop();
    auto result = StateManager::instance().unregister_component(kComponentId);
    if (result.is_error()) {
        DEBUG("Engine was not registered: " << result.error()->what());
    }
}

Result<void> TradingEngine::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        return Result<void>();
    }

    auto check = validator_.check(config_.risk);
    if (check.is_error()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                std::string("Configured risk settings rejected: ") +
                                    check.error()->what(),
                                "TradingEngine");
    }

    ComponentInfo info{ComponentType::ENGINE, ComponentState::INITIALIZED, kComponentId, "",
                       std::chrono::system_clock::now(), {}};
    auto registered = StateManager::instance().register_component(info);
    if (registered.is_error()) {
        return make_error<void>(registered.error()->code(), registered.error()->what(),
                                "TradingEngine");
    }

    PersistedState state = default_state();
    if (store_) {
        auto loaded = store_->load(state);
        if (loaded.is_ok()) {
            state = loaded.value();
        } else {
            WARN("Persisted state unavailable, using defaults: "
                 << loaded.error()->to_string());
        }
    }

    auto restored_risk = validator_.check(state.risk);
    if (restored_risk.is_error()) {
        WARN("Restored risk settings rejected, using configured values: "
             << restored_risk.error()->what());
        state.risk = config_.risk;
    }

    ledger_.restore(state.trades, state.balances);
    risk_ = state.risk;
    session_ = state.session;
    quotes_.seed_defaults();
    initialized_ = true;

    events_.append("System initialized in " + account_mode_to_string(mode_) + " mode",
                   EventKind::INFO);
    INFO("Engine initialized with " << config_.assets.size() << " pairs");
    return Result<void>();
}

Result<void> TradingEngine::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_) {
            return make_error<void>(ErrorCode::NOT_INITIALIZED,
                                    "Engine must be initialized before start",
                                    "TradingEngine");
        }
    }
    if (feed_task_ && feed_task_->is_running()) {
        return Result<void>();
    }

    // Quotes are fresh before the first autopilot or settlement tick
    refresh_market_data();

    const auto& scheduler = config_.scheduler;
    feed_task_ = std::make_unique<PeriodicTask>(
        "FEED_TASK", std::chrono::milliseconds(scheduler.feed_period_ms),
        [this]() { refresh_market_data(); });
    autopilot_task_ = std::make_unique<PeriodicTask>(
        "AUTOPILOT_TASK", std::chrono::milliseconds(scheduler.autopilot_period_ms),
        [this]() { run_autopilot_tick(); });
    settlement_task_ = std::make_unique<PeriodicTask>(
        "SETTLEMENT_TASK", std::chrono::milliseconds(scheduler.settlement_period_ms),
        [this]() { run_settlement_tick(); });

    for (auto* task : {feed_task_.get(), autopilot_task_.get(), settlement_task_.get()}) {
        auto started = task->start();
        if (started.is_error()) {
            ERROR("Failed to start " << task->name() << ": " << started.error()->to_string());
            feed_task_->stop();
            autopilot_task_->stop();
            settlement_task_->stop();
            update_component_state(ComponentState::ERR_STATE);
            return make_error<void>(started.error()->code(), started.error()->what(),
                                    "TradingEngine");
        }
    }

    auto current = StateManager::instance().get_state(kComponentId);
    if (current.is_ok() && current.value().state == ComponentState::STOPPED) {
        update_component_state(ComponentState::INITIALIZED);
    }
    update_component_state(ComponentState::RUNNING);
    INFO("Engine started");
    return Result<void>();
}

void TradingEngine::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!feed_task_) {
        return;
    }
    // Stop as a unit; each stop() joins its worker
    feed_task_->stop();
    autopilot_task_->stop();
    settlement_task_->stop();
    feed_task_.reset();
    autopilot_task_.reset();
    settlement_task_.reset();

    update_component_state(ComponentState::STOPPED);
    INFO("Engine stopped");
}

bool TradingEngine::is_running() const {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    return feed_task_ && feed_task_->is_running();
}

AccountMode TradingEngine::mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_;
}

double TradingEngine::balance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.balance(mode_);
}

double TradingEngine::balance(AccountMode mode) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.balance(mode);
}

std::vector<Trade> TradingEngine::active_trades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.trades_for_mode(mode_);
}

std::vector<Trade> TradingEngine::all_trades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.all_trades();
}

std::unordered_map<std::string, Quote> TradingEngine::quotes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return quotes_.quotes();
}

PriceHistory TradingEngine::history(const std::string& pair) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return quotes_.history(pair);
}

std::vector<EventLogEntry> TradingEngine::events() const {
    return events_.entries();
}

std::optional<std::string> TradingEngine::alert() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return governor_->state().alert;
}

SafetyState TradingEngine::safety_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return governor_->state();
}

RiskConfiguration TradingEngine::risk_configuration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return risk_;
}

int64_t TradingEngine::feed_latency_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return quotes_.latency_ms();
}

std::optional<SessionInfo> TradingEngine::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

Result<Trade> TradingEngine::open_trade(const std::string& pair, Side side, Notional amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    Price price = quotes_.latest_price(pair);
    if (price <= 0.0) {
        return make_error<Trade>(ErrorCode::DATA_NOT_FOUND, "No quote available for " + pair,
                                 "TradingEngine");
    }
    double available = ledger_.balance(mode_);
    if (std::isfinite(amount) && amount > available) {
        return make_error<Trade>(ErrorCode::INSUFFICIENT_FUNDS,
                                 "Amount " + std::to_string(amount) + " exceeds " +
                                     account_mode_to_string(mode_) + " balance " +
                                     std::to_string(available),
                                 "TradingEngine");
    }

    auto trade = ledger_.open(pair, side, amount, price, risk_, mode_);
    if (trade.is_error()) {
        return trade;
    }
    events_.append("Order Executed: " + side_to_string(side) + " " + pair + " (" +
                       account_mode_to_string(mode_) + ")",
                   EventKind::SUCCESS);
    persist_unlocked();
    return trade;
}

Result<Settlement> TradingEngine::close_trade(const std::string& trade_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto trade = ledger_.find(trade_id);
    if (!trade) {
        return make_error<Settlement>(ErrorCode::DATA_NOT_FOUND, "Unknown trade " + trade_id,
                                      "TradingEngine");
    }
    if (!trade->is_open()) {
        return make_error<Settlement>(ErrorCode::INVALID_ORDER,
                                      "Trade " + trade_id + " is already closed",
                                      "TradingEngine");
    }
    Price price = quotes_.latest_price(trade->pair);
    if (price <= 0.0) {
        return make_error<Settlement>(ErrorCode::DATA_NOT_FOUND,
                                      "No quote available for " + trade->pair, "TradingEngine");
    }

    auto settlement = ledger_.manual_close(trade_id, price);
    if (!settlement) {
        return make_error<Settlement>(ErrorCode::INVALID_ORDER,
                                      "Trade " + trade_id + " could not be closed",
                                      "TradingEngine");
    }
    events_.append("Manual Override: Closed " + trade->pair + " | Final PnL: " +
                       format_pnl(settlement->pnl_value),
                   settlement->pnl_value >= 0.0 ? EventKind::SUCCESS : EventKind::WARNING);
    persist_unlocked();
    return *settlement;
}

void TradingEngine::toggle_autopilot(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (governor_->autopilot_enabled() == enabled) {
        return;
    }
    governor_->set_autopilot(enabled);
    events_.append(enabled ? "Autopilot engaged" : "Autopilot disengaged", EventKind::INFO);
}

Result<void> TradingEngine::update_risk_configuration(const RiskConfiguration& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto check = validator_.check(config);
    if (check.is_error()) {
        WARN("Risk configuration rejected: " << check.error()->what());
        return check;
    }

    risk_ = config;
    if (config == RiskConfiguration{}) {
        events_.append("Risk Protocol Reset: Factory Defaults Applied", EventKind::WARNING);
    } else {
        events_.append("Risk configuration updated", EventKind::INFO);
    }
    persist_unlocked();
    return Result<void>();
}

void TradingEngine::dismiss_alert() {
    std::lock_guard<std::mutex> lock(mutex_);
    governor_->dismiss_alert();
}

void TradingEngine::set_mode(AccountMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mode_ == mode) {
        return;
    }
    mode_ = mode;
    events_.append("Switched to " + account_mode_to_string(mode) + " mode", EventKind::INFO);
}

void TradingEngine::set_session(const SessionInfo& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_ = session;
    persist_unlocked();
}

void TradingEngine::clear_session() {
    std::lock_guard<std::mutex> lock(mutex_);
    session_.reset();
    persist_unlocked();
}

void TradingEngine::clear_events() {
    events_.clear();
}

Insight TradingEngine::generate_insight(const std::string& pair) {
    std::optional<Price> price;
    std::optional<double> change;
    PriceHistory history;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto quote = quotes_.quote(pair);
        if (quote && quote->price > 0.0) {
            price = quote->price;
            change = quote->pct_change_24h;
        }
        history = quotes_.history(pair);
    }

    Insight insight = pipeline_.generate_insight(pair, price, change, history);

    std::ostringstream oss;
    oss << "Insight " << pair << ": " << signal_action_to_string(insight.action) << " ("
        << std::fixed << std::setprecision(0) << insight.confidence << "%) ["
        << provenance_to_string(insight.provenance) << "]";
    events_.append(oss.str(), EventKind::ADVISORY);
    return insight;
}

Audit TradingEngine::audit_performance() {
    std::vector<Trade> trades;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        trades = ledger_.all_trades();
    }
    Audit audit = pipeline_.audit_performance(trades);
    events_.append("Performance audit: rating " + audit.rating + " [" +
                       provenance_to_string(audit.provenance) + "]",
                   EventKind::ADVISORY);
    return audit;
}

void TradingEngine::refresh_market_data() {
    std::vector<std::string> pairs = config_.tracked_pairs();

    std::optional<TickerSnapshot> snapshot;
    auto started = std::chrono::steady_clock::now();
    if (feed_) {
        auto polled = feed_->poll(pairs);
        if (polled.is_ok()) {
            snapshot = polled.value();
        } else {
            WARN("Feed poll failed, using synthetic walk: " << polled.error()->to_string());
        }
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - started)
                       .count();

    std::lock_guard<std::mutex> lock(mutex_);
    if (snapshot) {
        quotes_.apply_samples(*snapshot);
        quotes_.record_latency(latency);
    } else {
        quotes_.apply_synthetic_walk();
    }
}

AutopilotReport TradingEngine::run_autopilot_tick() {
    std::lock_guard<std::mutex> lock(mutex_);
    AutopilotReport report =
        autopilot_.tick(ledger_, *governor_, quotes_, risk_, mode_, events_);
    if (!report.opened.empty()) {
        persist_unlocked();
    }
    return report;
}

std::vector<Settlement> TradingEngine::run_settlement_tick() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto settled = settlement_.tick(ledger_, quotes_, events_);
    if (!settled.empty()) {
        persist_unlocked();
    }
    return settled;
}

PersistedState TradingEngine::default_state() const {
    PersistedState state;
    state.risk = config_.risk;
    state.balances = AccountBalances{config_.initial_trial_balance, config_.initial_live_balance};
    return state;
}

void TradingEngine::persist_unlocked() {
    if (!store_) {
        return;
    }
    PersistedState state;
    state.trades = ledger_.all_trades();
    state.risk = risk_;
    state.balances = ledger_.balances();
    state.session = session_;

    auto saved = store_->save(state);
    if (saved.is_error()) {
        ERROR("Failed to persist state: " << saved.error()->to_string());
    }
}

void TradingEngine::update_component_state(ComponentState state) {
    auto result = StateManager::instance().update_state(kComponentId, state);
    if (result.is_error()) {
        WARN("Engine state update failed: " << result.error()->what());
    }
}

}  // namespace trade_pilot
