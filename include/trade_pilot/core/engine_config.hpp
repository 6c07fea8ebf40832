// include/trade_pilot/core/engine_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "trade_pilot/core/config_base.hpp"
#include "trade_pilot/core/error.hpp"
#include "trade_pilot/core/logger.hpp"
#include "trade_pilot/core/types.hpp"

namespace trade_pilot {

/**
 * @brief Risk parameters snapshotted into every trade at open time
 */
struct RiskConfiguration : public ConfigBase {
    double stop_loss_pct{2.0};         // Close when loss reaches this percent
    double take_profit_pct{5.0};       // Close when gain reaches this percent
    double max_drawdown_pct{15.0};     // Cumulative PnL limit as percent of balance
    double advisory_risk_pct{2.0};     // Percent of balance the autopilot may commit
    double advisory_max_position{50.0};  // Notional cap for a single autopilot entry

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["stop_loss_pct"] = stop_loss_pct;
        j["take_profit_pct"] = take_profit_pct;
        j["max_drawdown_pct"] = max_drawdown_pct;
        j["advisory_risk_pct"] = advisory_risk_pct;
        j["advisory_max_position"] = advisory_max_position;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("stop_loss_pct"))
            stop_loss_pct = j.at("stop_loss_pct").get<double>();
        if (j.contains("take_profit_pct"))
            take_profit_pct = j.at("take_profit_pct").get<double>();
        if (j.contains("max_drawdown_pct"))
            max_drawdown_pct = j.at("max_drawdown_pct").get<double>();
        if (j.contains("advisory_risk_pct"))
            advisory_risk_pct = j.at("advisory_risk_pct").get<double>();
        if (j.contains("advisory_max_position"))
            advisory_max_position = j.at("advisory_max_position").get<double>();
    }

    double advisory_risk_fraction() const {
        return advisory_risk_pct / 100.0;
    }

    bool operator==(const RiskConfiguration& other) const {
        return stop_loss_pct == other.stop_loss_pct &&
               take_profit_pct == other.take_profit_pct &&
               max_drawdown_pct == other.max_drawdown_pct &&
               advisory_risk_pct == other.advisory_risk_pct &&
               advisory_max_position == other.advisory_max_position;
    }

    bool operator!=(const RiskConfiguration& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Per-asset constants used by the feed fallback and the advisory fallback
 */
struct AssetProfile {
    std::string pair;
    double volatility{0.04};       // Fallback support/resistance band
    double reference_price{198.0};  // Used when no current price is known
    double walk_step{5.0};         // Synthetic random walk amplitude
};

struct SchedulerConfig : public ConfigBase {
    int feed_period_ms{8000};
    int autopilot_period_ms{10000};
    int settlement_period_ms{5000};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["feed_period_ms"] = feed_period_ms;
        j["autopilot_period_ms"] = autopilot_period_ms;
        j["settlement_period_ms"] = settlement_period_ms;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("feed_period_ms"))
            feed_period_ms = j.at("feed_period_ms").get<int>();
        if (j.contains("autopilot_period_ms"))
            autopilot_period_ms = j.at("autopilot_period_ms").get<int>();
        if (j.contains("settlement_period_ms"))
            settlement_period_ms = j.at("settlement_period_ms").get<int>();
    }
};

struct AdvisoryConfig : public ConfigBase {
    std::string endpoint{"http://localhost:8000/api/v1/advisory"};
    std::string api_key_env{"TRADE_PILOT_ADVISORY_KEY"};
    int timeout_ms{6500};
    size_t min_fallback_history{20};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["endpoint"] = endpoint;
        j["api_key_env"] = api_key_env;
        j["timeout_ms"] = timeout_ms;
        j["min_fallback_history"] = min_fallback_history;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("endpoint"))
            endpoint = j.at("endpoint").get<std::string>();
        if (j.contains("api_key_env"))
            api_key_env = j.at("api_key_env").get<std::string>();
        if (j.contains("timeout_ms"))
            timeout_ms = j.at("timeout_ms").get<int>();
        if (j.contains("min_fallback_history"))
            min_fallback_history = j.at("min_fallback_history").get<size_t>();
    }
};

struct FeedConfig : public ConfigBase {
    std::string base_url{"https://api.binance.com"};
    std::string proxy_prefix;  // Prepended to every request URL when non-empty
    int request_timeout_ms{4000};
    size_t history_limit{100};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["base_url"] = base_url;
        j["proxy_prefix"] = proxy_prefix;
        j["request_timeout_ms"] = request_timeout_ms;
        j["history_limit"] = history_limit;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("base_url"))
            base_url = j.at("base_url").get<std::string>();
        if (j.contains("proxy_prefix"))
            proxy_prefix = j.at("proxy_prefix").get<std::string>();
        if (j.contains("request_timeout_ms"))
            request_timeout_ms = j.at("request_timeout_ms").get<int>();
        if (j.contains("history_limit"))
            history_limit = j.at("history_limit").get<size_t>();
    }
};

struct AutopilotConfig : public ConfigBase {
    size_t min_history{50};
    double min_notional{10.0};
    int max_consecutive_losses{3};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["min_history"] = min_history;
        j["min_notional"] = min_notional;
        j["max_consecutive_losses"] = max_consecutive_losses;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("min_history"))
            min_history = j.at("min_history").get<size_t>();
        if (j.contains("min_notional"))
            min_notional = j.at("min_notional").get<double>();
        if (j.contains("max_consecutive_losses"))
            max_consecutive_losses = j.at("max_consecutive_losses").get<int>();
    }
};

/**
 * @brief Top-level engine configuration
 */
struct EngineConfig : public ConfigBase {
    RiskConfiguration risk;
    SchedulerConfig scheduler;
    AdvisoryConfig advisory;
    FeedConfig feed;
    AutopilotConfig autopilot;
    LoggerConfig logging;
    std::vector<AssetProfile> assets{default_assets()};
    double initial_trial_balance{10000.00};
    double initial_live_balance{2450.75};
    std::string state_file{"trade_pilot_state.json"};

    static std::vector<AssetProfile> default_assets() {
        return {{"BTC/USDT", 0.02, 96500.0, 50.0},
                {"ETH/USDT", 0.04, 2650.0, 5.0},
                {"SOL/USDT", 0.04, 198.0, 5.0}};
    }

    std::vector<std::string> tracked_pairs() const;

    /**
     * @brief Profile for a pair; unknown pairs get the generic profile
     */
    AssetProfile profile_for(const std::string& pair) const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Configuration validation error
 */
struct ConfigValidationError {
    std::string field;
    std::string message;
};

/**
 * @brief Validator for risk configuration updates
 */
class RiskConfigValidator {
public:
    std::vector<ConfigValidationError> validate(const RiskConfiguration& config) const;

    /**
     * @brief Validate and fold all errors into a single Result
     */
    Result<void> check(const RiskConfiguration& config) const;

private:
    void validate_percent(double value, const std::string& field, bool allow_zero,
                          std::vector<ConfigValidationError>& errors) const;
};

}  // namespace trade_pilot
