// src/core/engine_config.cpp
#include "trade_pilot/core/engine_config.hpp"
#include <cmath>
#include <sstream>

namespace trade_pilot {

std::vector<std::string> EngineConfig::tracked_pairs() const {
    std::vector<std::string> pairs;
    pairs.reserve(assets.size());
    for (const auto& asset : assets) {
        pairs.push_back(asset.pair);
    }
    return pairs;
}

AssetProfile EngineConfig::profile_for(const std::string& pair) const {
    for (const auto& asset : assets) {
        if (asset.pair == pair) {
            return asset;
        }
    }
    AssetProfile generic;
    generic.pair = pair;
    return generic;
}

nlohmann::json EngineConfig::to_json() const {
    nlohmann::json j;
    j["risk"] = risk.to_json();
    j["scheduler"] = scheduler.to_json();
    j["advisory"] = advisory.to_json();
    j["feed"] = feed.to_json();
    j["autopilot"] = autopilot.to_json();
    j["logging"] = logging.to_json();

    nlohmann::json assets_json = nlohmann::json::array();
    for (const auto& asset : assets) {
        assets_json.push_back({{"pair", asset.pair},
                               {"volatility", asset.volatility},
                               {"reference_price", asset.reference_price},
                               {"walk_step", asset.walk_step}});
    }
    j["assets"] = assets_json;
    j["initial_trial_balance"] = initial_trial_balance;
    j["initial_live_balance"] = initial_live_balance;
    j["state_file"] = state_file;
    return j;
}

void EngineConfig::from_json(const nlohmann::json& j) {
    if (j.contains("risk"))
        risk.from_json(j.at("risk"));
    if (j.contains("scheduler"))
        scheduler.from_json(j.at("scheduler"));
    if (j.contains("advisory"))
        advisory.from_json(j.at("advisory"));
    if (j.contains("feed"))
        feed.from_json(j.at("feed"));
    if (j.contains("autopilot"))
        autopilot.from_json(j.at("autopilot"));
    if (j.contains("logging"))
        logging.from_json(j.at("logging"));

    if (j.contains("assets") && j.at("assets").is_array()) {
        std::vector<AssetProfile> parsed;
        for (const auto& entry : j.at("assets")) {
            AssetProfile asset;
            asset.pair = entry.at("pair").get<std::string>();
            asset.volatility = entry.value("volatility", asset.volatility);
            asset.reference_price = entry.value("reference_price", asset.reference_price);
            asset.walk_step = entry.value("walk_step", asset.walk_step);
            parsed.push_back(asset);
        }
        assets = std::move(parsed);
    }

    if (j.contains("initial_trial_balance"))
        initial_trial_balance = j.at("initial_trial_balance").get<double>();
    if (j.contains("initial_live_balance"))
        initial_live_balance = j.at("initial_live_balance").get<double>();
    if (j.contains("state_file"))
        state_file = j.at("state_file").get<std::string>();
}

// RiskConfigValidator Implementation
std::vector<ConfigValidationError> RiskConfigValidator::validate(
    const RiskConfiguration& config) const {
    std::vector<ConfigValidationError> errors;

    validate_percent(config.stop_loss_pct, "stop_loss_pct", false, errors);
    validate_percent(config.take_profit_pct, "take_profit_pct", false, errors);
    validate_percent(config.max_drawdown_pct, "max_drawdown_pct", false, errors);
    validate_percent(config.advisory_risk_pct, "advisory_risk_pct", true, errors);

    if (!std::isfinite(config.advisory_max_position) || config.advisory_max_position < 0.0) {
        errors.push_back({"advisory_max_position", "Must be a non-negative number"});
    }

    return errors;
}

Result<void> RiskConfigValidator::check(const RiskConfiguration& config) const {
    auto errors = validate(config);
    if (errors.empty()) {
        return Result<void>();
    }

    std::ostringstream ss;
    ss << "Invalid risk configuration:";
    for (const auto& error : errors) {
        ss << " " << error.field << " (" << error.message << ")";
    }
    return make_error<void>(ErrorCode::INVALID_ARGUMENT, ss.str(), "RiskConfigValidator");
}

void RiskConfigValidator::validate_percent(double value, const std::string& field,
                                           bool allow_zero,
                                           std::vector<ConfigValidationError>& errors) const {
    if (!std::isfinite(value)) {
        errors.push_back({field, "Must be a number"});
        return;
    }

    bool below = allow_zero ? value < 0.0 : value <= 0.0;
    if (below || value > 100.0) {
        errors.push_back({field, allow_zero ? "Must be between 0 and 100"
                                            : "Must be greater than 0 and at most 100"});
    }
}

}  // namespace trade_pilot
