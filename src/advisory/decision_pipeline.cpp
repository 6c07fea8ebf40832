// src/advisory/decision_pipeline.cpp
#include "trade_pilot/advisory/decision_pipeline.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <thread>
#include "trade_pilot/advisory/first_wins_slot.hpp"
#include "trade_pilot/core/logger.hpp"

namespace trade_pilot {

namespace {

constexpr double kChangeThresholdPct = 2.0;
constexpr double kHeuristicConfidence = 70.0;
constexpr size_t kContextHistoryPoints = 20;
constexpr const char* kFallbackAdjustment =
    "Continue standard operation with adjusted risk sizing.";

bool is_valid_rating(const std::string& rating) {
    return rating == "S" || rating == "A" || rating == "B" || rating == "C" || rating == "F";
}

}  // namespace

PerformanceStats compute_performance(const std::vector<Trade>& trades) {
    PerformanceStats stats;
    for (const auto& trade : trades) {
        if (trade.status != TradeStatus::CLOSED) {
            continue;
        }
        double pnl = trade.pnl.value_or(0.0);
        ++stats.closed_trades;
        if (pnl > 0.0) {
            ++stats.wins;
        }
        stats.net_pnl += pnl;
    }
    if (stats.closed_trades > 0) {
        stats.win_rate = static_cast<double>(stats.wins) /
                         static_cast<double>(stats.closed_trades) * 100.0;
    }
    return stats;
}

DecisionPipeline::DecisionPipeline(std::shared_ptr<AdvisoryService> service,
                                   AdvisoryConfig config, std::vector<AssetProfile> assets,
                                   TrendAnalyzerConfig trend)
    : service_(std::move(service)),
      config_(std::move(config)),
      assets_(std::move(assets)),
      trend_(trend) {}

Insight DecisionPipeline::generate_insight(const std::string& pair,
                                           std::optional<Price> current_price,
                                           std::optional<double> change_24h,
                                           const PriceHistory& history) {
    nlohmann::json context;
    if (current_price) {
        context["current_price"] = *current_price;
        context["change_24h_pct"] = change_24h.value_or(0.0);
    } else {
        context["note"] = "Market data unavailable, assume neutral consolidation.";
    }
    size_t tail = std::min(history.size(), kContextHistoryPoints);
    context["recent_prices"] =
        PriceHistory(history.end() - static_cast<std::ptrdiff_t>(tail), history.end());

    auto reply = race(
        [pair, context](AdvisoryService& service, const CancellationToken& cancel) {
            return service.request(pair, context, cancel);
        },
        "insight for " + pair);

    if (reply) {
        auto insight = parse_insight(*reply, pair);
        if (insight) {
            INFO("External insight for " << pair << ": " << signal_action_to_string(insight->action)
                                         << " (" << insight->confidence << ")");
            return *insight;
        }
        WARN("Advisory insight for " << pair << " failed validation, using fallback");
    }

    return fallback_insight(pair, current_price, change_24h, history);
}

Audit DecisionPipeline::audit_performance(const std::vector<Trade>& trades) {
    PerformanceStats stats = compute_performance(trades);

    nlohmann::json summary;
    summary["closed_trades"] = stats.closed_trades;
    summary["wins"] = stats.wins;
    summary["win_rate_pct"] = stats.win_rate;
    summary["net_pnl"] = stats.net_pnl;

    auto reply = race(
        [summary](AdvisoryService& service, const CancellationToken& cancel) {
            return service.summarize(summary, cancel);
        },
        "performance audit");

    if (reply) {
        auto audit = parse_audit(*reply);
        if (audit) {
            return *audit;
        }
        WARN("Advisory audit failed validation, using fallback");
    }
    return fallback_audit(stats);
}

std::optional<nlohmann::json> DecisionPipeline::race(ServiceCall call,
                                                     const std::string& what) const {
    if (!service_) {
        return std::nullopt;
    }

    auto slot = std::make_shared<FirstWinsSlot<std::optional<nlohmann::json>>>();
    CancellationToken token;
    std::shared_ptr<AdvisoryService> service = service_;

    // The worker owns everything it touches and may outlive this call; after
    // the slot closes it must not touch the Logger.
    std::thread worker([slot, service, token, call, what]() {
        std::optional<nlohmann::json> outcome;
        std::string failure;
        try {
            auto reply = call(*service, token);
            if (reply.is_ok()) {
                outcome = reply.value();
            } else {
                failure = reply.error()->to_string();
            }
        } catch (const std::exception& e) {
            failure = std::string("threw: ") + e.what();
        }
        if (slot->closed()) {
            return;
        }
        if (!failure.empty()) {
            WARN("Advisory " << what << " failed: " << failure);
        }
        slot->offer(std::move(outcome));
    });
    worker.detach();

    auto outcome = slot->wait_for(timeout());
    if (!outcome) {
        token.cancel();
        WARN("Advisory " << what << " timed out after " << config_.timeout_ms << "ms");
        return std::nullopt;
    }
    return *outcome;
}

std::optional<Insight> DecisionPipeline::parse_insight(const nlohmann::json& reply,
                                                       const std::string& pair) {
    if (!reply.is_object() || reply.empty()) {
        return std::nullopt;
    }
    if (!reply.contains("pair") || !reply.at("pair").is_string()) {
        return std::nullopt;
    }
    if (!reply.contains("confidence") || !reply.at("confidence").is_number()) {
        return std::nullopt;
    }
    if (!reply.contains("action") || !reply.at("action").is_string()) {
        return std::nullopt;
    }
    if (!reply.contains("reasoning") || !reply.at("reasoning").is_string()) {
        return std::nullopt;
    }
    if (!reply.contains("keyLevels") || !reply.at("keyLevels").is_object()) {
        return std::nullopt;
    }

    const auto& levels = reply.at("keyLevels");
    if (!levels.contains("support") || !levels.at("support").is_number() ||
        !levels.contains("resistance") || !levels.at("resistance").is_number()) {
        return std::nullopt;
    }

    double confidence = reply.at("confidence").get<double>();
    if (!std::isfinite(confidence) || confidence < 0.0 || confidence > 100.0) {
        return std::nullopt;
    }
    auto action = signal_action_from_string(reply.at("action").get<std::string>());
    if (!action) {
        return std::nullopt;
    }
    std::string reasoning = reply.at("reasoning").get<std::string>();
    if (reasoning.empty()) {
        return std::nullopt;
    }

    Insight insight;
    insight.pair = pair;
    insight.confidence = confidence;
    insight.action = *action;
    insight.reasoning = reasoning;
    insight.key_levels.support = levels.at("support").get<double>();
    insight.key_levels.resistance = levels.at("resistance").get<double>();
    insight.timestamp = std::chrono::system_clock::now();
    insight.provenance = Provenance::EXTERNAL;
    return insight;
}

std::optional<Audit> DecisionPipeline::parse_audit(const nlohmann::json& reply) {
    if (!reply.is_object()) {
        return std::nullopt;
    }
    if (!reply.contains("rating") || !reply.at("rating").is_string() ||
        !reply.contains("efficiencyScore") || !reply.at("efficiencyScore").is_number() ||
        !reply.contains("critique") || !reply.at("critique").is_string() ||
        !reply.contains("recommendedAdjustment") ||
        !reply.at("recommendedAdjustment").is_string()) {
        return std::nullopt;
    }

    Audit audit;
    audit.rating = reply.at("rating").get<std::string>();
    if (!is_valid_rating(audit.rating)) {
        return std::nullopt;
    }
    audit.efficiency_score = reply.at("efficiencyScore").get<double>();
    audit.critique = reply.at("critique").get<std::string>();
    audit.recommended_adjustment = reply.at("recommendedAdjustment").get<std::string>();
    audit.provenance = Provenance::EXTERNAL;
    return audit;
}

Insight DecisionPipeline::fallback_insight(const std::string& pair,
                                           std::optional<Price> current_price,
                                           std::optional<double> change_24h,
                                           const PriceHistory& history) const {
    AssetProfile profile = profile_for(pair);

    SignalAction action = SignalAction::HOLD;
    double confidence = kHeuristicConfidence;
    std::string reason;
    if (history.size() >= config_.min_fallback_history) {
        TrendSignal signal = analyze_trend(history, trend_);
        action = signal.action;
        confidence = signal.confidence;
        reason = signal.reason;
    } else {
        double change = change_24h.value_or(0.0);
        if (change > kChangeThresholdPct) {
            action = SignalAction::BUY;
        } else if (change < -kChangeThresholdPct) {
            action = SignalAction::SELL;
        }
        reason = "Momentum estimated from the 24h price change.";
    }

    Price base_price = (current_price && *current_price > 0.0) ? *current_price
                                                               : profile.reference_price;

    Insight insight;
    insight.pair = pair;
    insight.confidence = confidence;
    insight.action = action;
    insight.reasoning = "[FALLBACK] " + reason;
    insight.key_levels.support = std::floor(base_price * (1.0 - profile.volatility));
    insight.key_levels.resistance = std::floor(base_price * (1.0 + profile.volatility));
    insight.timestamp = std::chrono::system_clock::now();
    insight.provenance = Provenance::FALLBACK;

    INFO("Fallback insight for " << pair << ": " << signal_action_to_string(action) << " ("
                                 << confidence << ")");
    return insight;
}

Audit DecisionPipeline::fallback_audit(const PerformanceStats& stats) {
    Audit audit;
    if (stats.win_rate > 60.0 && stats.net_pnl > 0.0) {
        audit.rating = "A";
        audit.critique = "[FALLBACK] Positive expectancy with a majority of winning trades.";
    } else if (stats.net_pnl < 0.0) {
        audit.rating = "F";
        audit.critique = "[FALLBACK] Negative expectancy. Tighten the stop-loss level.";
    } else {
        audit.rating = "C";
        audit.critique = "[FALLBACK] Results track the market baseline with no clear edge.";
    }
    audit.efficiency_score = std::floor(stats.win_rate);
    audit.recommended_adjustment = kFallbackAdjustment;
    audit.provenance = Provenance::FALLBACK;
    return audit;
}

AssetProfile DecisionPipeline::profile_for(const std::string& pair) const {
    for (const auto& asset : assets_) {
        if (asset.pair == pair) {
            return asset;
        }
    }
    AssetProfile generic;
    generic.pair = pair;
    return generic;
}

}  // namespace trade_pilot
