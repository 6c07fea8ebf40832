// include/trade_pilot/advisory/decision_pipeline.hpp
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "trade_pilot/advisory/advisory_service.hpp"
#include "trade_pilot/core/engine_config.hpp"
#include "trade_pilot/core/types.hpp"
#include "trade_pilot/strategy/trend_analyzer.hpp"

namespace trade_pilot {

/**
 * @brief Aggregate figures over CLOSED trades
 */
struct PerformanceStats {
    size_t closed_trades{0};
    size_t wins{0};
    double win_rate{0.0};  // Percent, 0 when nothing is closed
    double net_pnl{0.0};
};

PerformanceStats compute_performance(const std::vector<Trade>& trades);

/**
 * @brief Produces insights and audits, preferring the external service
 *
 * Each external call races a timeout. Whichever finishes first decides the
 * result; a late or invalid reply is discarded and a deterministic local
 * fallback is returned instead. Neither operation reports an error.
 */
class DecisionPipeline {
public:
    /**
     * @param service External service, may be null to always use the fallback
     * @param config Timeout and fallback history threshold
     * @param assets Profiles supplying volatility and reference prices
     * @param trend Parameters of the trend fallback
     */
    DecisionPipeline(std::shared_ptr<AdvisoryService> service, AdvisoryConfig config,
                     std::vector<AssetProfile> assets,
                     TrendAnalyzerConfig trend = TrendAnalyzerConfig{});

    Insight generate_insight(const std::string& pair, std::optional<Price> current_price,
                             std::optional<double> change_24h, const PriceHistory& history);

    Audit audit_performance(const std::vector<Trade>& trades);

    /**
     * @brief Validate an external insight reply
     * @return Insight tagged EXTERNAL, or nullopt when any field is missing or out of range
     */
    static std::optional<Insight> parse_insight(const nlohmann::json& reply,
                                                const std::string& pair);

    static std::optional<Audit> parse_audit(const nlohmann::json& reply);

    Insight fallback_insight(const std::string& pair, std::optional<Price> current_price,
                             std::optional<double> change_24h,
                             const PriceHistory& history) const;

    static Audit fallback_audit(const PerformanceStats& stats);

    std::chrono::milliseconds timeout() const {
        return std::chrono::milliseconds(config_.timeout_ms);
    }

private:
    using ServiceCall =
        std::function<Result<nlohmann::json>(AdvisoryService&, const CancellationToken&)>;

    /**
     * @brief Run a service call on a detached worker and wait up to the timeout
     * @return Reply when the service answered first and successfully
     */
    std::optional<nlohmann::json> race(ServiceCall call, const std::string& what) const;

    AssetProfile profile_for(const std::string& pair) const;

    std::shared_ptr<AdvisoryService> service_;
    AdvisoryConfig config_;
    std::vector<AssetProfile> assets_;
    TrendAnalyzerConfig trend_;
};

}  // namespace trade_pilot
