// include/trade_pilot/strategy/trend_analyzer.hpp
#pragma once

#include <string>
#include "trade_pilot/core/types.hpp"

namespace trade_pilot {

/**
 * @brief Parameters of the moving-average momentum classifier
 */
struct TrendAnalyzerConfig {
    size_t short_window{10};              // Tail used for short-term momentum
    size_t long_window{50};               // Baseline window
    double momentum_threshold_pct{0.15};  // |momentum| above this produces BUY/SELL
    double base_confidence{50.0};
    double confidence_per_pct{25.0};  // Confidence gained per percent of momentum
    double max_confidence{95.0};
};

/**
 * @brief Output of the trend analyzer
 */
struct TrendSignal {
    SignalAction action{SignalAction::HOLD};
    double confidence{0.0};  // [0, 100]
    double momentum_pct{0.0};
    std::string reason;
};

/**
 * @brief Classify a price history into BUY/SELL/HOLD
 *
 * Momentum is the percentage gap between the short and long simple moving
 * averages taken over the tail of the history. The function is pure: the same
 * history and configuration always yield the same signal.
 *
 * @param history Prices ordered oldest to newest
 * @param config Classifier parameters
 * @return Signal with action, confidence and a human-readable reason
 */
TrendSignal analyze_trend(const PriceHistory& history,
                          const TrendAnalyzerConfig& config = TrendAnalyzerConfig{});

}  // namespace trade_pilot
