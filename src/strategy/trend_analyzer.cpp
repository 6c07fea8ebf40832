// src/strategy/trend_analyzer.cpp
#include "trade_pilot/strategy/trend_analyzer.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace trade_pilot {

namespace {

double tail_mean(const PriceHistory& history, size_t window) {
    size_t count = std::min(window, history.size());
    if (count == 0) {
        return 0.0;
    }
    double sum = std::accumulate(history.end() - static_cast<std::ptrdiff_t>(count),
                                 history.end(), 0.0);
    return sum / static_cast<double>(count);
}

}  // namespace

TrendSignal analyze_trend(const PriceHistory& history, const TrendAnalyzerConfig& config) {
    TrendSignal signal;

    if (history.size() < 2) {
        signal.reason = "Insufficient price history for trend analysis.";
        return signal;
    }

    double short_ma = tail_mean(history, std::max<size_t>(config.short_window, 1));
    double long_ma = tail_mean(history, std::max<size_t>(config.long_window, 1));

    if (!std::isfinite(short_ma) || !std::isfinite(long_ma) || long_ma <= 0.0) {
        signal.reason = "Degenerate price history; no trend computed.";
        return signal;
    }

    double momentum = (short_ma - long_ma) / long_ma * 100.0;
    signal.momentum_pct = momentum;

    if (momentum > config.momentum_threshold_pct) {
        signal.action = SignalAction::BUY;
    } else if (momentum < -config.momentum_threshold_pct) {
        signal.action = SignalAction::SELL;
    } else {
        signal.action = SignalAction::HOLD;
    }

    double confidence = config.base_confidence + config.confidence_per_pct * std::fabs(momentum);
    confidence = std::min(confidence, config.max_confidence);
    signal.confidence = std::clamp(confidence, 0.0, 100.0);

    std::ostringstream reason;
    reason << std::fixed << std::setprecision(2);
    switch (signal.action) {
        case SignalAction::BUY:
            reason << "Bullish momentum: short MA " << momentum << "% above long MA.";
            break;
        case SignalAction::SELL:
            reason << "Bearish momentum: short MA " << -momentum << "% below long MA.";
            break;
        case SignalAction::HOLD:
            reason << "Consolidation: momentum " << momentum << "% within +/-"
                   << config.momentum_threshold_pct << "% band.";
            break;
    }
    signal.reason = reason.str();

    return signal;
}

}  // namespace trade_pilot
