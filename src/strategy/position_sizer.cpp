// src/strategy/position_sizer.cpp
#include "trade_pilot/strategy/position_sizer.hpp"
#include <algorithm>
#include <cmath>

namespace trade_pilot {

Notional safe_size(double balance, Price /*price*/, double risk_fraction, double cap) {
    if (!std::isfinite(balance) || !std::isfinite(risk_fraction) || std::isnan(cap)) {
        return 0.0;
    }
    if (balance <= 0.0 || risk_fraction <= 0.0 || cap <= 0.0) {
        return 0.0;
    }

    double size = std::min(balance * risk_fraction, cap);
    return std::max(0.0, std::min(size, balance));
}

double to_units(Notional notional, Price price) {
    if (!std::isfinite(price) || price <= 0.0 || !std::isfinite(notional)) {
        return 0.0;
    }
    return notional / price;
}

}  // namespace trade_pilot
