// include/trade_pilot/strategy/position_sizer.hpp
#pragma once

#include "trade_pilot/core/types.hpp"

namespace trade_pilot {

/**
 * @brief Risk-bounded notional for an autonomous entry
 *
 * Returns max(0, min(balance * risk_fraction, cap)). The result never exceeds
 * the available balance; the price does not affect sizing.
 *
 * @param balance Available balance of the account mode
 * @param price Current price (unused by sizing, kept for unit conversion by callers)
 * @param risk_fraction Fraction of balance to commit, e.g. 0.02
 * @param cap Maximum notional per entry
 * @return Notional to commit, 0 for any non-finite or negative input
 */
Notional safe_size(double balance, Price price, double risk_fraction, double cap);

/**
 * @brief Convert a notional into units of the underlying
 * @return Quantity, or 0 when price is not positive
 */
double to_units(Notional notional, Price price);

}  // namespace trade_pilot
