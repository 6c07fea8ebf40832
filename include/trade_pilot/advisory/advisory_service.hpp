// include/trade_pilot/advisory/advisory_service.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "trade_pilot/core/cancellation.hpp"
#include "trade_pilot/core/error.hpp"

namespace trade_pilot {

/**
 * @brief External recommendation service
 *
 * Calls are blocking and may be slow; callers run them off the engine lock
 * and may abandon them through the token. Responses are returned unvalidated.
 * Implementations must return promptly once the token is cancelled: an
 * abandoned call runs on a detached thread and must not be alive at exit.
 */
class AdvisoryService {
public:
    virtual ~AdvisoryService() = default;

    /**
     * @brief Ask for a trading insight on a pair
     * @param pair Pair symbol
     * @param context Market context (price, 24h change, recent history)
     * @param cancel Token set when the caller has stopped waiting
     */
    virtual Result<nlohmann::json> request(const std::string& pair,
                                           const nlohmann::json& context,
                                           const CancellationToken& cancel) = 0;

    /**
     * @brief Ask for a performance audit
     * @param stats Win rate, net PnL and trade counts
     * @param cancel Token set when the caller has stopped waiting
     */
    virtual Result<nlohmann::json> summarize(const nlohmann::json& stats,
                                             const CancellationToken& cancel) = 0;
};

}  // namespace trade_pilot
