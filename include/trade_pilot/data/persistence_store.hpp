// include/trade_pilot/data/persistence_store.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "trade_pilot/core/engine_config.hpp"
#include "trade_pilot/core/error.hpp"
#include "trade_pilot/core/types.hpp"
#include "trade_pilot/ledger/trade_ledger.hpp"

namespace trade_pilot {

/**
 * @brief Everything that survives a restart
 *
 * Safety counters are session-scoped and deliberately absent.
 */
struct PersistedState {
    std::vector<Trade> trades;
    RiskConfiguration risk;
    AccountBalances balances;
    std::optional<SessionInfo> session;
};

nlohmann::json trade_to_json(const Trade& trade);

/**
 * @brief Parse a persisted trade; a missing mode defaults to TRIAL
 */
Result<Trade> trade_from_json(const nlohmann::json& j);

/**
 * @brief Durable storage of the persisted state blob
 */
class PersistenceStore {
public:
    virtual ~PersistenceStore() = default;

    /**
     * @brief Load state, falling back to defaults section by section
     * @param defaults Values used for missing or corrupt sections
     */
    virtual Result<PersistedState> load(const PersistedState& defaults) = 0;

    virtual Result<void> save(const PersistedState& state) = 0;
};

/**
 * @brief PersistenceStore writing a single JSON document to disk
 */
class JsonFileStore : public PersistenceStore {
public:
    explicit JsonFileStore(std::string path);

    Result<PersistedState> load(const PersistedState& defaults) override;
    Result<void> save(const PersistedState& state) override;

    /**
     * @brief Decode a document with per-section recovery
     */
    static PersistedState decode(const nlohmann::json& document, const PersistedState& defaults);

    static nlohmann::json encode(const PersistedState& state);

    const std::string& path() const {
        return path_;
    }

private:
    std::string path_;
};

}  // namespace trade_pilot
