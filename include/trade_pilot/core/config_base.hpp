// include/trade_pilot/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "trade_pilot/core/error.hpp"

namespace trade_pilot {

/**
 * @brief JSON-backed settings section
 *
 * Each section of the engine config (risk, scheduler, feed, advisory,
 * autopilot, logging) derives from this and only supplies the mapping to and
 * from JSON. Reading is lenient: keys missing from the document leave the
 * current value untouched, so a partial file overrides only what it names.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Write to_json() to a file, pretty printed
     * @return FILE_IO_ERROR if the file cannot be written
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Read a file and apply it through from_json()
     * @return FILE_NOT_FOUND, JSON_PARSE_ERROR for malformed text, or
     *         INVALID_DATA when a known key holds the wrong type
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;
    virtual void from_json(const nlohmann::json& j) = 0;

protected:
    /// Copy j[key] into target when the key exists
    template <typename T>
    static void read_field(const nlohmann::json& j, const char* key, T& target) {
        auto it = j.find(key);
        if (it != j.end()) {
            target = it->template get<T>();
        }
    }
};

}  // namespace trade_pilot
