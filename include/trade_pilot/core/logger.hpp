// include/trade_pilot/core/logger.hpp
#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <utility>
#include "trade_pilot/core/config_base.hpp"

namespace trade_pilot {

/**
 * @brief Severity of a log line, ordered from chattiest to most severe
 */
enum class LogLevel { TRACE, DEBUG, INFO, WARNING, ERR, FATAL };

/**
 * @brief Where formatted lines are written
 */
enum class LogDestination { CONSOLE, FILE, BOTH };

namespace detail {

constexpr std::array<std::pair<LogLevel, const char*>, 6> kLevelNames{{
    {LogLevel::TRACE, "TRACE"},
    {LogLevel::DEBUG, "DEBUG"},
    {LogLevel::INFO, "INFO"},
    {LogLevel::WARNING, "WARNING"},
    {LogLevel::ERR, "ERROR"},
    {LogLevel::FATAL, "FATAL"},
}};

constexpr std::array<std::pair<LogDestination, const char*>, 3> kDestinationNames{{
    {LogDestination::CONSOLE, "CONSOLE"},
    {LogDestination::FILE, "FILE"},
    {LogDestination::BOTH, "BOTH"},
}};

}  // namespace detail

inline std::string level_to_string(LogLevel level) {
    for (const auto& [value, name] : detail::kLevelNames) {
        if (value == level)
            return name;
    }
    return "UNKNOWN";
}

/**
 * @brief Parse a level name as written in engine config files
 * @return fallback when the name is not recognised
 */
inline LogLevel level_from_string(const std::string& name, LogLevel fallback) {
    for (const auto& [value, label] : detail::kLevelNames) {
        if (name == label)
            return value;
    }
    return fallback;
}

inline std::string log_destination_to_string(LogDestination dest) {
    for (const auto& [value, name] : detail::kDestinationNames) {
        if (value == dest)
            return name;
    }
    return "UNKNOWN";
}

inline LogDestination log_destination_from_string(const std::string& name,
                                                  LogDestination fallback) {
    for (const auto& [value, label] : detail::kDestinationNames) {
        if (name == label)
            return value;
    }
    return fallback;
}

/**
 * @brief "logging" section of the engine config
 *
 * File output is split into parts named
 * <filename_prefix>_<YYYYMMDD_HHMMSS>_part<N>.log; a new part starts once the
 * current one reaches max_file_size bytes, and at most max_files parts are
 * kept in log_directory.
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"trade_pilot"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{10 * 1024 * 1024};
    size_t max_files{10};

    bool writes_console() const {
        return destination != LogDestination::FILE;
    }
    bool writes_file() const {
        return destination != LogDestination::CONSOLE;
    }

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Process-wide logger shared by the engine, its schedulers and the app
 *
 * Every public member is safe to call from the feed, autopilot and
 * settlement threads concurrently.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Apply a configuration, opening the first log part when file output is on
     * @throws std::runtime_error if the log directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Drop any open part and forget the configuration
     */
    static void reset_for_tests();

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level);
    LogLevel get_min_level() const;

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag later lines from the calling thread with a component name
     */
    static void register_component(const std::string& component) {
        thread_component_ = component;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // The *_locked helpers expect mutex_ to be held by the caller.
    std::filesystem::path part_path_locked() const;
    void open_part_locked();
    void start_next_part_locked();
    void enforce_retention_locked();
    void append_to_file_locked(const std::string& line);
    std::string render(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream part_stream_;
    std::atomic<bool> initialized_{false};
    static thread_local std::string thread_component_;

    std::string session_stamp_;
    int part_index_{1};
};

/**
 * @brief Stream-style logging, e.g. LOG(LogLevel::INFO, "pnl=" << pnl)
 */
#define LOG(level, message)                                \
    do {                                                   \
        if (level >= Logger::instance().get_min_level()) { \
            std::ostringstream os;                         \
            os << message;                                 \
            Logger::instance().log(level, os.str());       \
        }                                                  \
    } while (0)

#define TRACE(message) LOG(LogLevel::TRACE, message)
#define DEBUG(message) LOG(LogLevel::DEBUG, message)
#define INFO(message) LOG(LogLevel::INFO, message)
#define WARN(message) LOG(LogLevel::WARNING, message)
#define ERROR(message) LOG(LogLevel::ERR, message)
#define FATAL(message) LOG(LogLevel::FATAL, message)
}  // namespace trade_pilot
