// src/core/logger.cpp
#include "trade_pilot/core/logger.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <vector>
#include "trade_pilot/core/time_utils.hpp"

namespace trade_pilot {

namespace fs = std::filesystem;

thread_local std::string Logger::thread_component_;

nlohmann::json LoggerConfig::to_json() const {
    return {{"min_level", level_to_string(min_level)},
            {"destination", log_destination_to_string(destination)},
            {"log_directory", log_directory},
            {"filename_prefix", filename_prefix},
            {"include_timestamp", include_timestamp},
            {"include_level", include_level},
            {"max_file_size", max_file_size},
            {"max_files", max_files}};
}

void LoggerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_level")) {
        min_level = level_from_string(j.at("min_level").get<std::string>(), min_level);
    }
    if (j.contains("destination")) {
        destination =
            log_destination_from_string(j.at("destination").get<std::string>(), destination);
    }
    read_field(j, "log_directory", log_directory);
    read_field(j, "filename_prefix", filename_prefix);
    read_field(j, "include_timestamp", include_timestamp);
    read_field(j, "include_level", include_level);
    read_field(j, "max_file_size", max_file_size);
    read_field(j, "max_files", max_files);
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::~Logger() {
    if (part_stream_.is_open()) {
        part_stream_.close();
    }
}

void Logger::reset_for_tests() {
    Logger& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.initialized_.store(false, std::memory_order_release);
    if (logger.part_stream_.is_open()) {
        logger.part_stream_.close();
    }
    logger.config_ = LoggerConfig{};
    logger.session_stamp_.clear();
    logger.part_index_ = 1;
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (part_stream_.is_open()) {
        part_stream_.close();
    }
    config_ = config;

    if (config_.writes_file()) {
        std::error_code ec;
        fs::create_directories(config_.log_directory, ec);
        if (ec) {
            throw std::runtime_error("Cannot create log directory " + config_.log_directory +
                                     ": " + ec.message());
        }

        session_stamp_ = core::get_formatted_time("%Y%m%d_%H%M%S");
        part_index_ = 1;
        enforce_retention_locked();
        open_part_locked();
        if (!part_stream_.is_open()) {
            throw std::runtime_error("Cannot open log file " + part_path_locked().string());
        }
    }

    initialized_.store(true, std::memory_order_release);
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!is_initialized()) {
        std::cerr << "[uninitialized logger] " << message << '\n';
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    const std::string line = render(level, message);
    if (config_.writes_console()) {
        std::cout << line << std::endl;
    }
    if (config_.writes_file()) {
        append_to_file_locked(line);
    }
}

std::string Logger::render(LogLevel level, const std::string& message) const {
    std::string line;
    line.reserve(message.size() + 48);
    if (config_.include_timestamp) {
        line += core::get_formatted_time("%Y-%m-%d %H:%M:%S");
        line += ' ';
    }
    if (config_.include_level) {
        line += '[' + level_to_string(level) + "] ";
    }
    if (!thread_component_.empty()) {
        line += '[' + thread_component_ + "] ";
    }
    line += message;
    return line;
}

fs::path Logger::part_path_locked() const {
    return fs::path(config_.log_directory) /
           (config_.filename_prefix + "_" + session_stamp_ + "_part" +
            std::to_string(part_index_) + ".log");
}

void Logger::open_part_locked() {
    part_stream_.open(part_path_locked(), std::ios::app);
}

void Logger::append_to_file_locked(const std::string& line) {
    if (!part_stream_.is_open()) {
        return;
    }
    part_stream_ << line << '\n';
    part_stream_.flush();

    auto written = part_stream_.tellp();
    if (written >= 0 && static_cast<size_t>(written) >= config_.max_file_size) {
        start_next_part_locked();
    }
}

void Logger::start_next_part_locked() {
    part_stream_.close();
    enforce_retention_locked();
    ++part_index_;
    open_part_locked();
}

void Logger::enforce_retention_locked() {
    std::error_code ec;
    std::vector<fs::directory_entry> parts;
    for (fs::directory_iterator it(config_.log_directory, ec), end; !ec && it != end;
         it.increment(ec)) {
        if (it->is_regular_file() && it->path().extension() == ".log") {
            parts.push_back(*it);
        }
    }

    // Oldest first; the part about to be opened needs one free slot.
    std::sort(parts.begin(), parts.end(), [](const auto& a, const auto& b) {
        return a.last_write_time() < b.last_write_time();
    });
    size_t excess = parts.size() >= config_.max_files ? parts.size() - config_.max_files + 1 : 0;
    for (size_t i = 0; i < excess && i < parts.size(); ++i) {
        fs::remove(parts[i].path(), ec);
    }
}

}  // namespace trade_pilot
