// include/trade_pilot/core/time_utils.hpp

#pragma once

#include <time.h>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>
#include "trade_pilot/core/types.hpp"

namespace trade_pilot {
namespace core {

/**
 * @brief Reentrant localtime; returns false if the conversion fails
 */
inline bool to_local_tm(std::time_t seconds, std::tm& out) {
#ifdef _WIN32
    return localtime_s(&out, &seconds) == 0;
#else
    return localtime_r(&seconds, &out) != nullptr;
#endif
}

/**
 * @brief strftime over a Timestamp in local time, empty on failure
 */
inline std::string format_time(const Timestamp& ts, const char* format) {
    std::tm parts{};
    if (!to_local_tm(std::chrono::system_clock::to_time_t(ts), parts)) {
        return {};
    }
    char buffer[64];
    size_t written = std::strftime(buffer, sizeof(buffer), format, &parts);
    return std::string(buffer, written);
}

inline std::string get_formatted_time(const char* format) {
    return format_time(std::chrono::system_clock::now(), format);
}

// Trade timestamps are persisted as epoch milliseconds.
inline int64_t to_epoch_ms(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp from_epoch_ms(int64_t ms) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(ms)));
}

}  // namespace core
}  // namespace trade_pilot
