// include/trade_pilot/core/event_log.hpp
#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include "trade_pilot/core/types.hpp"

namespace trade_pilot {

enum class EventKind { INFO, SUCCESS, WARNING, ADVISORY };

inline std::string event_kind_to_string(EventKind kind) {
    switch (kind) {
        case EventKind::INFO:
            return "info";
        case EventKind::SUCCESS:
            return "success";
        case EventKind::WARNING:
            return "warning";
        case EventKind::ADVISORY:
            return "advisory";
    }
    return "info";
}

/**
 * @brief Signed dollar amount for event messages, e.g. "+$12.50" or "-$20.00"
 */
std::string format_pnl(double value);

struct EventLogEntry {
    uint64_t id{0};
    Timestamp timestamp;
    std::string message;
    EventKind kind{EventKind::INFO};
};

/**
 * @brief Bounded activity stream consumed by the presentation layer
 *
 * Every appended entry is mirrored to the Logger. Oldest entries are dropped
 * once capacity is reached.
 */
class EventLog {
public:
    explicit EventLog(size_t capacity = 50);

    void append(const std::string& message, EventKind kind = EventKind::INFO);

    std::vector<EventLogEntry> entries() const;

    void clear();

    size_t size() const;

    size_t capacity() const {
        return capacity_;
    }

private:
    size_t capacity_;
    uint64_t next_id_{1};
    std::deque<EventLogEntry> entries_;
    mutable std::mutex mutex_;
};

}  // namespace trade_pilot
