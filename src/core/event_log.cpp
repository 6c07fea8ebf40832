// src/core/event_log.cpp
#include "trade_pilot/core/event_log.hpp"
#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>
#include "trade_pilot/core/logger.hpp"

namespace trade_pilot {

std::string format_pnl(double value) {
    std::ostringstream oss;
    oss << (value >= 0.0 ? "+$" : "-$") << std::fixed << std::setprecision(2) << std::fabs(value);
    return oss.str();
}

EventLog::EventLog(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void EventLog::append(const std::string& message, EventKind kind) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        EventLogEntry entry{next_id_++, std::chrono::system_clock::now(), message, kind};
        entries_.push_back(std::move(entry));
        while (entries_.size() > capacity_) {
            entries_.pop_front();
        }
    }

    switch (kind) {
        case EventKind::WARNING:
            WARN(message);
            break;
        case EventKind::INFO:
        case EventKind::SUCCESS:
        case EventKind::ADVISORY:
            INFO("[" << event_kind_to_string(kind) << "] " << message);
            break;
    }
}

std::vector<EventLogEntry> EventLog::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<EventLogEntry>(entries_.begin(), entries_.end());
}

void EventLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t EventLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace trade_pilot
