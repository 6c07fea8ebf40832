// include/trade_pilot/core/error.hpp

#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace trade_pilot {

/**
 * @brief Failure categories shared by every engine component
 *
 * Values are contiguous from NONE so they can index the name table below.
 */
enum class ErrorCode {
    NONE = 0,
    INVALID_ARGUMENT,
    NOT_INITIALIZED,

    // Quotes, persisted state and advisory payloads
    DATA_NOT_FOUND,
    INVALID_DATA,

    // Opening and closing trades
    INSUFFICIENT_FUNDS,
    INVALID_ORDER,

    // Exchange ticker and advisory endpoints
    CONNECTION_ERROR,
    TIMEOUT_ERROR,
    API_ERROR,
    CANCELLED,
    MARKET_DATA_ERROR,

    FILE_NOT_FOUND,
    FILE_IO_ERROR,
    JSON_PARSE_ERROR
};

namespace detail {

constexpr std::array<const char*, 15> kErrorCodeNames{
    "NONE",          "INVALID_ARGUMENT",   "NOT_INITIALIZED",  "DATA_NOT_FOUND",
    "INVALID_DATA",  "INSUFFICIENT_FUNDS", "INVALID_ORDER",    "CONNECTION_ERROR",
    "TIMEOUT_ERROR", "API_ERROR",          "CANCELLED",        "MARKET_DATA_ERROR",
    "FILE_NOT_FOUND", "FILE_IO_ERROR",     "JSON_PARSE_ERROR"};

static_assert(static_cast<size_t>(ErrorCode::JSON_PARSE_ERROR) + 1 == kErrorCodeNames.size(),
              "error code name table out of sync");

}  // namespace detail

inline std::string error_code_to_string(ErrorCode code) {
    auto index = static_cast<size_t>(code);
    return index < detail::kErrorCodeNames.size() ? detail::kErrorCodeNames[index]
                                                  : "UNKNOWN";
}

/**
 * @brief Exception carrying an ErrorCode and the name of the component that raised it
 *
 * Mostly travels inside a Result; it is only thrown when value() is called
 * on a failed Result.
 */
class TradeError : public std::runtime_error {
public:
    TradeError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /// "[component] message (CODE)"
    std::string to_string() const {
        return "[" + component_ + "] " + what() + " (" + error_code_to_string(code_) + ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Either a value of T or a TradeError
 *
 * Move-only. Callers test is_ok()/is_error() before touching value();
 * value() on a failure rethrows the stored TradeError.
 */
template <typename T>
class Result {
    template <typename U>
    using not_self = std::enable_if_t<!std::is_same<std::decay_t<U>, Result>::value>;

public:
    template <typename U = T, typename = not_self<U>>
    Result(U&& value) : value_(std::in_place, std::forward<U>(value)) {}

    Result(std::unique_ptr<TradeError> error) : error_(std::move(error)) {}

    Result(Result&&) = default;
    Result& operator=(Result&&) = default;
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool is_ok() const {
        return !error_;
    }

    bool is_error() const {
        return static_cast<bool>(error_);
    }

    const T& value() const {
        if (error_)
            throw *error_;
        return *value_;
    }

    /// nullptr on success
    const TradeError* error() const {
        return error_.get();
    }

private:
    std::optional<T> value_;
    std::unique_ptr<TradeError> error_;
};

template <>
class Result<void> {
public:
    Result() = default;
    Result(std::unique_ptr<TradeError> error) : error_(std::move(error)) {}

    bool is_ok() const {
        return !error_;
    }
    bool is_error() const {
        return static_cast<bool>(error_);
    }

    void value() const {
        if (error_)
            throw *error_;
    }

    const TradeError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<TradeError> error_;
};

template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<TradeError>(code, message, component));
}

}  // namespace trade_pilot
