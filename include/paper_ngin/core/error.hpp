// include/paper_ngin/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace paper_ngin {

/**
 * @brief Error codes for the paper trading engine
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Signal / input errors
    INVALID_SIGNAL = 4,

    // Ledger errors
    INSUFFICIENT_FUNDS = 5,
    DUPLICATE_POSITION = 6,
    POSITION_NOT_FOUND = 7,
    PORTFOLIO_NOT_FOUND = 8,
    DUPLICATE_PORTFOLIO = 9,
    CORRUPTED_STATE = 10,

    // Market data errors
    PRICE_UNAVAILABLE = 11,

    // Storage errors
    STORAGE_CONFLICT = 12,
    DATABASE_ERROR = 13,
    DATA_NOT_FOUND = 14,
    CONVERSION_ERROR = 15,

    // System errors
    CONNECTION_ERROR = 16,
    TIMEOUT_ERROR = 17,
    API_ERROR = 18,

    // File and parsing errors
    FILE_IO_ERROR = 19,
    JSON_PARSE_ERROR = 20,

    CUSTOM_ERROR_START = 1000
};

/**
 * @brief Human readable name of an error code
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::INVALID_SIGNAL:
            return "INVALID_SIGNAL";
        case ErrorCode::INSUFFICIENT_FUNDS:
            return "INSUFFICIENT_FUNDS";
        case ErrorCode::DUPLICATE_POSITION:
            return "DUPLICATE_POSITION";
        case ErrorCode::POSITION_NOT_FOUND:
            return "POSITION_NOT_FOUND";
        case ErrorCode::PORTFOLIO_NOT_FOUND:
            return "PORTFOLIO_NOT_FOUND";
        case ErrorCode::DUPLICATE_PORTFOLIO:
            return "DUPLICATE_PORTFOLIO";
        case ErrorCode::CORRUPTED_STATE:
            return "CORRUPTED_STATE";
        case ErrorCode::PRICE_UNAVAILABLE:
            return "PRICE_UNAVAILABLE";
        case ErrorCode::STORAGE_CONFLICT:
            return "STORAGE_CONFLICT";
        case ErrorCode::DATABASE_ERROR:
            return "DATABASE_ERROR";
        case ErrorCode::DATA_NOT_FOUND:
            return "DATA_NOT_FOUND";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::CONNECTION_ERROR:
            return "CONNECTION_ERROR";
        case ErrorCode::TIMEOUT_ERROR:
            return "TIMEOUT_ERROR";
        case ErrorCode::API_ERROR:
            return "API_ERROR";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Whether an error is worth retrying locally
 * Network and database hiccups are transient; ledger and validation errors are not.
 */
inline bool is_transient(ErrorCode code) {
    return code == ErrorCode::DATABASE_ERROR || code == ErrorCode::CONNECTION_ERROR ||
           code == ErrorCode::TIMEOUT_ERROR || code == ErrorCode::API_ERROR ||
           code == ErrorCode::PRICE_UNAVAILABLE;
}

/**
 * @brief Exception type carried by every failed Result
 */
class TradeError : public std::runtime_error {
public:
    /**
     * @brief Constructor for TradeError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    TradeError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (" + error_code_to_string(code_) +
               ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The type of the successful result
 */
template <typename T>
class Result {
public:
    /**
     * @brief Constructor for success case
     * @param value The successful result
     */
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    /**
     * @brief Constructor for error case
     * @param error The error that occurred
     */
    Result(std::unique_ptr<TradeError> error) : error_(std::move(error)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_(std::move(other.error_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_ = std::move(other.error_);
        }
        return *this;
    }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool is_ok() const {
        return error_ == nullptr;
    }

    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @throws TradeError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const TradeError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<TradeError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<TradeError> error) : error_(std::move(error)) {}

    bool is_ok() const {
        return error_ == nullptr;
    }
    bool is_error() const {
        return error_ != nullptr;
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

/**
 * @brief Helper for creating error results
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<TradeError>(code, message, component));
}

/**
 * @brief Re-wrap the error of one Result into a Result of another type
 */
template <typename T, typename U>
Result<T> forward_error(const Result<U>& failed) {
    return make_error<T>(failed.error()->code(), failed.error()->what(),
                         failed.error()->component());
}

}  // namespace paper_ngin
