// include/barsim/core/error.hpp

#pragma once

#include <cstddef>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace barsim {

/**
 * @brief Error codes for the simulation core
 * Defines all possible error conditions that can occur
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Input data errors
    MALFORMED_DATA = 4,
    EMPTY_SERIES = 5,
    INVALID_DATA = 6,
    CONVERSION_ERROR = 7,

    // Run configuration errors
    INVALID_CONFIG = 8,

    // Strategy errors
    STRATEGY_EXECUTION_ERROR = 9,
    INDICATOR_ERROR = 10,
    INVALID_DECISION = 11,

    // Run control
    CANCELLED = 12,

    // File and I/O errors
    FILE_NOT_FOUND = 20,
    FILE_IO_ERROR = 21,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 23,

    // Custom error range
    CUSTOM_ERROR_START = 1000
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::MALFORMED_DATA:
            return "MALFORMED_DATA";
        case ErrorCode::EMPTY_SERIES:
            return "EMPTY_SERIES";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::INVALID_CONFIG:
            return "INVALID_CONFIG";
        case ErrorCode::STRATEGY_EXECUTION_ERROR:
            return "STRATEGY_EXECUTION_ERROR";
        case ErrorCode::INDICATOR_ERROR:
            return "INDICATOR_ERROR";
        case ErrorCode::INVALID_DECISION:
            return "INVALID_DECISION";
        case ErrorCode::CANCELLED:
            return "CANCELLED";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Error type carried by every failed Result
 */
class BarsimError : public std::runtime_error {
public:
    /**
     * @brief Constructor for BarsimError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    BarsimError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    virtual ~BarsimError() = default;

    /**
     * @brief Get the error code
     * @return ErrorCode representing the type of error
     */
    ErrorCode code() const noexcept {
        return code_;
    }

    /**
     * @brief Get the component where error occurred
     * @return String identifying the component
     */
    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    virtual std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (Code: " +
               error_code_to_string(code_) + ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Fatal mid-run failure of a strategy step
 *
 * Raised when next() or indicator evaluation fails, or when a strategy
 * returns a Decision outside {LONG, SHORT, CLOSE, HOLD}. Carries the index
 * of the step that failed and the error code of the underlying cause.
 */
class StrategyExecutionError : public BarsimError {
public:
    StrategyExecutionError(std::size_t step, ErrorCode cause, const std::string& message,
                           const std::string& component = "")
        : BarsimError(ErrorCode::STRATEGY_EXECUTION_ERROR,
                      "Step " + std::to_string(step) + ": " + message, component),
          step_(step),
          cause_(cause) {}

    std::size_t step() const noexcept {
        return step_;
    }

    ErrorCode cause() const noexcept {
        return cause_;
    }

    std::string to_string() const override {
        return BarsimError::to_string() + " [cause: " + error_code_to_string(cause_) + "]";
    }

private:
    std::size_t step_;
    ErrorCode cause_;
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
     * @tparam U The type of the successful result
     */
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    /**
     * @brief Constructor for error case
     * @param error The error that occurred
     */
    Result(std::unique_ptr<BarsimError> error) : value_(), error_(std::move(error)) {}

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

    /**
     * @brief Check if result represents success
     * @return true if operation was successful
     */
    bool is_ok() const {
        return error_ == nullptr;
    }

    /**
     * @brief Check if result represents error
     * @return true if operation failed
     */
    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @return Reference to the contained value
     * @throws BarsimError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out of the result
     * @throws BarsimError if result represents an error
     */
    T take_value() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const BarsimError* error() const {
        return error_.get();
    }

    /**
     * @brief Transfer ownership of the error, leaving the result empty
     */
    std::unique_ptr<BarsimError> release_error() {
        return std::move(error_);
    }

private:
    T value_;
    std::unique_ptr<BarsimError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<BarsimError> error) : error_(std::move(error)) {}

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

    const BarsimError* error() const {
        return error_.get();
    }

    std::unique_ptr<BarsimError> release_error() {
        return std::move(error_);
    }

private:
    std::unique_ptr<BarsimError> error_;
};

/**
 * @brief Helper for creating error results
 * @tparam T The type of the successful result
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 * @return Result representing the error
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<BarsimError>(code, message, component));
}

/**
 * @brief Helper for creating a step failure result
 */
template <typename T>
Result<T> make_step_error(std::size_t step, ErrorCode cause, const std::string& message,
                          const std::string& component = "") {
    std::unique_ptr<BarsimError> error =
        std::make_unique<StrategyExecutionError>(step, cause, message, component);
    return Result<T>(std::move(error));
}

}  // namespace barsim
