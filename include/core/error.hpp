#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace goldminer {

// Why a rule file or pattern could not be turned into usable rules
enum class ErrorCategory {
    NONE,
    CONFIG_NOT_FOUND,
    CONFIG_MALFORMED,
    PATTERN_ERROR,
    STORE_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:             return "none";
        case ErrorCategory::CONFIG_NOT_FOUND: return "config_not_found";
        case ErrorCategory::CONFIG_MALFORMED: return "config_malformed";
        case ErrorCategory::PATTERN_ERROR:    return "pattern_error";
        case ErrorCategory::STORE_ERROR:      return "store_error";
        case ErrorCategory::INTERNAL_ERROR:   return "internal_error";
    }
    return "unknown";
}

struct Error {
    ErrorCategory category = ErrorCategory::INTERNAL_ERROR;
    std::string message;
};

/**
 * @brief Either a value or an Error; used for recoverable failures such as
 * loading rule files, where the caller decides whether to abort or keep
 * the previous rules.
 */
template<typename T>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }

    static Result error(ErrorCategory category, std::string message) {
        return Result(Error{category, std::move(message)});
    }

    [[nodiscard]] bool is_ok() const { return std::holds_alternative<T>(state_); }
    [[nodiscard]] bool is_error() const { return !is_ok(); }

    const T& value() const { return std::get<T>(state_); }
    T& value() { return std::get<T>(state_); }

    [[nodiscard]] ErrorCategory error_category() const {
        return is_ok() ? ErrorCategory::NONE : std::get<Error>(state_).category;
    }

    [[nodiscard]] const std::string& error_message() const {
        static const std::string kNoError;
        return is_ok() ? kNoError : std::get<Error>(state_).message;
    }

private:
    explicit Result(T value) : state_(std::move(value)) {}
    explicit Result(Error error) : state_(std::move(error)) {}

    std::variant<T, Error> state_;
};

/**
 * @brief Programming error: a value that must never reach downstream code
 * (malformed card suffix, identity hash over a missing field).
 */
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace goldminer
