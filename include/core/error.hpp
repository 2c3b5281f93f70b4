#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace logscrub {

/**
 * @brief Error categories for the sanitizer
 */
enum class ErrorCategory {
    NONE,
    INVALID_INPUT_KIND,
    PATTERN_COMPILATION,
    CONFIG_ERROR,
    PARSE_ERROR,
    INTERNAL_ERROR
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::INVALID_INPUT_KIND: return "INVALID_INPUT_KIND";
        case ErrorCategory::PATTERN_COMPILATION: return "PATTERN_COMPILATION";
        case ErrorCategory::CONFIG_ERROR: return "CONFIG_ERROR";
        case ErrorCategory::PARSE_ERROR: return "PARSE_ERROR";
        case ErrorCategory::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

// ============================================================================
// Exceptions (contract violations, never swallowed by the engine)
// ============================================================================

class SanitizerError : public std::runtime_error {
public:
    SanitizerError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

/**
 * @brief A value that is not string-like was handed to sanitize_message.
 *
 * Callers must not fall back to logging the raw value.
 */
class InvalidInputKindError : public SanitizerError {
public:
    explicit InvalidInputKindError(const std::string& message)
        : SanitizerError(ErrorCategory::INVALID_INPUT_KIND, message) {}
};

/**
 * @brief A detector could not be compiled; the registry is not usable.
 *
 * Fatal at startup: no partially built registry is ever returned.
 */
class PatternCompilationError : public SanitizerError {
public:
    PatternCompilationError(std::string detector, const std::string& message)
        : SanitizerError(ErrorCategory::PATTERN_COMPILATION, message),
          detector_(std::move(detector)) {}

    [[nodiscard]] const std::string& detector() const noexcept { return detector_; }

private:
    std::string detector_;
};

} // namespace logscrub
