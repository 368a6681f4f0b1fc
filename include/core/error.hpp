#pragma once

#include <string>
#include <optional>

namespace execbox {

/**
 * @brief Error categories for the sandbox runtime
 */
enum class ErrorCategory {
    NONE,
    SYNTAX_ERROR,
    SECURITY_BLOCK,
    POLICY_VIOLATION,
    EXECUTION_TIMEOUT,
    RUNTIME_EXCEPTION,
    GENERATION_VERIFICATION,
    PROVIDER_ERROR,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                    return "None";
        case ErrorCategory::SYNTAX_ERROR:            return "SyntaxError";
        case ErrorCategory::SECURITY_BLOCK:          return "SecurityBlockViolation";
        case ErrorCategory::POLICY_VIOLATION:        return "PolicyViolation";
        case ErrorCategory::EXECUTION_TIMEOUT:       return "ExecutionTimeout";
        case ErrorCategory::RUNTIME_EXCEPTION:       return "RuntimeException";
        case ErrorCategory::GENERATION_VERIFICATION: return "GenerationVerificationError";
        case ErrorCategory::PROVIDER_ERROR:          return "ProviderError";
        case ErrorCategory::CONFIG_ERROR:            return "ConfigError";
        case ErrorCategory::INTERNAL_ERROR:          return "InternalError";
        default:                                     return "Unknown";
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

} // namespace execbox
