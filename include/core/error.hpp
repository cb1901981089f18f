#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace redactkit {

/**
 * @brief Error categories for registration and configuration failures
 */
enum class ErrorCategory {
    NONE,
    CONFIG_ERROR,
    UNRESOLVED_CLASSIFICATION,
    INVALID_FIELD_MODE,
    DUPLICATE_FIELD,
    MISSING_FIELD,
    INVALID_TEMPLATE,
    DUPLICATE_TYPE,
    UNREGISTERED_TYPE,
    REGISTRY_FROZEN,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                      return "none";
        case ErrorCategory::CONFIG_ERROR:              return "config_error";
        case ErrorCategory::UNRESOLVED_CLASSIFICATION: return "unresolved_classification";
        case ErrorCategory::INVALID_FIELD_MODE:        return "invalid_field_mode";
        case ErrorCategory::DUPLICATE_FIELD:           return "duplicate_field";
        case ErrorCategory::MISSING_FIELD:             return "missing_field";
        case ErrorCategory::INVALID_TEMPLATE:          return "invalid_template";
        case ErrorCategory::DUPLICATE_TYPE:            return "duplicate_type";
        case ErrorCategory::UNREGISTERED_TYPE:         return "unregistered_type";
        case ErrorCategory::REGISTRY_FROZEN:           return "registry_frozen";
        case ErrorCategory::INTERNAL_ERROR:            return "internal_error";
    }
    return "unknown";
}

/**
 * @brief Thrown when a classification or traversal plan cannot be registered.
 *
 * Every failure of this kind surfaces during the registration phase; a plan
 * that registered successfully never throws from redact().
 */
class RegistrationError : public std::runtime_error {
public:
    RegistrationError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

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

} // namespace redactkit
