#pragma once

#include <optional>
#include <string>
#include <utility>

namespace redactguard {

/**
 * @brief Error categories for pipeline, receipt and ledger operations
 */
enum class ErrorCategory {
    NONE,
    VALIDATION_ERROR,         // Malformed payload or request, rejected before any work
    POLICY_CONFIG_ERROR,      // Manifest missing or invalid for the requested tier
    ENCRYPTION_UNAVAILABLE,   // Receipt key missing, unreadable or rejected
    CHAIN_INTEGRITY_ERROR,    // Ledger verification failed, appends refused
    NOT_FOUND,
    CONFLICT,                 // Write-once record already exists
    STORAGE_ERROR,
    CANCELLED,
    INTERNAL_ERROR
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                   return "none";
        case ErrorCategory::VALIDATION_ERROR:       return "validation_error";
        case ErrorCategory::POLICY_CONFIG_ERROR:    return "policy_config_error";
        case ErrorCategory::ENCRYPTION_UNAVAILABLE: return "encryption_unavailable";
        case ErrorCategory::CHAIN_INTEGRITY_ERROR:  return "chain_integrity_error";
        case ErrorCategory::NOT_FOUND:              return "not_found";
        case ErrorCategory::CONFLICT:               return "conflict";
        case ErrorCategory::STORAGE_ERROR:          return "storage_error";
        case ErrorCategory::CANCELLED:              return "cancelled";
        case ErrorCategory::INTERNAL_ERROR:         return "internal_error";
    }
    return "unknown";
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

/**
 * @brief Result for operations that only report success or failure
 */
template<>
class Result<void> {
public:
    static Result ok() {
        Result r;
        r.success_ = true;
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

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace redactguard
