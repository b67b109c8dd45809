#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace kafkasec {

/**
 * @brief Error categories for profile construction
 *
 * None of these are transient: the same input always produces the same
 * error, so callers retry only with corrected configuration.
 */
enum class ErrorCategory {
    NONE,
    CONFIG_ERROR,         // Unknown version, mechanism or field combination
    FILE_ACCESS_ERROR,    // Path unreadable (always names the path)
    PARSE_ERROR,          // No PEM block in key material, malformed CA bundle
    DECRYPTION_ERROR,     // Encrypted key and the passphrase does not open it
    PAIR_MISMATCH_ERROR,  // Certificate and key do not form a pair
    VALIDATION_ERROR,     // Final structural check over the assembled profile
    INTERNAL_ERROR
};

[[nodiscard]] inline constexpr std::string_view error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                return "none";
        case ErrorCategory::CONFIG_ERROR:        return "config_error";
        case ErrorCategory::FILE_ACCESS_ERROR:   return "file_access_error";
        case ErrorCategory::PARSE_ERROR:         return "parse_error";
        case ErrorCategory::DECRYPTION_ERROR:    return "decryption_error";
        case ErrorCategory::PAIR_MISMATCH_ERROR: return "pair_mismatch_error";
        case ErrorCategory::VALIDATION_ERROR:    return "validation_error";
        case ErrorCategory::INTERNAL_ERROR:      return "internal_error";
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

    // Re-wrap another result's error (propagation across value types)
    template<typename U>
    static Result error_from(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
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

} // namespace kafkasec
