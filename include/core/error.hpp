#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace docredact {

/**
 * @brief Error categories for the redaction core
 */
enum class ErrorCategory {
    NONE,
    TEMPLATE_ERROR,
    CONFIG_ERROR,
    FORMAT_ERROR,
    PARSE_ERROR,
    STREAM_INTEGRITY_ERROR,
    VERIFICATION_ERROR,
    IO_ERROR,
    DEADLINE_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                   return "none";
        case ErrorCategory::TEMPLATE_ERROR:         return "template_error";
        case ErrorCategory::CONFIG_ERROR:           return "config_error";
        case ErrorCategory::FORMAT_ERROR:           return "format_error";
        case ErrorCategory::PARSE_ERROR:            return "parse_error";
        case ErrorCategory::STREAM_INTEGRITY_ERROR: return "stream_integrity_error";
        case ErrorCategory::VERIFICATION_ERROR:     return "verification_error";
        case ErrorCategory::IO_ERROR:               return "io_error";
        case ErrorCategory::DEADLINE_ERROR:         return "deadline_error";
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

// ============================================================================
// Exception taxonomy
// ============================================================================

class RedactionError : public std::runtime_error {
public:
    RedactionError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const { return category_; }

private:
    ErrorCategory category_;
};

/// Bad rule metadata. Raised before any document I/O.
class TemplateValidationError : public RedactionError {
public:
    explicit TemplateValidationError(const std::string& message)
        : RedactionError(ErrorCategory::TEMPLATE_ERROR, message) {}
};

/// Zero entities detected. The document needs manual review.
class NoMatchesError : public RedactionError {
public:
    explicit NoMatchesError(const std::string& message)
        : RedactionError(ErrorCategory::NONE, message) {}
};

class UnsupportedFormatError : public RedactionError {
public:
    explicit UnsupportedFormatError(const std::string& message)
        : RedactionError(ErrorCategory::FORMAT_ERROR, message) {}
};

/// BT/ET imbalance after filtering a content stream.
class StreamIntegrityError : public RedactionError {
public:
    StreamIntegrityError(int page, const std::string& message)
        : RedactionError(ErrorCategory::STREAM_INTEGRITY_ERROR, message), page_(page) {}

    [[nodiscard]] int page() const { return page_; }

private:
    int page_;
};

struct RemainingFragment {
    std::string text;
    std::optional<int> page;     // 1-based, PDF only
    std::string location;        // part name or "page N"
};

/**
 * @brief Sensitive text survived every redaction attempt.
 *
 * The only error that propagates to the caller as a hard failure. Carries
 * the exact remaining fragments for audit.
 */
class VerificationError : public RedactionError {
public:
    VerificationError(const std::string& message, std::vector<RemainingFragment> remaining)
        : RedactionError(ErrorCategory::VERIFICATION_ERROR, message),
          remaining_(std::move(remaining)) {}

    [[nodiscard]] const std::vector<RemainingFragment>& remaining() const { return remaining_; }

private:
    std::vector<RemainingFragment> remaining_;
};

class DeadlineExceededError : public RedactionError {
public:
    explicit DeadlineExceededError(const std::string& message)
        : RedactionError(ErrorCategory::DEADLINE_ERROR, message) {}
};

} // namespace docredact
