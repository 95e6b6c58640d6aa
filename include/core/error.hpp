#pragma once

#include <string>
#include <string_view>
#include <optional>

namespace quill {

/**
 * @brief Error categories for the request core
 *
 * Scripting: EVAL_ERROR, CALL_ERROR, CONVERSION_ERROR
 * Patching:  INVALID_HEADER_VALUE (recovered by dropping the patch)
 * Rendering: INVALID_REGEX, HTML_REWRITE_ERROR, JSON_AFTER_REGEX,
 *            JSON_PATCH_ERROR, TEMPLATE_ERROR, IO_ERROR
 * Startup:   THEME_BOOTSTRAP, PLUGIN_BOOTSTRAP, CONFIG_ERROR
 */
enum class ErrorCategory {
    NONE,
    EVAL_ERROR,
    CALL_ERROR,
    CONVERSION_ERROR,
    TIMEOUT_ERROR,
    INVALID_HEADER_VALUE,
    INVALID_REGEX,
    HTML_REWRITE_ERROR,
    JSON_AFTER_REGEX,
    JSON_PATCH_ERROR,
    TEMPLATE_ERROR,
    IO_ERROR,
    MISSING_CONTEXT,
    THEME_BOOTSTRAP,
    PLUGIN_BOOTSTRAP,
    CONTEXT_ERROR,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] constexpr std::string_view error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                 return "none";
        case ErrorCategory::EVAL_ERROR:           return "eval";
        case ErrorCategory::CALL_ERROR:           return "call";
        case ErrorCategory::CONVERSION_ERROR:     return "conversion";
        case ErrorCategory::TIMEOUT_ERROR:        return "timeout";
        case ErrorCategory::INVALID_HEADER_VALUE: return "invalid_header_value";
        case ErrorCategory::INVALID_REGEX:        return "invalid_regex";
        case ErrorCategory::HTML_REWRITE_ERROR:   return "html_rewrite";
        case ErrorCategory::JSON_AFTER_REGEX:     return "json_after_regex";
        case ErrorCategory::JSON_PATCH_ERROR:     return "json_patch";
        case ErrorCategory::TEMPLATE_ERROR:       return "template";
        case ErrorCategory::IO_ERROR:             return "io";
        case ErrorCategory::MISSING_CONTEXT:      return "missing_context";
        case ErrorCategory::THEME_BOOTSTRAP:      return "theme_bootstrap";
        case ErrorCategory::PLUGIN_BOOTSTRAP:     return "plugin_bootstrap";
        case ErrorCategory::CONTEXT_ERROR:        return "context";
        case ErrorCategory::CONFIG_ERROR:         return "config";
        case ErrorCategory::INTERNAL_ERROR:       return "internal";
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

    /// Re-tag another result's error (value type differs)
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

/**
 * @brief Unit result (success carries no value)
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

    template<typename U>
    static Result error_from(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
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

} // namespace quill
