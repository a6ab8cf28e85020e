#pragma once

#include <string>
#include <optional>

namespace privguard {

/**
 * @brief Error categories for the anonymization pipeline
 *
 * MALFORMED_SPAN and COLLABORATOR_UNAVAILABLE are absorbed locally (logged
 * and recorded as a note). UNRESOLVED_ENTITY and OFFSET_OUT_OF_BOUNDS abort
 * the run and are returned to the caller.
 */
enum class ErrorCategory {
    NONE,
    MALFORMED_SPAN,
    UNRESOLVED_ENTITY,
    OFFSET_OUT_OF_BOUNDS,
    COLLABORATOR_UNAVAILABLE,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                     return "none";
        case ErrorCategory::MALFORMED_SPAN:           return "malformed_span";
        case ErrorCategory::UNRESOLVED_ENTITY:        return "unresolved_entity";
        case ErrorCategory::OFFSET_OUT_OF_BOUNDS:     return "offset_out_of_bounds";
        case ErrorCategory::COLLABORATOR_UNAVAILABLE: return "collaborator_unavailable";
        case ErrorCategory::CONFIG_ERROR:             return "config_error";
        case ErrorCategory::INTERNAL_ERROR:           return "internal_error";
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

    /// Re-wrap another result's error under this value type
    template<typename U>
    static Result propagate(const Result<U>& other) {
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

} // namespace privguard
