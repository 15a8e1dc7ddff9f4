#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace rsproxy {

/**
 * @brief Error categories for the proxy
 *
 * Per-connection categories (FRAME_ERROR, PROTOCOL_DESYNC, BACKEND_TIMEOUT)
 * close only the connection they occurred on. POOL_EXHAUSTED, BACKEND_UNREACHABLE and
 * NO_PRIMARY are surfaced to the requesting client as transient failures.
 * CONFIGURATION_ERROR is the only process-fatal category.
 */
enum class ErrorCategory {
    NONE,
    FRAME_ERROR,
    POOL_EXHAUSTED,
    BACKEND_UNREACHABLE,
    BACKEND_TIMEOUT,
    CONFIGURATION_ERROR,
    PROTOCOL_DESYNC,
    NO_PRIMARY,
    CONNECTION_CLOSED,
    CANCELLED,
    INTERNAL_ERROR
};

[[nodiscard]] constexpr const char* error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                return "none";
        case ErrorCategory::FRAME_ERROR:         return "frame_error";
        case ErrorCategory::POOL_EXHAUSTED:      return "pool_exhausted";
        case ErrorCategory::BACKEND_UNREACHABLE: return "backend_unreachable";
        case ErrorCategory::BACKEND_TIMEOUT:     return "backend_timeout";
        case ErrorCategory::CONFIGURATION_ERROR: return "configuration_error";
        case ErrorCategory::PROTOCOL_DESYNC:     return "protocol_desync";
        case ErrorCategory::NO_PRIMARY:          return "no_primary";
        case ErrorCategory::CONNECTION_CLOSED:   return "connection_closed";
        case ErrorCategory::CANCELLED:           return "cancelled";
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
 * @brief Startup configuration failure. The proxy refuses to serve.
 */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Raised by Proxy::start() when the global backend connection limit is 0
 */
class ZeroMaxConnectionsError : public ConfigurationError {
public:
    ZeroMaxConnectionsError()
        : ConfigurationError("rsproxy: backend.max_connections cannot be 0") {}
};

} // namespace rsproxy
