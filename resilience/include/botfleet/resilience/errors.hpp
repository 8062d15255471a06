#pragma once

#include <caf/atom.hpp>
#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/make_message.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace botfleet {
namespace resilience {

// Error category as seen by the retry layer.
// Closed set: every failure observed from the upstream maps to exactly one.
enum class ErrorCategory {
    rate_limited,       // Server-imposed throttling, may carry a wait hint
    transient_network,  // Timeouts, connection resets, 5xx-equivalents
    permanent,          // Auth failure, banned or deactivated identity
    unknown
};

// Machine-readable error codes for programmatic error handling.
// Values fit in a caf::error code (uint8_t).
enum class ErrorCode : uint8_t {
    none = 0,
    // Local admission rejections
    rate_limited = 1,
    circuit_open = 2,
    pool_exhausted = 3,
    session_busy = 4,
    tenant_suspended = 5,
    // Upstream failures
    upstream_rate_limited = 10,
    transient_network = 11,
    permanent = 12,
    unknown = 13,
    // Runtime
    invalid_config = 20,
    store_unavailable = 21,
    not_found = 22,
    cancelled = 23
};

inline std::string to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::rate_limited:
            return "rate_limited";
        case ErrorCategory::transient_network:
            return "transient_network";
        case ErrorCategory::permanent:
            return "permanent";
        case ErrorCategory::unknown:
            return "unknown";
    }
    return "unknown";
}

inline std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::none:
            return "NONE";
        case ErrorCode::rate_limited:
            return "RATE_LIMITED";
        case ErrorCode::circuit_open:
            return "CIRCUIT_OPEN";
        case ErrorCode::pool_exhausted:
            return "POOL_EXHAUSTED";
        case ErrorCode::session_busy:
            return "SESSION_BUSY";
        case ErrorCode::tenant_suspended:
            return "TENANT_SUSPENDED";
        case ErrorCode::upstream_rate_limited:
            return "UPSTREAM_RATE_LIMITED";
        case ErrorCode::transient_network:
            return "TRANSIENT_NETWORK";
        case ErrorCode::permanent:
            return "PERMANENT";
        case ErrorCode::unknown:
            return "UNKNOWN";
        case ErrorCode::invalid_config:
            return "INVALID_CONFIG";
        case ErrorCode::store_unavailable:
            return "STORE_UNAVAILABLE";
        case ErrorCode::not_found:
            return "NOT_FOUND";
        case ErrorCode::cancelled:
            return "CANCELLED";
    }
    return "UNKNOWN_ERROR";
}

inline ErrorCode error_code_for(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::rate_limited:
            return ErrorCode::upstream_rate_limited;
        case ErrorCategory::transient_network:
            return ErrorCode::transient_network;
        case ErrorCategory::permanent:
            return ErrorCode::permanent;
        case ErrorCategory::unknown:
            return ErrorCode::unknown;
    }
    return ErrorCode::unknown;
}

// caf::error integration for the caf::expected based APIs
constexpr caf::atom_value error_category_atom = caf::atom("botfleet");

inline caf::error make_error(ErrorCode code) {
    return caf::error{static_cast<uint8_t>(code), error_category_atom};
}

inline caf::error make_error(ErrorCode code, std::string message) {
    return caf::error{static_cast<uint8_t>(code), error_category_atom,
                      caf::make_message(std::move(message))};
}

// Returns ErrorCode::unknown for errors outside the botfleet category
inline ErrorCode error_code_of(const caf::error& err) {
    if (!err) {
        return ErrorCode::none;
    }
    if (err.category() != error_category_atom) {
        return ErrorCode::unknown;
    }
    return static_cast<ErrorCode>(err.code());
}

/**
 * Base class for every error raised by the resilience layer itself.
 * Callers can catch this to distinguish local decisions from upstream failures.
 */
class ResilienceError : public std::runtime_error {
public:
    ResilienceError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// Local admission rejection by the token buckets
class RateLimitExceeded : public ResilienceError {
public:
    RateLimitExceeded(const std::string& tenant_id, double retry_after_seconds)
        : ResilienceError(ErrorCode::rate_limited,
                          "Rate limit exceeded for tenant " + tenant_id),
          tenant_id_(tenant_id), retry_after_seconds_(retry_after_seconds) {}

    const std::string& tenant_id() const { return tenant_id_; }
    double retry_after_seconds() const { return retry_after_seconds_; }

private:
    std::string tenant_id_;
    double retry_after_seconds_;
};

class CircuitOpenError : public ResilienceError {
public:
    CircuitOpenError(const std::string& tenant_id, double timeout_remaining_seconds)
        : ResilienceError(ErrorCode::circuit_open,
                          "Circuit breaker open for tenant " + tenant_id),
          tenant_id_(tenant_id), timeout_remaining_seconds_(timeout_remaining_seconds) {}

    const std::string& tenant_id() const { return tenant_id_; }
    double timeout_remaining_seconds() const { return timeout_remaining_seconds_; }

private:
    std::string tenant_id_;
    double timeout_remaining_seconds_;
};

class PoolExhaustedError : public ResilienceError {
public:
    explicit PoolExhaustedError(const std::string& tenant_id)
        : ResilienceError(ErrorCode::pool_exhausted,
                          "Session pool exhausted while acquiring for tenant " + tenant_id) {}
};

class SessionBusyError : public ResilienceError {
public:
    explicit SessionBusyError(const std::string& tenant_id)
        : ResilienceError(ErrorCode::session_busy,
                          "Tenant " + tenant_id + " already holds an open session") {}
};

// Calls for a suspended tenant are refused until it is resumed
class TenantSuspendedError : public ResilienceError {
public:
    TenantSuspendedError(const std::string& tenant_id, const std::string& reason)
        : ResilienceError(ErrorCode::tenant_suspended,
                          "Tenant " + tenant_id + " is suspended: " + reason) {}
};

class OperationCancelled : public ResilienceError {
public:
    OperationCancelled() : ResilienceError(ErrorCode::cancelled, "Operation cancelled") {}
};

// Raised instead of the original exception when a failure is classified as permanent
class NonRetryableError : public ResilienceError {
public:
    explicit NonRetryableError(const std::string& original_message)
        : ResilienceError(ErrorCode::permanent, "Non-retryable failure: " + original_message),
          original_message_(original_message) {}

    const std::string& original_message() const { return original_message_; }

private:
    std::string original_message_;
};

/**
 * Typed failure thrown by upstream adapters.
 *
 * Carries its category explicitly so the default classifier does not need to
 * inspect the message. A rate-limit failure may carry the server-provided wait.
 */
class UpstreamError : public std::runtime_error {
public:
    UpstreamError(ErrorCategory category, const std::string& message,
                  std::optional<double> retry_after_seconds = std::nullopt)
        : std::runtime_error(message), category_(category),
          retry_after_seconds_(retry_after_seconds) {}

    ErrorCategory category() const { return category_; }
    std::optional<double> retry_after_seconds() const { return retry_after_seconds_; }

private:
    ErrorCategory category_;
    std::optional<double> retry_after_seconds_;
};

} // namespace resilience
} // namespace botfleet
