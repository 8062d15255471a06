#pragma once

#include "botfleet/resilience/errors.hpp"
#include <caf/expected.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace botfleet {
namespace resilience {

using std::chrono::milliseconds;

enum class BackoffStrategy {
    exponential,  // base * exponential_base^attempt
    linear,       // base * (attempt + 1)
    fixed,        // base
    fibonacci     // base * fib(attempt), fib = 1, 1, 2, 3, 5, ...
};

std::string to_string(BackoffStrategy strategy);

// Parses the names produced by to_string(); unknown names are an error
caf::expected<BackoffStrategy> parse_backoff_strategy(const std::string& name);

struct BucketConfig {
    double capacity = 30.0;
    double refill_per_second = 30.0;
};

struct RateLimiterConfig {
    BucketConfig global_bucket{30.0, 30.0};  // Shared upstream budget
    BucketConfig tenant_bucket{20.0, 1.0};   // Per-tenant fairness
    milliseconds idle_bucket_ttl{3600000};
    milliseconds max_admission_wait{5000};   // Bounded wait before failing with retry_after
    milliseconds shared_store_timeout{50};   // Request timeout against the shared store
};

struct BreakerConfig {
    uint32_t failure_threshold = 5;
    uint32_t success_threshold = 2;
    milliseconds timeout{60000};     // Cool-down before the first trial
    size_t transition_history = 20;  // Transition events kept per breaker
};

struct CategoryRetryPolicy {
    int32_t max_retries = 2;
    milliseconds base_delay{1000};
    milliseconds max_delay{30000};
    BackoffStrategy strategy = BackoffStrategy::exponential;
    double exponential_base = 2.0;
    bool jitter = true;
    bool honor_retry_after = false;  // Use a server-provided wait verbatim when present
};

struct RetryConfig {
    CategoryRetryPolicy rate_limited{3, milliseconds(1000), milliseconds(60000),
                                     BackoffStrategy::exponential, 2.0, false, true};
    CategoryRetryPolicy transient_network{2, milliseconds(1000), milliseconds(30000),
                                          BackoffStrategy::exponential, 2.0, true, false};
    CategoryRetryPolicy permanent{0, milliseconds(0), milliseconds(0),
                                  BackoffStrategy::fixed, 1.0, false, false};
    CategoryRetryPolicy unknown{2, milliseconds(2000), milliseconds(30000),
                                BackoffStrategy::exponential, 2.0, true, false};

    const CategoryRetryPolicy& for_category(ErrorCategory category) const;
    CategoryRetryPolicy& for_category(ErrorCategory category);
};

struct HealthThresholds {
    double warning_error_rate = 0.1;
    double critical_error_rate = 0.5;
    uint32_t max_consecutive_failures = 5;
    double warning_latency_ms = 1000.0;
    double critical_latency_ms = 5000.0;
    double latency_ema_alpha = 0.3;
};

struct SessionPoolConfig {
    size_t max_total_connections = 50;
    milliseconds acquire_timeout{30000};
    milliseconds session_timeout{300000};  // Open longer than this = stale
    size_t history_size = 1000;
    milliseconds metrics_window{3600000};
};

struct SweepConfig {
    milliseconds cleanup_interval{300000};
    milliseconds tenant_idle_timeout{3600000};
    milliseconds stale_session_interval{60000};
};

struct PersistenceConfig {
    bool enabled = false;
    std::string database_path = "botfleet_health.db";
    milliseconds persist_interval{300000};
    std::chrono::hours retention{24 * 30};
};

struct ResilienceConfig {
    std::string instance_id = "botfleet";
    size_t worker_threads = 4;
    RateLimiterConfig rate_limiter;
    BreakerConfig breaker;
    RetryConfig retry;
    HealthThresholds health;
    SessionPoolConfig session_pool;
    SweepConfig sweep;
    PersistenceConfig persistence;
};

/**
 * Validate a configuration before any component is built.
 *
 * Rejects:
 * - non-positive bucket capacities or refill rates
 * - zero breaker thresholds
 * - warning thresholds at or above their critical counterparts
 * - EMA alpha outside (0, 1]
 * - a zero connection maximum or worker count
 * - negative retry counts or max_delay below base_delay
 */
caf::expected<void> validate(const ResilienceConfig& config);

} // namespace resilience
} // namespace botfleet
