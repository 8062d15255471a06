#pragma once

#include "botfleet/resilience/config.hpp"
#include <caf/expected.hpp>
#include <cstdint>
#include <string>

namespace botfleet {
namespace resilience {

// Retry knobs for one error category; durations are milliseconds
struct RetryOptions {
    int64_t max_retries = 2;
    int64_t base_delay_ms = 1000;
    int64_t max_delay_ms = 30000;
    std::string strategy = "exponential";
    double exponential_base = 2.0;
    bool jitter = true;
    bool honor_retry_after = false;
};

/**
 * Flat option set behind the botfleet_guard command line and INI file.
 * Every tunable of ResilienceConfig has a field here; durations are
 * milliseconds. Defaults match ResilienceConfig's defaults.
 */
struct GuardOptions {
    std::string instance_id = "botfleet";
    int64_t worker_threads = 4;

    double global_capacity = 30.0;
    double global_refill = 30.0;
    double tenant_capacity = 20.0;
    double tenant_refill = 1.0;
    int64_t idle_bucket_ttl_ms = 3600000;
    int64_t max_admission_wait_ms = 5000;
    int64_t shared_store_timeout_ms = 50;

    int64_t breaker_failure_threshold = 5;
    int64_t breaker_success_threshold = 2;
    int64_t breaker_timeout_ms = 60000;
    int64_t breaker_transition_history = 20;

    RetryOptions retry_rate_limited{3, 1000, 60000, "exponential", 2.0, false, true};
    RetryOptions retry_transient{2, 1000, 30000, "exponential", 2.0, true, false};
    RetryOptions retry_unknown{2, 2000, 30000, "exponential", 2.0, true, false};

    double warning_error_rate = 0.1;
    double critical_error_rate = 0.5;
    int64_t max_consecutive_failures = 5;
    double warning_latency_ms = 1000.0;
    double critical_latency_ms = 5000.0;
    double latency_ema_alpha = 0.3;

    int64_t max_total_connections = 50;
    int64_t acquire_timeout_ms = 30000;
    int64_t session_timeout_ms = 300000;
    int64_t session_history_size = 1000;
    int64_t session_metrics_window_ms = 3600000;

    int64_t cleanup_interval_ms = 300000;
    int64_t tenant_idle_timeout_ms = 3600000;
    int64_t stale_session_interval_ms = 60000;

    bool persistence_enabled = false;
    std::string database_path = "botfleet_health.db";
    int64_t persist_interval_ms = 300000;
    int64_t retention_days = 30;

    std::string metrics_endpoint = "0.0.0.0:9090";
};

// Maps the flat options onto ResilienceConfig and validates the result
caf::expected<ResilienceConfig> to_resilience_config(const GuardOptions& options);

} // namespace resilience
} // namespace botfleet
