#include "botfleet/resilience/guard_options.hpp"
#include <algorithm>
#include <utility>

namespace botfleet {
namespace resilience {

namespace {

template <class T>
T non_negative(int64_t value) {
    return static_cast<T>(std::max<int64_t>(0, value));
}

caf::expected<CategoryRetryPolicy> to_retry_policy(const RetryOptions& o) {
    auto strategy = parse_backoff_strategy(o.strategy);
    if (!strategy) {
        return strategy.error();
    }
    CategoryRetryPolicy policy;
    policy.max_retries = static_cast<int32_t>(o.max_retries);
    policy.base_delay = milliseconds(o.base_delay_ms);
    policy.max_delay = milliseconds(o.max_delay_ms);
    policy.strategy = *strategy;
    policy.exponential_base = o.exponential_base;
    policy.jitter = o.jitter;
    policy.honor_retry_after = o.honor_retry_after;
    return policy;
}

} // namespace

caf::expected<ResilienceConfig> to_resilience_config(const GuardOptions& o) {
    ResilienceConfig config;
    config.instance_id = o.instance_id;
    config.worker_threads = non_negative<size_t>(o.worker_threads);

    config.rate_limiter.global_bucket = BucketConfig{o.global_capacity, o.global_refill};
    config.rate_limiter.tenant_bucket = BucketConfig{o.tenant_capacity, o.tenant_refill};
    config.rate_limiter.idle_bucket_ttl = milliseconds(o.idle_bucket_ttl_ms);
    config.rate_limiter.max_admission_wait = milliseconds(o.max_admission_wait_ms);
    config.rate_limiter.shared_store_timeout = milliseconds(o.shared_store_timeout_ms);

    config.breaker.failure_threshold = non_negative<uint32_t>(o.breaker_failure_threshold);
    config.breaker.success_threshold = non_negative<uint32_t>(o.breaker_success_threshold);
    config.breaker.timeout = milliseconds(o.breaker_timeout_ms);
    config.breaker.transition_history = non_negative<size_t>(o.breaker_transition_history);

    // Permanent failures keep their fixed zero-retry policy
    std::pair<const RetryOptions*, CategoryRetryPolicy*> retry[] = {
        {&o.retry_rate_limited, &config.retry.rate_limited},
        {&o.retry_transient, &config.retry.transient_network},
        {&o.retry_unknown, &config.retry.unknown},
    };
    for (auto& entry : retry) {
        auto policy = to_retry_policy(*entry.first);
        if (!policy) {
            return policy.error();
        }
        *entry.second = *policy;
    }

    config.health.warning_error_rate = o.warning_error_rate;
    config.health.critical_error_rate = o.critical_error_rate;
    config.health.max_consecutive_failures = non_negative<uint32_t>(o.max_consecutive_failures);
    config.health.warning_latency_ms = o.warning_latency_ms;
    config.health.critical_latency_ms = o.critical_latency_ms;
    config.health.latency_ema_alpha = o.latency_ema_alpha;

    config.session_pool.max_total_connections = non_negative<size_t>(o.max_total_connections);
    config.session_pool.acquire_timeout = milliseconds(o.acquire_timeout_ms);
    config.session_pool.session_timeout = milliseconds(o.session_timeout_ms);
    config.session_pool.history_size = non_negative<size_t>(o.session_history_size);
    config.session_pool.metrics_window = milliseconds(o.session_metrics_window_ms);

    config.sweep.cleanup_interval = milliseconds(o.cleanup_interval_ms);
    config.sweep.tenant_idle_timeout = milliseconds(o.tenant_idle_timeout_ms);
    config.sweep.stale_session_interval = milliseconds(o.stale_session_interval_ms);

    config.persistence.enabled = o.persistence_enabled;
    config.persistence.database_path = o.database_path;
    config.persistence.persist_interval = milliseconds(o.persist_interval_ms);
    config.persistence.retention = std::chrono::hours(24 * o.retention_days);

    auto valid = validate(config);
    if (!valid) {
        return valid.error();
    }
    return config;
}

} // namespace resilience
} // namespace botfleet
