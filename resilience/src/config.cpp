#include "botfleet/resilience/config.hpp"

namespace botfleet {
namespace resilience {

std::string to_string(BackoffStrategy strategy) {
    switch (strategy) {
        case BackoffStrategy::exponential:
            return "exponential";
        case BackoffStrategy::linear:
            return "linear";
        case BackoffStrategy::fixed:
            return "fixed";
        case BackoffStrategy::fibonacci:
            return "fibonacci";
    }
    return "exponential";
}

caf::expected<BackoffStrategy> parse_backoff_strategy(const std::string& name) {
    if (name == "exponential") return BackoffStrategy::exponential;
    if (name == "linear") return BackoffStrategy::linear;
    if (name == "fixed") return BackoffStrategy::fixed;
    if (name == "fibonacci") return BackoffStrategy::fibonacci;
    return make_error(ErrorCode::invalid_config, "Unknown backoff strategy: " + name);
}

const CategoryRetryPolicy& RetryConfig::for_category(ErrorCategory category) const {
    switch (category) {
        case ErrorCategory::rate_limited:
            return rate_limited;
        case ErrorCategory::transient_network:
            return transient_network;
        case ErrorCategory::permanent:
            return permanent;
        case ErrorCategory::unknown:
            return unknown;
    }
    return unknown;
}

CategoryRetryPolicy& RetryConfig::for_category(ErrorCategory category) {
    const auto& self = *this;
    return const_cast<CategoryRetryPolicy&>(self.for_category(category));
}

static caf::expected<void> validate_bucket(const BucketConfig& bucket, const std::string& scope) {
    if (bucket.capacity <= 0.0) {
        return make_error(ErrorCode::invalid_config, scope + " bucket capacity must be positive");
    }
    if (bucket.refill_per_second <= 0.0) {
        return make_error(ErrorCode::invalid_config, scope + " bucket refill rate must be positive");
    }
    return caf::unit;
}

static caf::expected<void> validate_retry(const CategoryRetryPolicy& policy, ErrorCategory category) {
    auto name = to_string(category);
    if (policy.max_retries < 0) {
        return make_error(ErrorCode::invalid_config, name + " max_retries must not be negative");
    }
    if (policy.base_delay.count() < 0 || policy.max_delay < policy.base_delay) {
        return make_error(ErrorCode::invalid_config,
                          name + " delays must satisfy 0 <= base_delay <= max_delay");
    }
    if (policy.strategy == BackoffStrategy::exponential && policy.exponential_base < 1.0) {
        return make_error(ErrorCode::invalid_config, name + " exponential_base must be >= 1");
    }
    return caf::unit;
}

caf::expected<void> validate(const ResilienceConfig& config) {
    if (auto res = validate_bucket(config.rate_limiter.global_bucket, "global"); !res) {
        return res.error();
    }
    if (auto res = validate_bucket(config.rate_limiter.tenant_bucket, "tenant"); !res) {
        return res.error();
    }
    if (config.rate_limiter.max_admission_wait.count() < 0) {
        return make_error(ErrorCode::invalid_config, "max_admission_wait must not be negative");
    }

    if (config.breaker.failure_threshold == 0 || config.breaker.success_threshold == 0) {
        return make_error(ErrorCode::invalid_config, "Breaker thresholds must be positive");
    }
    if (config.breaker.timeout.count() <= 0) {
        return make_error(ErrorCode::invalid_config, "Breaker timeout must be positive");
    }

    for (auto category : {ErrorCategory::rate_limited, ErrorCategory::transient_network,
                          ErrorCategory::permanent, ErrorCategory::unknown}) {
        if (auto res = validate_retry(config.retry.for_category(category), category); !res) {
            return res.error();
        }
    }
    if (config.retry.permanent.max_retries != 0) {
        return make_error(ErrorCode::invalid_config, "Permanent failures must not be retried");
    }

    const auto& health = config.health;
    if (health.warning_error_rate >= health.critical_error_rate) {
        return make_error(ErrorCode::invalid_config,
                          "warning_error_rate must be below critical_error_rate");
    }
    if (health.warning_latency_ms >= health.critical_latency_ms) {
        return make_error(ErrorCode::invalid_config,
                          "warning_latency_ms must be below critical_latency_ms");
    }
    if (health.latency_ema_alpha <= 0.0 || health.latency_ema_alpha > 1.0) {
        return make_error(ErrorCode::invalid_config, "latency_ema_alpha must be in (0, 1]");
    }
    if (health.max_consecutive_failures == 0) {
        return make_error(ErrorCode::invalid_config, "max_consecutive_failures must be positive");
    }

    if (config.session_pool.max_total_connections == 0) {
        return make_error(ErrorCode::invalid_config, "max_total_connections must be positive");
    }
    if (config.session_pool.session_timeout.count() <= 0) {
        return make_error(ErrorCode::invalid_config, "session_timeout must be positive");
    }
    if (config.worker_threads == 0) {
        return make_error(ErrorCode::invalid_config, "worker_threads must be positive");
    }
    if (config.sweep.cleanup_interval.count() <= 0 ||
        config.sweep.stale_session_interval.count() <= 0) {
        return make_error(ErrorCode::invalid_config, "Sweep intervals must be positive");
    }
    return caf::unit;
}

} // namespace resilience
} // namespace botfleet
