#include "botfleet/resilience/guarded_executor.hpp"
#include <algorithm>

namespace botfleet {
namespace resilience {

GuardedExecutor::GuardedExecutor(GuardedComponents components, std::shared_ptr<WorkerPool> pool)
    : components_(std::move(components)), pool_(std::move(pool)) {}

void GuardedExecutor::admit(const std::string& tenant_id, const CallOptions& options) {
    auto& clock = *components_.clock;
    components_.activity->touch(tenant_id, clock.now());

    auto metrics = components_.health->get_metrics(tenant_id);
    if (metrics && metrics->status == HealthStatus::suspended) {
        components_.observability->record_call("rejected", 0.0);
        throw TenantSuspendedError(tenant_id, metrics->suspension_reason);
    }

    auto decision = components_.limiter->acquire(tenant_id, options.tokens);
    if (decision.allowed) {
        return;
    }

    auto max_wait = options.max_wait.value_or(components_.limiter->config().max_admission_wait);
    double max_wait_seconds = std::chrono::duration_cast<Seconds>(max_wait).count();
    if (options.wait_for_rate_limit && decision.retry_after_seconds <= max_wait_seconds) {
        components_.observability->log_debug(
            "Waiting for rate limit", tenant_id,
            {{"retry_after", std::to_string(decision.retry_after_seconds)},
             {"scope", decision.limiting_scope}});
        if (!clock.sleep_for(Seconds(decision.retry_after_seconds), options.cancel.get())) {
            throw OperationCancelled();
        }
        decision = components_.limiter->acquire(tenant_id, options.tokens);
        if (decision.allowed) {
            return;
        }
    }

    components_.observability->record_call("rejected", 0.0);
    throw RateLimitExceeded(tenant_id, decision.retry_after_seconds);
}

SessionLease GuardedExecutor::open_session(const std::string& tenant_id,
                                           const CancellationToken* cancel) {
    auto slot = components_.sessions->acquire_session(tenant_id, cancel);
    if (slot) {
        return SessionLease(*components_.sessions, std::move(*slot));
    }
    components_.observability->record_call("rejected", 0.0);
    switch (error_code_of(slot.error())) {
        case ErrorCode::session_busy:
            throw SessionBusyError(tenant_id);
        case ErrorCode::cancelled:
            throw OperationCancelled();
        default:
            throw PoolExhaustedError(tenant_id);
    }
}

void GuardedExecutor::on_success(const std::string& tenant_id, TimePoint started,
                                 TimePoint attempt_started, SessionLease& lease) {
    auto now = components_.clock->now();
    double latency_ms = std::max(0.0, to_seconds(now - attempt_started) * 1000.0);
    components_.health->record_success(tenant_id, latency_ms);
    components_.observability->record_call("success", to_seconds(now - started));
    if (lease.active()) {
        SessionStats delta;
        delta.messages = 1;
        lease.add_stats(delta);
    }
}

void GuardedExecutor::on_failure(const std::string& tenant_id, const std::exception_ptr& error,
                                 const RetryTrace& trace, TimePoint started, SessionLease& lease) {
    auto classification = trace.last_failure ? *trace.last_failure
                                             : components_.retry->classify(error);
    components_.health->record_failure(tenant_id, classification.category,
                                       to_string(classification.category));
    components_.observability->record_call("failure",
                                           to_seconds(components_.clock->now() - started));
    if (lease.active()) {
        SessionStats delta;
        delta.errors = 1;
        lease.add_stats(delta);
    }

    if (classification.category == ErrorCategory::rate_limited &&
        classification.retry_after_seconds) {
        components_.limiter->penalize(tenant_id, Seconds(*classification.retry_after_seconds));
    }

    components_.observability->log_warn("Guarded call failed", tenant_id,
                                        {{"category", to_string(classification.category)},
                                         {"attempts", std::to_string(trace.calls)},
                                         {"error", classification.message}});
}

void GuardedExecutor::on_local_rejection(const std::string& tenant_id, const ResilienceError& error,
                                         const RetryTrace& trace, TimePoint started,
                                         SessionLease& lease) {
    if (trace.last_failure) {
        on_failure(tenant_id, nullptr, trace, started, lease);
    } else {
        components_.observability->record_call("rejected",
                                               to_seconds(components_.clock->now() - started));
    }
    components_.observability->log_info("Guarded call rejected locally", tenant_id,
                                        {{"code", to_string(error.code())},
                                         {"error", error.what()}});
}

} // namespace resilience
} // namespace botfleet
