#pragma once

#include "botfleet/resilience/circuit_breaker.hpp"
#include "botfleet/resilience/health_monitor.hpp"
#include "botfleet/resilience/rate_limiter.hpp"
#include "botfleet/resilience/retry_policy.hpp"
#include "botfleet/resilience/session_pool.hpp"
#include "botfleet/resilience/tenant_activity.hpp"
#include "botfleet/resilience/worker_pool.hpp"
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

namespace botfleet {
namespace resilience {

struct CallOptions {
    // Wait once for the reported retry_after when it fits in max_wait
    bool wait_for_rate_limit = true;
    std::optional<std::chrono::milliseconds> max_wait;  // Defaults to max_admission_wait
    // Hold the tenant's session slot for the duration of the call
    bool hold_session = false;
    double tokens = 1.0;
    std::shared_ptr<CancellationToken> cancel;
};

struct GuardedComponents {
    std::shared_ptr<RateLimiter> limiter;
    std::shared_ptr<BreakerRegistry> breakers;
    std::shared_ptr<RetryExecutor> retry;
    std::shared_ptr<HealthMonitor> health;
    std::shared_ptr<SessionPool> sessions;
    std::shared_ptr<TenantActivity> activity;
    std::shared_ptr<Clock> clock;
    std::shared_ptr<Observability> observability;
};

/**
 * Runs one outbound call for a tenant through the whole resilience stack:
 * admission (global then tenant bucket), optional session slot, breaker and
 * retry loop around the real operation, then health bookkeeping.
 *
 * Every attempt of the retry loop goes through the tenant's breaker, so an
 * open breaker stops the loop without spending retry budget. Local rejections
 * are not recorded as tenant health failures. A final rate-limit failure with
 * a server wait hint is fed back into the tenant bucket. Calls for a suspended
 * tenant are refused.
 */
class GuardedExecutor {
public:
    explicit GuardedExecutor(GuardedComponents components,
                             std::shared_ptr<WorkerPool> pool = nullptr);

    template <class F>
    auto execute(const std::string& tenant_id, F&& op, const CallOptions& options = {})
        -> decltype(op()) {
        using Result = decltype(op());
        const CancellationToken* cancel = options.cancel.get();

        admit(tenant_id, options);
        SessionLease lease;
        if (options.hold_session) {
            lease = open_session(tenant_id, cancel);
        }

        auto breaker = components_.breakers->get_breaker(tenant_id);
        auto started = components_.clock->now();
        auto attempt_started = started;
        RetryTrace trace;
        auto attempt = [&]() -> Result {
            attempt_started = components_.clock->now();
            return breaker->call(op);
        };

        try {
            if constexpr (std::is_void<Result>::value) {
                components_.retry->run(attempt, &trace, cancel);
                on_success(tenant_id, started, attempt_started, lease);
            } else {
                Result result = components_.retry->run(attempt, &trace, cancel);
                on_success(tenant_id, started, attempt_started, lease);
                return result;
            }
        } catch (const NonRetryableError&) {
            on_failure(tenant_id, std::current_exception(), trace, started, lease);
            throw;
        } catch (const ResilienceError& e) {
            on_local_rejection(tenant_id, e, trace, started, lease);
            throw;
        } catch (...) {
            on_failure(tenant_id, std::current_exception(), trace, started, lease);
            throw;
        }
    }

    // Runs execute() on the worker pool
    template <class F>
    auto submit(const std::string& tenant_id, F op, CallOptions options = {})
        -> std::future<decltype(op())> {
        if (!pool_) {
            throw std::logic_error("GuardedExecutor has no worker pool");
        }
        return pool_->submit([this, tenant_id, op = std::move(op), options]() mutable {
            return execute(tenant_id, op, options);
        });
    }

    const GuardedComponents& components() const { return components_; }

private:
    GuardedComponents components_;
    std::shared_ptr<WorkerPool> pool_;

    // Throws TenantSuspendedError, RateLimitExceeded or OperationCancelled
    void admit(const std::string& tenant_id, const CallOptions& options);
    // Throws SessionBusyError, PoolExhaustedError or OperationCancelled
    SessionLease open_session(const std::string& tenant_id, const CancellationToken* cancel);

    void on_success(const std::string& tenant_id, TimePoint started, TimePoint attempt_started,
                    SessionLease& lease);
    void on_failure(const std::string& tenant_id, const std::exception_ptr& error,
                    const RetryTrace& trace, TimePoint started, SessionLease& lease);
    // Records the upstream failure that preceded the rejection, if any
    void on_local_rejection(const std::string& tenant_id, const ResilienceError& error,
                            const RetryTrace& trace, TimePoint started, SessionLease& lease);
};

} // namespace resilience
} // namespace botfleet
