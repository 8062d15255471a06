#pragma once

#include "botfleet/resilience/bucket_store.hpp"
#include "botfleet/resilience/circuit_breaker.hpp"
#include "botfleet/resilience/config.hpp"
#include "botfleet/resilience/guarded_executor.hpp"
#include "botfleet/resilience/health_monitor.hpp"
#include "botfleet/resilience/health_persistence.hpp"
#include "botfleet/resilience/periodic_task.hpp"
#include "botfleet/resilience/rate_limiter.hpp"
#include "botfleet/resilience/retry_policy.hpp"
#include "botfleet/resilience/session_pool.hpp"
#include "botfleet/resilience/snapshot_store.hpp"
#include "botfleet/resilience/tenant_activity.hpp"
#include "botfleet/resilience/worker_pool.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace botfleet {
namespace resilience {

// Pluggable collaborators; null members get the in-process defaults
struct RegistryPlugins {
    std::shared_ptr<BucketBackend> bucket_backend;
    std::shared_ptr<ErrorClassifier> classifier;
    std::shared_ptr<SnapshotStore> snapshot_store;
};

/**
 * Composition root of the resilience layer. Constructed once at process start
 * and passed by reference; owns every per-tenant structure and the background
 * sweeps. Tenants are created lazily on first use and removed by the idle
 * sweep unless they hold an open session or are suspended.
 */
class TenantRegistry {
public:
    TenantRegistry(const ResilienceConfig& config, std::shared_ptr<Clock> clock,
                   std::shared_ptr<Observability> observability, RegistryPlugins plugins = {});
    ~TenantRegistry();

    TenantRegistry(const TenantRegistry&) = delete;
    TenantRegistry& operator=(const TenantRegistry&) = delete;

    GuardedExecutor& executor() { return *executor_; }
    RateLimiter& rate_limiter() { return *limiter_; }
    BreakerRegistry& breakers() { return *breakers_; }
    HealthMonitor& health() { return *health_; }
    SessionPool& sessions() { return *sessions_; }
    // Null when no snapshot store is configured
    HealthPersistenceService* persistence() { return persistence_.get(); }

    // Admin surface
    RateLimitStats get_rate_limit_stats(const std::string& scope);
    std::optional<BreakerSnapshot> get_breaker_state(const std::string& tenant_id) const;
    std::map<std::string, BreakerSnapshot> get_all_breaker_states() const;
    bool reset_breaker(const std::string& tenant_id);
    HealthSummary get_health_summary() const;
    std::optional<HealthMetrics> get_metrics(const std::string& tenant_id) const;
    std::vector<HealthMetrics> get_unhealthy_tenants() const;
    void suspend(const std::string& tenant_id, const std::string& reason);
    bool resume(const std::string& tenant_id);
    bool reset_metrics(const std::string& tenant_id);
    PoolStatus get_pool_status() const;

    // Loads the last persisted snapshot set; restored tenants start their
    // idle window now. Returns 0 when no snapshot store is configured.
    caf::expected<size_t> restore_latest();

    // Sweeps, also run by the background tasks
    std::vector<std::string> cleanup_idle_tenants();
    std::vector<SessionRecord> sweep_stale_sessions();

    void start_background_tasks();
    void stop_background_tasks();

    std::vector<std::string> tenants() const;
    const ResilienceConfig& config() const { return config_; }

private:
    // Gives tenants known only to the health monitor an activity timestamp
    void adopt_untracked_tenants();

    ResilienceConfig config_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<Observability> observability_;

    std::shared_ptr<TenantActivity> activity_;
    std::shared_ptr<RateLimiter> limiter_;
    std::shared_ptr<BreakerRegistry> breakers_;
    std::shared_ptr<RetryExecutor> retry_;
    std::shared_ptr<HealthMonitor> health_;
    std::shared_ptr<SessionPool> sessions_;
    std::shared_ptr<WorkerPool> pool_;
    std::unique_ptr<GuardedExecutor> executor_;
    std::unique_ptr<HealthPersistenceService> persistence_;

    std::unique_ptr<PeriodicTask> cleanup_task_;
    std::unique_ptr<PeriodicTask> stale_session_task_;
};

} // namespace resilience
} // namespace botfleet
