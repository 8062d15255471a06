#include "botfleet/resilience/tenant_registry.hpp"
#include <set>

namespace botfleet {
namespace resilience {

TenantRegistry::TenantRegistry(const ResilienceConfig& config, std::shared_ptr<Clock> clock,
                               std::shared_ptr<Observability> observability,
                               RegistryPlugins plugins)
    : config_(config), clock_(std::move(clock)), observability_(std::move(observability)) {
    auto backend = plugins.bucket_backend ? plugins.bucket_backend
                                          : std::make_shared<LocalBucketBackend>();
    activity_ = std::make_shared<TenantActivity>();
    limiter_ = std::make_shared<RateLimiter>(config_.rate_limiter, backend, clock_, observability_);
    breakers_ = std::make_shared<BreakerRegistry>(config_.breaker, clock_, observability_);
    retry_ = std::make_shared<RetryExecutor>(config_.retry, plugins.classifier, clock_,
                                             observability_);
    health_ = std::make_shared<HealthMonitor>(config_.health, clock_, observability_);
    sessions_ = std::make_shared<SessionPool>(config_.session_pool, clock_, observability_);
    pool_ = std::make_shared<WorkerPool>(config_.worker_threads, observability_);

    GuardedComponents components;
    components.limiter = limiter_;
    components.breakers = breakers_;
    components.retry = retry_;
    components.health = health_;
    components.sessions = sessions_;
    components.activity = activity_;
    components.clock = clock_;
    components.observability = observability_;
    executor_ = std::make_unique<GuardedExecutor>(components, pool_);

    if (plugins.snapshot_store) {
        persistence_ = std::make_unique<HealthPersistenceService>(
            config_.persistence, plugins.snapshot_store, health_, breakers_, clock_,
            observability_);
    }
}

TenantRegistry::~TenantRegistry() {
    stop_background_tasks();
    pool_->shutdown();
}

RateLimitStats TenantRegistry::get_rate_limit_stats(const std::string& scope) {
    return limiter_->get_rate_limit_stats(scope);
}

std::optional<BreakerSnapshot> TenantRegistry::get_breaker_state(const std::string& tenant_id) const {
    return breakers_->get_breaker_state(tenant_id);
}

std::map<std::string, BreakerSnapshot> TenantRegistry::get_all_breaker_states() const {
    return breakers_->get_all_states();
}

bool TenantRegistry::reset_breaker(const std::string& tenant_id) {
    bool reset = breakers_->reset_breaker(tenant_id);
    if (reset) {
        observability_->log_info("Circuit breaker reset by operator", tenant_id);
    }
    return reset;
}

HealthSummary TenantRegistry::get_health_summary() const {
    return health_->get_health_summary();
}

std::optional<HealthMetrics> TenantRegistry::get_metrics(const std::string& tenant_id) const {
    return health_->get_metrics(tenant_id);
}

std::vector<HealthMetrics> TenantRegistry::get_unhealthy_tenants() const {
    return health_->get_unhealthy_tenants();
}

void TenantRegistry::suspend(const std::string& tenant_id, const std::string& reason) {
    health_->suspend(tenant_id, reason);
    activity_->touch(tenant_id, clock_->now());
}

bool TenantRegistry::resume(const std::string& tenant_id) {
    return health_->resume(tenant_id);
}

bool TenantRegistry::reset_metrics(const std::string& tenant_id) {
    return health_->reset_metrics(tenant_id);
}

PoolStatus TenantRegistry::get_pool_status() const {
    return sessions_->get_pool_status();
}

void TenantRegistry::adopt_untracked_tenants() {
    auto now = clock_->now();
    for (const auto& entry : health_->get_all_metrics()) {
        if (!activity_->last_seen(entry.first)) {
            activity_->touch(entry.first, now);
        }
    }
}

caf::expected<size_t> TenantRegistry::restore_latest() {
    if (!persistence_) {
        return size_t{0};
    }
    auto restored = persistence_->restore_latest();
    if (restored) {
        adopt_untracked_tenants();
    }
    return restored;
}

std::vector<std::string> TenantRegistry::cleanup_idle_tenants() {
    adopt_untracked_tenants();
    auto cutoff = clock_->now() - config_.sweep.tenant_idle_timeout;
    std::vector<std::string> removed;
    for (const auto& tenant_id : activity_->idle_since(cutoff)) {
        if (sessions_->has_open_session(tenant_id) || health_->is_suspended(tenant_id)) {
            continue;
        }
        breakers_->remove(tenant_id);
        health_->remove(tenant_id);
        limiter_->remove_tenant(tenant_id);
        activity_->forget(tenant_id);
        removed.push_back(tenant_id);
    }
    limiter_->purge_idle();
    if (!removed.empty()) {
        observability_->log_info("Removed idle tenants", "",
                                 {{"count", std::to_string(removed.size())}});
    }
    return removed;
}

std::vector<SessionRecord> TenantRegistry::sweep_stale_sessions() {
    auto swept = sessions_->sweep_stale();
    for (const auto& record : swept) {
        health_->record_failure(record.tenant_id, ErrorCategory::unknown, "stale_session");
    }
    return swept;
}

void TenantRegistry::start_background_tasks() {
    if (!cleanup_task_) {
        cleanup_task_ = std::make_unique<PeriodicTask>(
            "tenant_cleanup", std::chrono::duration_cast<Seconds>(config_.sweep.cleanup_interval),
            [this]() { cleanup_idle_tenants(); }, observability_);
    }
    if (!stale_session_task_) {
        stale_session_task_ = std::make_unique<PeriodicTask>(
            "stale_session_sweep",
            std::chrono::duration_cast<Seconds>(config_.sweep.stale_session_interval),
            [this]() { sweep_stale_sessions(); }, observability_);
    }
    cleanup_task_->start();
    stale_session_task_->start();
    if (persistence_) {
        persistence_->start();
    }
}

void TenantRegistry::stop_background_tasks() {
    if (persistence_) {
        persistence_->stop();
    }
    if (stale_session_task_) {
        stale_session_task_->stop();
    }
    if (cleanup_task_) {
        cleanup_task_->stop();
    }
}

std::vector<std::string> TenantRegistry::tenants() const {
    std::set<std::string> ids;
    for (const auto& id : activity_->tenants()) {
        ids.insert(id);
    }
    for (const auto& entry : health_->get_all_metrics()) {
        ids.insert(entry.first);
    }
    return std::vector<std::string>(ids.begin(), ids.end());
}

} // namespace resilience
} // namespace botfleet
