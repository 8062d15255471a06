#include "botfleet/resilience/rate_limiter.hpp"
#include <algorithm>
#include <chrono>

namespace botfleet {
namespace resilience {

RateLimiter::RateLimiter(const RateLimiterConfig& config,
                         std::shared_ptr<BucketBackend> backend,
                         std::shared_ptr<Clock> clock,
                         std::shared_ptr<Observability> observability)
    : config_(config),
      backend_(std::move(backend)),
      clock_(std::move(clock)),
      observability_(std::move(observability)) {}

std::shared_ptr<RateLimiter::Counters> RateLimiter::counters_for(const std::string& scope) {
    std::lock_guard<std::mutex> lock(counters_mutex_);
    auto& slot = counters_[scope];
    if (!slot) {
        slot = std::make_shared<Counters>();
    }
    return slot;
}

std::shared_ptr<RateLimiter::Counters> RateLimiter::find_counters(const std::string& scope) const {
    std::lock_guard<std::mutex> lock(counters_mutex_);
    auto it = counters_.find(scope);
    return it == counters_.end() ? nullptr : it->second;
}

size_t RateLimiter::tracked_scopes() const {
    std::lock_guard<std::mutex> lock(counters_mutex_);
    return counters_.size();
}

void RateLimiter::count_decision(const std::string& scope, bool allowed) {
    auto counters = counters_for(scope);
    if (allowed) {
        counters->allowed++;
    } else {
        counters->rejected++;
    }
    observability_->record_rate_limit_decision(scope == global_scope ? "global" : "tenant",
                                               allowed);
}

AcquireDecision RateLimiter::fail_open(const std::string& scope, const std::string& tenant_id,
                                       const caf::error& err) {
    counters_for(scope)->store_failures++;
    observability_->log_warn("Bucket store unavailable, admitting call", tenant_id,
                             {{"scope", scope}, {"error", caf::to_string(err)}});
    AcquireDecision decision;
    decision.allowed = true;
    decision.degraded = true;
    return decision;
}

AcquireDecision RateLimiter::acquire_global(double tokens) {
    auto now = clock_->now();
    auto global = backend_->try_consume(global_scope, config_.global_bucket, tokens, now);
    if (!global) {
        return fail_open(global_scope, "", global.error());
    }
    count_decision(global_scope, global->allowed);

    AcquireDecision decision;
    decision.allowed = global->allowed;
    if (!global->allowed) {
        decision.retry_after_seconds = global->retry_after_seconds;
        decision.limiting_scope = global_scope;
    }
    return decision;
}

AcquireDecision RateLimiter::acquire(const std::string& tenant_id, double tokens) {
    auto now = clock_->now();
    auto key = tenant_key(tenant_id);

    auto global = backend_->try_consume(global_scope, config_.global_bucket, tokens, now);
    if (!global) {
        return fail_open(global_scope, tenant_id, global.error());
    }

    if (!global->allowed) {
        count_decision(global_scope, false);
        // Report the longer of the two waits without taking from the tenant tier
        double retry_after = global->retry_after_seconds;
        auto tenant = backend_->peek(key, config_.tenant_bucket, tokens, now);
        if (tenant && !tenant->allowed) {
            retry_after = std::max(retry_after, tenant->retry_after_seconds);
        }
        AcquireDecision decision;
        decision.retry_after_seconds = retry_after;
        decision.limiting_scope = global_scope;
        observability_->log_debug("Global rate limit denied call", tenant_id,
                                  {{"retry_after", std::to_string(retry_after)}});
        return decision;
    }
    count_decision(global_scope, true);

    auto tenant = backend_->try_consume(key, config_.tenant_bucket, tokens, now);
    if (!tenant) {
        return fail_open(key, tenant_id, tenant.error());
    }
    count_decision(key, tenant->allowed);

    AcquireDecision decision;
    decision.allowed = tenant->allowed;
    if (!tenant->allowed) {
        auto refunded = backend_->refund(global_scope, config_.global_bucket, tokens, now);
        if (!refunded) {
            observability_->log_warn("Failed to refund global token", tenant_id,
                                     {{"error", caf::to_string(refunded.error())}});
        }
        decision.retry_after_seconds = tenant->retry_after_seconds;
        decision.limiting_scope = tenant_id;
        observability_->log_debug("Tenant rate limit denied call", tenant_id,
                                  {{"retry_after", std::to_string(tenant->retry_after_seconds)}});
    }
    return decision;
}

void RateLimiter::penalize(const std::string& tenant_id, Seconds wait) {
    if (wait.count() <= 0.0) {
        return;
    }
    auto result = backend_->penalize(tenant_key(tenant_id), config_.tenant_bucket, wait,
                                     clock_->now());
    if (!result) {
        counters_for(tenant_key(tenant_id))->store_failures++;
        observability_->log_warn("Failed to apply upstream wait hint", tenant_id,
                                 {{"error", caf::to_string(result.error())}});
        return;
    }
    counters_for(tenant_key(tenant_id))->penalties++;
    observability_->log_info("Applied upstream wait hint to tenant bucket", tenant_id,
                             {{"wait_seconds", std::to_string(wait.count())}});
}

RateLimitStats RateLimiter::get_rate_limit_stats(const std::string& scope) {
    bool is_global = scope == global_scope;
    const auto& bucket_config = is_global ? config_.global_bucket : config_.tenant_bucket;

    RateLimitStats stats;
    stats.scope = scope;
    stats.capacity = bucket_config.capacity;
    stats.refill_per_second = bucket_config.refill_per_second;

    if (auto counters = find_counters(is_global ? scope : tenant_key(scope))) {
        stats.allowed = counters->allowed.load();
        stats.rejected = counters->rejected.load();
        stats.penalties = counters->penalties.load();
        stats.store_failures = counters->store_failures.load();
    }

    auto snap = backend_->snapshot(is_global ? scope : tenant_key(scope), clock_->now());
    if (!snap) {
        observability_->log_warn("Failed to read bucket state", is_global ? "" : scope,
                                 {{"error", caf::to_string(snap.error())}});
        return stats;
    }
    if (*snap) {
        const auto& bucket = **snap;
        stats.known = true;
        stats.tokens_available = bucket.tokens;
        stats.capacity = bucket.capacity;
        stats.refill_per_second = bucket.refill_per_second;
    } else {
        // An untouched scope reads as a full bucket
        stats.tokens_available = bucket_config.capacity;
    }
    return stats;
}

size_t RateLimiter::purge_idle() {
    auto idle = std::chrono::duration_cast<Seconds>(config_.idle_bucket_ttl);
    auto removed = backend_->purge_idle(idle, clock_->now());
    if (!removed) {
        observability_->log_warn("Idle bucket purge failed", "",
                                 {{"error", caf::to_string(removed.error())}});
        return 0;
    }
    if (*removed > 0) {
        observability_->log_debug("Purged idle rate limit buckets", "",
                                  {{"removed", std::to_string(*removed)}});
    }
    return *removed;
}

void RateLimiter::remove_tenant(const std::string& tenant_id) {
    auto result = backend_->remove(tenant_key(tenant_id));
    if (!result) {
        observability_->log_warn("Failed to remove tenant bucket", tenant_id,
                                 {{"error", caf::to_string(result.error())}});
    }
    std::lock_guard<std::mutex> lock(counters_mutex_);
    counters_.erase(tenant_key(tenant_id));
}

} // namespace resilience
} // namespace botfleet
