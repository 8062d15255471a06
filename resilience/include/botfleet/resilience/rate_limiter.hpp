#pragma once

#include "botfleet/resilience/bucket_store.hpp"
#include "botfleet/resilience/clock.hpp"
#include "botfleet/resilience/config.hpp"
#include "botfleet/resilience/observability.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace botfleet {
namespace resilience {

struct AcquireDecision {
    bool allowed = false;
    double retry_after_seconds = 0.0;
    std::string limiting_scope;  // Scope that denied the call, empty when allowed
    bool degraded = false;       // Admitted without a decision because the store failed
};

struct RateLimitStats {
    std::string scope;
    bool known = false;  // False when no bucket exists for the scope yet
    double tokens_available = 0.0;
    double capacity = 0.0;
    double refill_per_second = 0.0;
    uint64_t allowed = 0;
    uint64_t rejected = 0;
    uint64_t penalties = 0;
    uint64_t store_failures = 0;
};

/**
 * Two-tier admission control.
 *
 * A call must pass the global bucket (shared upstream budget) and then the
 * tenant bucket. When the tenant tier denies, the token taken from the global
 * tier is refunded. Store outages fail open.
 */
class RateLimiter {
public:
    static constexpr const char* global_scope = "global";

    RateLimiter(const RateLimiterConfig& config,
                std::shared_ptr<BucketBackend> backend,
                std::shared_ptr<Clock> clock,
                std::shared_ptr<Observability> observability);

    AcquireDecision acquire(const std::string& tenant_id, double tokens = 1.0);
    AcquireDecision acquire_global(double tokens = 1.0);

    // Feeds a server-imposed wait back into the tenant bucket
    void penalize(const std::string& tenant_id, Seconds wait);

    // scope is "global" or a tenant id; "global" always means the shared tier
    RateLimitStats get_rate_limit_stats(const std::string& scope);

    size_t purge_idle();
    void remove_tenant(const std::string& tenant_id);

    // Scopes with decision counters; stats queries never add to this
    size_t tracked_scopes() const;

    const RateLimiterConfig& config() const { return config_; }

private:
    struct Counters {
        std::atomic<uint64_t> allowed{0};
        std::atomic<uint64_t> rejected{0};
        std::atomic<uint64_t> penalties{0};
        std::atomic<uint64_t> store_failures{0};
    };

    RateLimiterConfig config_;
    std::shared_ptr<BucketBackend> backend_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<Observability> observability_;

    mutable std::mutex counters_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Counters>> counters_;

    static std::string tenant_key(const std::string& tenant_id) { return "tenant:" + tenant_id; }
    std::shared_ptr<Counters> counters_for(const std::string& scope);
    // Null for a scope that has never been counted
    std::shared_ptr<Counters> find_counters(const std::string& scope) const;
    void count_decision(const std::string& scope, bool allowed);
    AcquireDecision fail_open(const std::string& scope, const std::string& tenant_id,
                              const caf::error& err);
};

} // namespace resilience
} // namespace botfleet
