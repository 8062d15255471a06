#pragma once

#include "botfleet/resilience/clock.hpp"
#include "botfleet/resilience/config.hpp"
#include "botfleet/resilience/errors.hpp"
#include "botfleet/resilience/observability.hpp"
#include <deque>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace botfleet {
namespace resilience {

enum class BreakerState { closed, open, half_open };

std::string to_string(BreakerState state);

struct TransitionEvent {
    BreakerState from = BreakerState::closed;
    BreakerState to = BreakerState::closed;
    WallTime at;
    std::string reason;
};

struct BreakerSnapshot {
    std::string tenant_id;
    BreakerState state = BreakerState::closed;
    uint32_t failure_count = 0;
    uint32_t success_count = 0;
    uint32_t failure_threshold = 0;
    uint32_t success_threshold = 0;
    double timeout_seconds = 0.0;
    double timeout_remaining_seconds = 0.0;  // Only non-zero while open
    std::optional<WallTime> opened_at;
    std::string last_failure_reason;
    uint64_t total_calls = 0;
    uint64_t total_successes = 0;
    uint64_t total_failures = 0;
    uint64_t rejected_calls = 0;
    uint64_t transitions = 0;
    uint32_t trials_in_flight = 0;
    std::vector<TransitionEvent> history;
};

/**
 * Per-tenant failure isolation.
 *
 * closed -> open after failure_threshold consecutive failures.
 * open rejects without running the operation until timeout has elapsed; the
 * first call after that moves to half_open and runs as a trial.
 * half_open admits at most success_threshold concurrent trials and rejects the
 * rest with a zero remaining cool-down.
 * half_open -> closed after success_threshold successes, -> open on any failure.
 * Counters reset on every transition. Rejections are not failures.
 */
class CircuitBreaker {
public:
    CircuitBreaker(std::string tenant_id, const BreakerConfig& config,
                   std::shared_ptr<Clock> clock,
                   std::shared_ptr<Observability> observability);

    // Throws CircuitOpenError while open and cooling down, or when every
    // half-open trial slot is taken. Returns true if the call is a trial; the
    // caller passes that back to on_success/on_failure.
    bool before_call();
    void on_success(bool trial = false);
    void on_failure(const std::string& reason, bool trial = false);

    // Runs op under the breaker and rethrows whatever op throws
    template <class F>
    auto call(F&& op) -> decltype(op()) {
        bool trial = before_call();
        try {
            if constexpr (std::is_void<decltype(op())>::value) {
                op();
                on_success(trial);
            } else {
                auto result = op();
                on_success(trial);
                return result;
            }
        } catch (const std::exception& e) {
            on_failure(e.what(), trial);
            throw;
        } catch (...) {
            on_failure("non-standard exception", trial);
            throw;
        }
    }

    // Forces closed and clears counters
    void reset(const std::string& reason = "manual reset");

    BreakerState state() const;
    BreakerSnapshot snapshot() const;
    const std::string& tenant_id() const { return tenant_id_; }

private:
    std::string tenant_id_;
    BreakerConfig config_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<Observability> observability_;

    mutable std::mutex mutex_;
    BreakerState state_ = BreakerState::closed;
    uint32_t failure_count_ = 0;
    uint32_t success_count_ = 0;
    TimePoint opened_at_;
    std::optional<WallTime> opened_at_wall_;
    std::string last_failure_reason_;
    uint64_t total_calls_ = 0;
    uint64_t total_successes_ = 0;
    uint64_t total_failures_ = 0;
    uint64_t rejected_calls_ = 0;
    uint64_t transitions_ = 0;
    // Trials admitted in half_open that have not finished, across transitions
    uint32_t trials_in_flight_ = 0;
    std::deque<TransitionEvent> history_;

    // Caller holds mutex_
    void transition_to(BreakerState next, const std::string& reason);
    double timeout_remaining(TimePoint now) const;
    void reject(double remaining);
    void finish_trial(bool trial);
};

/**
 * Owns one breaker per tenant, created on first use.
 * Breakers are shared so an in-flight call keeps its breaker alive across remove().
 */
class BreakerRegistry {
public:
    BreakerRegistry(const BreakerConfig& config, std::shared_ptr<Clock> clock,
                    std::shared_ptr<Observability> observability);

    std::shared_ptr<CircuitBreaker> get_breaker(const std::string& tenant_id);

    // Returns nullopt for a tenant that never made a call
    std::optional<BreakerSnapshot> get_breaker_state(const std::string& tenant_id) const;

    // Returns false if the tenant has no breaker
    bool reset_breaker(const std::string& tenant_id);

    std::map<std::string, BreakerSnapshot> get_all_states() const;
    std::vector<std::string> get_open_breakers() const;
    std::vector<std::string> get_half_open_breakers() const;

    void remove(const std::string& tenant_id);
    size_t size() const;

private:
    BreakerConfig config_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<Observability> observability_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;

    std::vector<std::string> tenants_in(BreakerState state) const;
};

} // namespace resilience
} // namespace botfleet
