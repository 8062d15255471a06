#include "botfleet/resilience/circuit_breaker.hpp"
#include <algorithm>

namespace botfleet {
namespace resilience {

std::string to_string(BreakerState state) {
    switch (state) {
        case BreakerState::closed:
            return "closed";
        case BreakerState::open:
            return "open";
        case BreakerState::half_open:
            return "half_open";
    }
    return "unknown";
}

CircuitBreaker::CircuitBreaker(std::string tenant_id, const BreakerConfig& config,
                               std::shared_ptr<Clock> clock,
                               std::shared_ptr<Observability> observability)
    : tenant_id_(std::move(tenant_id)),
      config_(config),
      clock_(std::move(clock)),
      observability_(std::move(observability)) {}

double CircuitBreaker::timeout_remaining(TimePoint now) const {
    if (state_ != BreakerState::open) {
        return 0.0;
    }
    double timeout = std::chrono::duration_cast<Seconds>(config_.timeout).count();
    return std::max(0.0, timeout - to_seconds(now - opened_at_));
}

void CircuitBreaker::transition_to(BreakerState next, const std::string& reason) {
    TransitionEvent event;
    event.from = state_;
    event.to = next;
    event.at = clock_->wall_now();
    event.reason = reason;

    state_ = next;
    failure_count_ = 0;
    success_count_ = 0;
    transitions_++;
    if (next == BreakerState::open) {
        opened_at_ = clock_->now();
        opened_at_wall_ = event.at;
    } else if (next == BreakerState::closed) {
        opened_at_wall_.reset();
    }

    history_.push_back(event);
    while (history_.size() > config_.transition_history) {
        history_.pop_front();
    }

    observability_->record_breaker_transition(to_string(next));
    LogContext context{{"from", to_string(event.from)}, {"to", to_string(next)},
                       {"reason", reason}};
    if (next == BreakerState::open) {
        observability_->log_warn("Circuit breaker opened", tenant_id_, context);
    } else {
        observability_->log_info("Circuit breaker state changed", tenant_id_, context);
    }
}

void CircuitBreaker::reject(double remaining) {
    rejected_calls_++;
    observability_->record_breaker_rejection();
    throw CircuitOpenError(tenant_id_, remaining);
}

void CircuitBreaker::finish_trial(bool trial) {
    if (trial && trials_in_flight_ > 0) {
        trials_in_flight_--;
    }
}

bool CircuitBreaker::before_call() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == BreakerState::open) {
        double remaining = timeout_remaining(clock_->now());
        if (remaining > 0.0) {
            reject(remaining);
        }
        transition_to(BreakerState::half_open, "cool-down elapsed");
    }
    if (state_ == BreakerState::half_open) {
        if (trials_in_flight_ >= config_.success_threshold) {
            reject(0.0);
        }
        trials_in_flight_++;
        total_calls_++;
        return true;
    }
    total_calls_++;
    return false;
}

void CircuitBreaker::on_success(bool trial) {
    std::lock_guard<std::mutex> lock(mutex_);
    finish_trial(trial);
    total_successes_++;
    switch (state_) {
        case BreakerState::closed:
            failure_count_ = 0;
            break;
        case BreakerState::half_open:
            success_count_++;
            if (success_count_ >= config_.success_threshold) {
                transition_to(BreakerState::closed, "trial calls succeeded");
            }
            break;
        case BreakerState::open:
            // A call admitted before the breaker opened finished late
            break;
    }
}

void CircuitBreaker::on_failure(const std::string& reason, bool trial) {
    std::lock_guard<std::mutex> lock(mutex_);
    finish_trial(trial);
    total_failures_++;
    last_failure_reason_ = reason;
    switch (state_) {
        case BreakerState::closed:
            failure_count_++;
            if (failure_count_ >= config_.failure_threshold) {
                transition_to(BreakerState::open, "failure threshold reached: " + reason);
            }
            break;
        case BreakerState::half_open:
            transition_to(BreakerState::open, "trial call failed: " + reason);
            break;
        case BreakerState::open:
            break;
    }
}

void CircuitBreaker::reset(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != BreakerState::closed) {
        transition_to(BreakerState::closed, reason);
    }
    failure_count_ = 0;
    success_count_ = 0;
    last_failure_reason_.clear();
}

BreakerState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

BreakerSnapshot CircuitBreaker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    BreakerSnapshot snap;
    snap.tenant_id = tenant_id_;
    snap.state = state_;
    snap.failure_count = failure_count_;
    snap.success_count = success_count_;
    snap.failure_threshold = config_.failure_threshold;
    snap.success_threshold = config_.success_threshold;
    snap.timeout_seconds = std::chrono::duration_cast<Seconds>(config_.timeout).count();
    snap.timeout_remaining_seconds = timeout_remaining(clock_->now());
    snap.opened_at = opened_at_wall_;
    snap.last_failure_reason = last_failure_reason_;
    snap.total_calls = total_calls_;
    snap.total_successes = total_successes_;
    snap.total_failures = total_failures_;
    snap.rejected_calls = rejected_calls_;
    snap.transitions = transitions_;
    snap.trials_in_flight = trials_in_flight_;
    snap.history.assign(history_.begin(), history_.end());
    return snap;
}

// BreakerRegistry

BreakerRegistry::BreakerRegistry(const BreakerConfig& config, std::shared_ptr<Clock> clock,
                                 std::shared_ptr<Observability> observability)
    : config_(config), clock_(std::move(clock)), observability_(std::move(observability)) {}

std::shared_ptr<CircuitBreaker> BreakerRegistry::get_breaker(const std::string& tenant_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = breakers_.find(tenant_id);
    if (it != breakers_.end()) {
        return it->second;
    }
    auto breaker = std::make_shared<CircuitBreaker>(tenant_id, config_, clock_, observability_);
    breakers_.emplace(tenant_id, breaker);
    return breaker;
}

std::optional<BreakerSnapshot> BreakerRegistry::get_breaker_state(const std::string& tenant_id) const {
    std::shared_ptr<CircuitBreaker> breaker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = breakers_.find(tenant_id);
        if (it == breakers_.end()) {
            return std::nullopt;
        }
        breaker = it->second;
    }
    return breaker->snapshot();
}

bool BreakerRegistry::reset_breaker(const std::string& tenant_id) {
    std::shared_ptr<CircuitBreaker> breaker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = breakers_.find(tenant_id);
        if (it == breakers_.end()) {
            return false;
        }
        breaker = it->second;
    }
    breaker->reset();
    return true;
}

std::map<std::string, BreakerSnapshot> BreakerRegistry::get_all_states() const {
    std::vector<std::shared_ptr<CircuitBreaker>> breakers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : breakers_) {
            breakers.push_back(entry.second);
        }
    }
    std::map<std::string, BreakerSnapshot> states;
    for (const auto& breaker : breakers) {
        states.emplace(breaker->tenant_id(), breaker->snapshot());
    }
    return states;
}

std::vector<std::string> BreakerRegistry::tenants_in(BreakerState state) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> tenants;
    for (const auto& entry : breakers_) {
        if (entry.second->state() == state) {
            tenants.push_back(entry.first);
        }
    }
    return tenants;
}

std::vector<std::string> BreakerRegistry::get_open_breakers() const {
    return tenants_in(BreakerState::open);
}

std::vector<std::string> BreakerRegistry::get_half_open_breakers() const {
    return tenants_in(BreakerState::half_open);
}

void BreakerRegistry::remove(const std::string& tenant_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    breakers_.erase(tenant_id);
}

size_t BreakerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return breakers_.size();
}

} // namespace resilience
} // namespace botfleet
