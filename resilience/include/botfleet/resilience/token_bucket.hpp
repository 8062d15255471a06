#pragma once

#include "botfleet/resilience/clock.hpp"
#include "botfleet/resilience/config.hpp"

namespace botfleet {
namespace resilience {

struct ConsumeResult {
    bool allowed = false;
    double retry_after_seconds = 0.0;
    double tokens_remaining = 0.0;
};

/**
 * Single rate-limited resource counter.
 *
 * Refills lazily on every check: tokens = min(capacity, tokens + elapsed * rate).
 * Not synchronized; owners serialize access (mutex per key or a store actor).
 * Invariant: 0 <= tokens <= capacity after every operation.
 */
class TokenBucket {
public:
    TokenBucket(const BucketConfig& config, TimePoint now);

    ConsumeResult try_consume(double requested, TimePoint now);

    // Same decision as try_consume without taking tokens
    ConsumeResult peek(double requested, TimePoint now);

    // Returns tokens taken by a call that was rejected further down the line
    void refund(double tokens, TimePoint now);

    // Empties the bucket and holds refill back until now + wait
    void penalize(Seconds wait, TimePoint now);

    double available(TimePoint now);

    double capacity() const { return capacity_; }
    double refill_per_second() const { return refill_per_second_; }
    TimePoint last_used() const { return last_used_; }

    // Applies new limits, clamping the current level to the new capacity
    void reconfigure(const BucketConfig& config, TimePoint now);

private:
    double capacity_;
    double refill_per_second_;
    double tokens_;
    TimePoint last_refill_;
    TimePoint last_used_;

    void refill(TimePoint now);
    double retry_after(double requested, TimePoint now) const;
};

} // namespace resilience
} // namespace botfleet
