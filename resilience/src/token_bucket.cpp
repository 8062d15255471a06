#include "botfleet/resilience/token_bucket.hpp"
#include <algorithm>

namespace botfleet {
namespace resilience {

TokenBucket::TokenBucket(const BucketConfig& config, TimePoint now)
    : capacity_(config.capacity),
      refill_per_second_(config.refill_per_second),
      tokens_(config.capacity),
      last_refill_(now),
      last_used_(now) {}

void TokenBucket::refill(TimePoint now) {
    // last_refill_ sits in the future while a penalty is active
    if (now <= last_refill_) {
        return;
    }
    double elapsed = to_seconds(now - last_refill_);
    tokens_ = std::min(capacity_, tokens_ + elapsed * refill_per_second_);
    last_refill_ = now;
}

double TokenBucket::retry_after(double requested, TimePoint now) const {
    double penalty = now < last_refill_ ? to_seconds(last_refill_ - now) : 0.0;
    double missing = std::max(0.0, requested - tokens_);
    return penalty + missing / refill_per_second_;
}

ConsumeResult TokenBucket::try_consume(double requested, TimePoint now) {
    refill(now);
    last_used_ = now;

    ConsumeResult result;
    if (now >= last_refill_ && tokens_ >= requested) {
        tokens_ -= requested;
        result.allowed = true;
        result.retry_after_seconds = 0.0;
    } else {
        result.allowed = false;
        result.retry_after_seconds = retry_after(requested, now);
    }
    result.tokens_remaining = tokens_;
    return result;
}

ConsumeResult TokenBucket::peek(double requested, TimePoint now) {
    refill(now);

    ConsumeResult result;
    result.allowed = now >= last_refill_ && tokens_ >= requested;
    result.retry_after_seconds = result.allowed ? 0.0 : retry_after(requested, now);
    result.tokens_remaining = tokens_;
    return result;
}

void TokenBucket::refund(double tokens, TimePoint now) {
    refill(now);
    tokens_ = std::min(capacity_, tokens_ + std::max(0.0, tokens));
}

void TokenBucket::penalize(Seconds wait, TimePoint now) {
    refill(now);
    tokens_ = 0.0;
    auto until = now + from_seconds(std::max(0.0, wait.count()));
    last_refill_ = std::max(last_refill_, until);
    last_used_ = now;
}

double TokenBucket::available(TimePoint now) {
    refill(now);
    return tokens_;
}

void TokenBucket::reconfigure(const BucketConfig& config, TimePoint now) {
    refill(now);
    capacity_ = config.capacity;
    refill_per_second_ = config.refill_per_second;
    tokens_ = std::min(tokens_, capacity_);
}

} // namespace resilience
} // namespace botfleet
