#include "botfleet/resilience/bucket_store.hpp"
#include "botfleet/resilience/errors.hpp"
#include <caf/scoped_actor.hpp>
#include <vector>

namespace botfleet {
namespace resilience {

namespace {

int64_t to_nanos(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

TimePoint from_nanos(int64_t ns) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::nanoseconds(ns)));
}

caf::error store_error(const caf::error& err) {
    return make_error(ErrorCode::store_unavailable,
                      "bucket store request failed: " + caf::to_string(err));
}

} // namespace

// LocalBucketBackend

std::shared_ptr<LocalBucketBackend::Entry> LocalBucketBackend::entry_for(
    const std::string& key, const BucketConfig& config, TimePoint now) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        it = entries_.emplace(key, std::make_shared<Entry>(config, now)).first;
    }
    return it->second;
}

std::shared_ptr<LocalBucketBackend::Entry> LocalBucketBackend::find(const std::string& key) const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

caf::expected<ConsumeResult> LocalBucketBackend::try_consume(const std::string& key,
                                                             const BucketConfig& config,
                                                             double tokens, TimePoint now) {
    auto entry = entry_for(key, config, now);
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->bucket.try_consume(tokens, now);
}

caf::expected<ConsumeResult> LocalBucketBackend::peek(const std::string& key,
                                                      const BucketConfig& config,
                                                      double tokens, TimePoint now) {
    auto entry = entry_for(key, config, now);
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->bucket.peek(tokens, now);
}

caf::expected<void> LocalBucketBackend::refund(const std::string& key, const BucketConfig& config,
                                               double tokens, TimePoint now) {
    auto entry = entry_for(key, config, now);
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->bucket.refund(tokens, now);
    return caf::unit;
}

caf::expected<void> LocalBucketBackend::penalize(const std::string& key, const BucketConfig& config,
                                                 Seconds wait, TimePoint now) {
    auto entry = entry_for(key, config, now);
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->bucket.penalize(wait, now);
    return caf::unit;
}

caf::expected<std::optional<BucketSnapshot>> LocalBucketBackend::snapshot(const std::string& key,
                                                                          TimePoint now) {
    auto entry = find(key);
    if (!entry) {
        return std::optional<BucketSnapshot>{};
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    BucketSnapshot snap;
    snap.tokens = entry->bucket.available(now);
    snap.capacity = entry->bucket.capacity();
    snap.refill_per_second = entry->bucket.refill_per_second();
    snap.last_used = entry->bucket.last_used();
    return std::optional<BucketSnapshot>{snap};
}

caf::expected<size_t> LocalBucketBackend::purge_idle(Seconds idle_for, TimePoint now) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        bool idle;
        {
            std::lock_guard<std::mutex> entry_lock(it->second->mutex);
            idle = to_seconds(now - it->second->bucket.last_used()) >= idle_for.count();
        }
        if (idle) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

caf::expected<void> LocalBucketBackend::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    entries_.erase(key);
    return caf::unit;
}

size_t LocalBucketBackend::size() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return entries_.size();
}

// bucket_store_actor

const char* bucket_store_state::name = "bucket_store";

namespace {

TokenBucket& bucket_for(bucket_store_state& state, const std::string& key,
                        double capacity, double rate, TimePoint now) {
    auto it = state.buckets.find(key);
    if (it == state.buckets.end()) {
        it = state.buckets.emplace(key, TokenBucket(BucketConfig{capacity, rate}, now)).first;
    }
    return it->second;
}

} // namespace

caf::behavior bucket_store_actor(caf::stateful_actor<bucket_store_state>* self) {
    return {
        [=](bucket_consume_atom, const std::string& key, double capacity, double rate,
            double tokens, int64_t now_ns) -> caf::result<bool, double, double> {
            auto now = from_nanos(now_ns);
            auto decision = bucket_for(self->state, key, capacity, rate, now).try_consume(tokens, now);
            return {decision.allowed, decision.retry_after_seconds, decision.tokens_remaining};
        },
        [=](bucket_peek_atom, const std::string& key, double capacity, double rate,
            double tokens, int64_t now_ns) -> caf::result<bool, double, double> {
            auto now = from_nanos(now_ns);
            auto decision = bucket_for(self->state, key, capacity, rate, now).peek(tokens, now);
            return {decision.allowed, decision.retry_after_seconds, decision.tokens_remaining};
        },
        [=](bucket_refund_atom, const std::string& key, double capacity, double rate,
            double tokens, int64_t now_ns) {
            auto now = from_nanos(now_ns);
            bucket_for(self->state, key, capacity, rate, now).refund(tokens, now);
        },
        [=](bucket_penalize_atom, const std::string& key, double capacity, double rate,
            double wait_seconds, int64_t now_ns) {
            auto now = from_nanos(now_ns);
            bucket_for(self->state, key, capacity, rate, now).penalize(Seconds(wait_seconds), now);
        },
        [=](bucket_snapshot_atom, const std::string& key,
            int64_t now_ns) -> caf::result<bool, double, double, double, int64_t> {
            auto it = self->state.buckets.find(key);
            if (it == self->state.buckets.end()) {
                return {false, 0.0, 0.0, 0.0, int64_t{0}};
            }
            auto& bucket = it->second;
            return {true, bucket.available(from_nanos(now_ns)), bucket.capacity(),
                    bucket.refill_per_second(), to_nanos(bucket.last_used())};
        },
        [=](bucket_purge_atom, double idle_seconds, int64_t now_ns) -> uint64_t {
            auto now = from_nanos(now_ns);
            uint64_t removed = 0;
            auto& buckets = self->state.buckets;
            for (auto it = buckets.begin(); it != buckets.end();) {
                if (to_seconds(now - it->second.last_used()) >= idle_seconds) {
                    it = buckets.erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
            return removed;
        },
        [=](bucket_remove_atom, const std::string& key) {
            self->state.buckets.erase(key);
        }
    };
}

// ActorBucketBackend

ActorBucketBackend::ActorBucketBackend(caf::actor_system& system, caf::actor store,
                                       std::chrono::milliseconds request_timeout)
    : system_(system), store_(std::move(store)), request_timeout_(request_timeout) {}

template <class Atom>
caf::expected<ConsumeResult> ActorBucketBackend::request_decision(Atom atom, const std::string& key,
                                                                  const BucketConfig& config,
                                                                  double tokens, TimePoint now) {
    caf::scoped_actor self{system_};
    caf::expected<ConsumeResult> outcome{make_error(ErrorCode::store_unavailable)};
    self->request(store_, request_timeout_, atom, key, config.capacity,
                  config.refill_per_second, tokens, to_nanos(now))
        .receive(
            [&](bool allowed, double retry_after, double remaining) {
                ConsumeResult result;
                result.allowed = allowed;
                result.retry_after_seconds = retry_after;
                result.tokens_remaining = remaining;
                outcome = result;
            },
            [&](caf::error& err) { outcome = store_error(err); });
    return outcome;
}

template <class... Ts>
caf::expected<void> ActorBucketBackend::request_ack(Ts&&... xs) {
    caf::scoped_actor self{system_};
    caf::expected<void> outcome{make_error(ErrorCode::store_unavailable)};
    self->request(store_, request_timeout_, std::forward<Ts>(xs)...)
        .receive([&]() { outcome = caf::unit; },
                 [&](caf::error& err) { outcome = store_error(err); });
    return outcome;
}

caf::expected<ConsumeResult> ActorBucketBackend::try_consume(const std::string& key,
                                                             const BucketConfig& config,
                                                             double tokens, TimePoint now) {
    return request_decision(bucket_consume_atom::value, key, config, tokens, now);
}

caf::expected<ConsumeResult> ActorBucketBackend::peek(const std::string& key,
                                                      const BucketConfig& config,
                                                      double tokens, TimePoint now) {
    return request_decision(bucket_peek_atom::value, key, config, tokens, now);
}

caf::expected<void> ActorBucketBackend::refund(const std::string& key, const BucketConfig& config,
                                               double tokens, TimePoint now) {
    return request_ack(bucket_refund_atom::value, key, config.capacity,
                       config.refill_per_second, tokens, to_nanos(now));
}

caf::expected<void> ActorBucketBackend::penalize(const std::string& key, const BucketConfig& config,
                                                 Seconds wait, TimePoint now) {
    return request_ack(bucket_penalize_atom::value, key, config.capacity,
                       config.refill_per_second, wait.count(), to_nanos(now));
}

caf::expected<std::optional<BucketSnapshot>> ActorBucketBackend::snapshot(const std::string& key,
                                                                          TimePoint now) {
    caf::scoped_actor self{system_};
    caf::expected<std::optional<BucketSnapshot>> outcome{make_error(ErrorCode::store_unavailable)};
    self->request(store_, request_timeout_, bucket_snapshot_atom::value, key, to_nanos(now))
        .receive(
            [&](bool found, double tokens, double capacity, double rate, int64_t last_used_ns) {
                if (!found) {
                    outcome = std::optional<BucketSnapshot>{};
                    return;
                }
                BucketSnapshot snap;
                snap.tokens = tokens;
                snap.capacity = capacity;
                snap.refill_per_second = rate;
                snap.last_used = from_nanos(last_used_ns);
                outcome = std::optional<BucketSnapshot>{snap};
            },
            [&](caf::error& err) { outcome = store_error(err); });
    return outcome;
}

caf::expected<size_t> ActorBucketBackend::purge_idle(Seconds idle_for, TimePoint now) {
    caf::scoped_actor self{system_};
    caf::expected<size_t> outcome{make_error(ErrorCode::store_unavailable)};
    self->request(store_, request_timeout_, bucket_purge_atom::value, idle_for.count(),
                  to_nanos(now))
        .receive([&](uint64_t removed) { outcome = static_cast<size_t>(removed); },
                 [&](caf::error& err) { outcome = store_error(err); });
    return outcome;
}

caf::expected<void> ActorBucketBackend::remove(const std::string& key) {
    return request_ack(bucket_remove_atom::value, key);
}

} // namespace resilience
} // namespace botfleet
