#pragma once

#include "botfleet/resilience/token_bucket.hpp"
#include <caf/actor.hpp>
#include <caf/actor_system.hpp>
#include <caf/atom.hpp>
#include <caf/behavior.hpp>
#include <caf/expected.hpp>
#include <caf/stateful_actor.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace botfleet {
namespace resilience {

struct BucketSnapshot {
    double tokens = 0.0;
    double capacity = 0.0;
    double refill_per_second = 0.0;
    TimePoint last_used;
};

/**
 * Storage for token buckets keyed by scope.
 *
 * Every operation is an atomic read-modify-write of one bucket. An error
 * result means the store itself could not be reached; callers decide how
 * to degrade.
 */
class BucketBackend {
public:
    virtual ~BucketBackend() = default;

    virtual caf::expected<ConsumeResult> try_consume(const std::string& key,
                                                     const BucketConfig& config,
                                                     double tokens, TimePoint now) = 0;
    virtual caf::expected<ConsumeResult> peek(const std::string& key,
                                              const BucketConfig& config,
                                              double tokens, TimePoint now) = 0;
    virtual caf::expected<void> refund(const std::string& key, const BucketConfig& config,
                                       double tokens, TimePoint now) = 0;
    virtual caf::expected<void> penalize(const std::string& key, const BucketConfig& config,
                                         Seconds wait, TimePoint now) = 0;
    virtual caf::expected<std::optional<BucketSnapshot>> snapshot(const std::string& key,
                                                                  TimePoint now) = 0;
    virtual caf::expected<size_t> purge_idle(Seconds idle_for, TimePoint now) = 0;
    virtual caf::expected<void> remove(const std::string& key) = 0;
};

// In-process buckets, one mutex per key
class LocalBucketBackend : public BucketBackend {
public:
    caf::expected<ConsumeResult> try_consume(const std::string& key, const BucketConfig& config,
                                             double tokens, TimePoint now) override;
    caf::expected<ConsumeResult> peek(const std::string& key, const BucketConfig& config,
                                      double tokens, TimePoint now) override;
    caf::expected<void> refund(const std::string& key, const BucketConfig& config,
                               double tokens, TimePoint now) override;
    caf::expected<void> penalize(const std::string& key, const BucketConfig& config,
                                 Seconds wait, TimePoint now) override;
    caf::expected<std::optional<BucketSnapshot>> snapshot(const std::string& key,
                                                          TimePoint now) override;
    caf::expected<size_t> purge_idle(Seconds idle_for, TimePoint now) override;
    caf::expected<void> remove(const std::string& key) override;

    size_t size() const;

private:
    struct Entry {
        std::mutex mutex;
        TokenBucket bucket;
        Entry(const BucketConfig& config, TimePoint now) : bucket(config, now) {}
    };

    // Map lock is held only to find or create the entry
    std::shared_ptr<Entry> entry_for(const std::string& key, const BucketConfig& config,
                                     TimePoint now);
    std::shared_ptr<Entry> find(const std::string& key) const;

    mutable std::mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

// Message interface of the shared bucket store actor
using bucket_consume_atom = caf::atom_constant<caf::atom("bconsume")>;
using bucket_peek_atom = caf::atom_constant<caf::atom("bpeek")>;
using bucket_refund_atom = caf::atom_constant<caf::atom("brefund")>;
using bucket_penalize_atom = caf::atom_constant<caf::atom("bpenalize")>;
using bucket_snapshot_atom = caf::atom_constant<caf::atom("bsnapshot")>;
using bucket_purge_atom = caf::atom_constant<caf::atom("bpurge")>;
using bucket_remove_atom = caf::atom_constant<caf::atom("bremove")>;

struct bucket_store_state {
    std::unordered_map<std::string, TokenBucket> buckets;
    static const char* name;
};

/**
 * Shared bucket store. The actor processes one message at a time, which makes
 * each request an atomic compare-and-update against its state. Timestamps are
 * nanoseconds on the caller's monotonic clock.
 */
caf::behavior bucket_store_actor(caf::stateful_actor<bucket_store_state>* self);

// BucketBackend over a bucket store actor; a timed-out or failed request is an error
class ActorBucketBackend : public BucketBackend {
public:
    ActorBucketBackend(caf::actor_system& system, caf::actor store,
                       std::chrono::milliseconds request_timeout);

    caf::expected<ConsumeResult> try_consume(const std::string& key, const BucketConfig& config,
                                             double tokens, TimePoint now) override;
    caf::expected<ConsumeResult> peek(const std::string& key, const BucketConfig& config,
                                      double tokens, TimePoint now) override;
    caf::expected<void> refund(const std::string& key, const BucketConfig& config,
                               double tokens, TimePoint now) override;
    caf::expected<void> penalize(const std::string& key, const BucketConfig& config,
                                 Seconds wait, TimePoint now) override;
    caf::expected<std::optional<BucketSnapshot>> snapshot(const std::string& key,
                                                          TimePoint now) override;
    caf::expected<size_t> purge_idle(Seconds idle_for, TimePoint now) override;
    caf::expected<void> remove(const std::string& key) override;

    const caf::actor& store() const { return store_; }

private:
    caf::actor_system& system_;
    caf::actor store_;
    std::chrono::milliseconds request_timeout_;

    template <class Atom>
    caf::expected<ConsumeResult> request_decision(Atom atom, const std::string& key,
                                                  const BucketConfig& config,
                                                  double tokens, TimePoint now);
    template <class... Ts>
    caf::expected<void> request_ack(Ts&&... xs);
};

} // namespace resilience
} // namespace botfleet
