#include "botfleet/resilience/session_pool.hpp"
#include <algorithm>

namespace botfleet {
namespace resilience {

namespace {

// Granularity of cancellation checks while waiting for a permit
constexpr auto permit_wait_slice = std::chrono::milliseconds(10);

void add(SessionStats& into, const SessionStats& delta) {
    into.messages += delta.messages;
    into.channels += delta.channels;
    into.errors += delta.errors;
}

} // namespace

std::string to_string(SessionStatus status) {
    return status == SessionStatus::open ? "open" : "released";
}

SessionPool::SessionPool(const SessionPoolConfig& config, std::shared_ptr<Clock> clock,
                         std::shared_ptr<Observability> observability)
    : config_(config), clock_(std::move(clock)), observability_(std::move(observability)) {}

caf::expected<SessionSlot> SessionPool::acquire_session(const std::string& tenant_id,
                                                        const CancellationToken* cancel) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (active_.count(tenant_id) > 0 || pending_.count(tenant_id) > 0) {
        busy_rejections_++;
        observability_->record_session_event("busy");
        return make_error(ErrorCode::session_busy,
                          "tenant " + tenant_id + " already holds an open session");
    }

    // Claim the tenant before waiting so a concurrent acquire is rejected, not queued
    pending_.insert(tenant_id);
    auto deadline = std::chrono::steady_clock::now() + config_.acquire_timeout;
    while (active_.size() >= config_.max_total_connections) {
        if (cancel && cancel->is_cancelled()) {
            pending_.erase(tenant_id);
            return make_error(ErrorCode::cancelled, "session acquire cancelled");
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            pending_.erase(tenant_id);
            exhausted_++;
            observability_->record_session_event("exhausted");
            observability_->log_warn("Session pool exhausted", tenant_id,
                                     {{"max_connections",
                                       std::to_string(config_.max_total_connections)}});
            return make_error(ErrorCode::pool_exhausted,
                              "no session permit within acquire timeout");
        }
        permit_released_.wait_until(lock, std::min(deadline, now + permit_wait_slice));
    }
    pending_.erase(tenant_id);

    SessionSlot slot;
    slot.session_id = next_session_id_++;
    slot.tenant_id = tenant_id;
    slot.acquired_at = clock_->now();
    slot.acquired_wall = clock_->wall_now();
    slot.status = SessionStatus::open;
    active_.emplace(tenant_id, slot);
    acquired_++;

    observability_->record_session_event("acquired");
    observability_->set_active_sessions(static_cast<int64_t>(active_.size()));
    observability_->log_debug("Session acquired", tenant_id,
                              {{"session_id", std::to_string(slot.session_id)},
                               {"active", std::to_string(active_.size())}});
    return slot;
}

caf::expected<void> SessionPool::record_activity(const std::string& tenant_id,
                                                 const SessionStats& delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(tenant_id);
    if (it == active_.end()) {
        return make_error(ErrorCode::not_found, "no open session for tenant " + tenant_id);
    }
    add(it->second.stats, delta);
    return caf::unit;
}

SessionRecord SessionPool::close_slot(std::map<std::string, SessionSlot>::iterator it, bool forced) {
    auto& slot = it->second;
    SessionRecord record;
    record.session_id = slot.session_id;
    record.tenant_id = slot.tenant_id;
    record.started_at = slot.acquired_wall;
    record.ended_at = clock_->wall_now();
    record.duration_seconds = std::max(0.0, to_seconds(clock_->now() - slot.acquired_at));
    record.stats = slot.stats;
    record.forced = forced;
    if (forced) {
        record.stats.errors++;
    }

    history_.push_back(record);
    while (history_.size() > config_.history_size) {
        history_.pop_front();
    }

    active_.erase(it);
    released_++;
    permit_released_.notify_one();

    observability_->record_session_event(forced ? "stale" : "released");
    observability_->set_active_sessions(static_cast<int64_t>(active_.size()));
    return record;
}

caf::expected<SessionRecord> SessionPool::release_session(const std::string& tenant_id,
                                                          const SessionStats& stats,
                                                          std::optional<uint64_t> session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(tenant_id);
    if (it == active_.end() || (session_id && it->second.session_id != *session_id)) {
        return make_error(ErrorCode::not_found, "no matching open session for tenant " + tenant_id);
    }
    add(it->second.stats, stats);
    auto record = close_slot(it, false);
    observability_->log_debug("Session released", tenant_id,
                              {{"session_id", std::to_string(record.session_id)},
                               {"duration_seconds", std::to_string(record.duration_seconds)}});
    return record;
}

std::vector<SessionRecord> SessionPool::sweep_stale() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionRecord> swept;
    auto now = clock_->now();
    double limit = std::chrono::duration_cast<Seconds>(config_.session_timeout).count();
    for (auto it = active_.begin(); it != active_.end();) {
        auto current = it++;
        if (to_seconds(now - current->second.acquired_at) > limit) {
            auto record = close_slot(current, true);
            stale_released_++;
            observability_->log_warn("Force-released stale session", record.tenant_id,
                                     {{"session_id", std::to_string(record.session_id)},
                                      {"open_seconds", std::to_string(record.duration_seconds)}});
            swept.push_back(record);
        }
    }
    return swept;
}

PoolStatus SessionPool::get_pool_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PoolStatus status;
    status.active_sessions = active_.size();
    status.max_connections = config_.max_total_connections;
    status.available = config_.max_total_connections > active_.size()
                           ? config_.max_total_connections - active_.size()
                           : 0;
    status.pending = pending_.size();
    status.acquired = acquired_;
    status.released = released_;
    status.busy_rejections = busy_rejections_;
    status.exhausted = exhausted_;
    status.stale_released = stale_released_;
    for (const auto& entry : active_) {
        status.active_tenants.push_back(entry.first);
    }

    status.window_seconds = std::chrono::duration_cast<Seconds>(config_.metrics_window).count();
    auto cutoff = clock_->wall_now() -
                  std::chrono::duration_cast<WallTime::duration>(config_.metrics_window);
    for (const auto& record : history_) {
        if (record.ended_at < cutoff) {
            continue;
        }
        status.recent_sessions++;
        status.avg_duration_seconds += record.duration_seconds;
        status.avg_messages += static_cast<double>(record.stats.messages);
        status.avg_channels += static_cast<double>(record.stats.channels);
        status.avg_errors += static_cast<double>(record.stats.errors);
    }
    if (status.recent_sessions > 0) {
        double n = static_cast<double>(status.recent_sessions);
        status.avg_duration_seconds /= n;
        status.avg_messages /= n;
        status.avg_channels /= n;
        status.avg_errors /= n;
    }
    return status;
}

bool SessionPool::has_open_session(const std::string& tenant_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.count(tenant_id) > 0;
}

std::optional<SessionSlot> SessionPool::get_session(const std::string& tenant_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(tenant_id);
    if (it == active_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<SessionRecord> SessionPool::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<SessionRecord>(history_.begin(), history_.end());
}

void SessionPool::release_lease(const std::string& tenant_id, uint64_t session_id,
                                const SessionStats& stats) {
    auto released = release_session(tenant_id, stats, session_id);
    if (!released) {
        observability_->log_debug("Session already released by sweep", tenant_id,
                                  {{"session_id", std::to_string(session_id)}});
    }
}

// SessionLease

SessionLease::SessionLease(SessionPool& pool, SessionSlot slot)
    : pool_(&pool), slot_(std::move(slot)) {}

SessionLease::~SessionLease() {
    release();
}

SessionLease::SessionLease(SessionLease&& other) noexcept
    : pool_(other.pool_), slot_(std::move(other.slot_)), pending_stats_(other.pending_stats_) {
    other.pool_ = nullptr;
}

SessionLease& SessionLease::operator=(SessionLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        slot_ = std::move(other.slot_);
        pending_stats_ = other.pending_stats_;
        other.pool_ = nullptr;
    }
    return *this;
}

void SessionLease::add_stats(const SessionStats& delta) {
    add(pending_stats_, delta);
}

void SessionLease::release() {
    if (!pool_) {
        return;
    }
    auto* pool = pool_;
    pool_ = nullptr;
    pool->release_lease(slot_.tenant_id, slot_.session_id, pending_stats_);
    slot_.status = SessionStatus::released;
}

} // namespace resilience
} // namespace botfleet
