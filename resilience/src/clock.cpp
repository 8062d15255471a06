#include "botfleet/resilience/clock.hpp"
#include <thread>

namespace botfleet {
namespace resilience {

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::wait_for(Seconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    auto wait = std::chrono::duration_cast<std::chrono::steady_clock::duration>(duration);
    return !cv_.wait_for(lock, wait, [this] { return cancelled_.load(); });
}

bool SystemClock::sleep_for(Seconds duration, const CancellationToken* cancel) {
    if (duration.count() <= 0.0) {
        return cancel == nullptr || !cancel->is_cancelled();
    }
    if (cancel != nullptr) {
        return cancel->wait_for(duration);
    }
    std::this_thread::sleep_for(duration);
    return true;
}

ManualClock::ManualClock()
    : now_(std::chrono::steady_clock::now()),
      wall_base_(std::chrono::system_clock::now()),
      steady_base_(now_) {}

TimePoint ManualClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

WallTime ManualClock::wall_now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return wall_base_ + std::chrono::duration_cast<std::chrono::system_clock::duration>(
        now_ - steady_base_);
}

bool ManualClock::sleep_for(Seconds duration, const CancellationToken* cancel) {
    if (cancel != nullptr && cancel->is_cancelled()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sleeps_.push_back(duration.count());
    if (duration.count() > 0.0) {
        now_ += from_seconds(duration.count());
    }
    return true;
}

void ManualClock::advance(Seconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += from_seconds(duration.count());
}

std::vector<double> ManualClock::sleeps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sleeps_;
}

void ManualClock::clear_sleeps() {
    std::lock_guard<std::mutex> lock(mutex_);
    sleeps_.clear();
}

} // namespace resilience
} // namespace botfleet
