#include "botfleet/resilience/periodic_task.hpp"

namespace botfleet {
namespace resilience {

PeriodicTask::PeriodicTask(std::string name, Seconds interval, std::function<void()> job,
                           std::shared_ptr<Observability> observability)
    : name_(std::move(name)),
      interval_(interval),
      job_(std::move(job)),
      observability_(std::move(observability)) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_) {
        return;
    }
    cancel_ = std::make_unique<CancellationToken>();
    running_ = true;
    CancellationToken* cancel = cancel_.get();
    thread_ = std::thread([this, cancel]() { loop(cancel); });
    observability_->log_info("Periodic task started", "",
                             {{"task", name_}, {"interval_seconds", std::to_string(interval_.count())}});
}

void PeriodicTask::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_) {
        return;
    }
    cancel_->cancel();
    if (thread_.joinable()) {
        thread_.join();
    }
    cancel_.reset();
    running_ = false;
    observability_->log_info("Periodic task stopped", "", {{"task", name_}});
}

void PeriodicTask::run_once() {
    try {
        job_();
        runs_++;
    } catch (const std::exception& e) {
        failures_++;
        observability_->log_error("Periodic task failed", "", {{"task", name_}, {"error", e.what()}});
    }
}

void PeriodicTask::loop(CancellationToken* cancel) {
    while (cancel->wait_for(interval_)) {
        run_once();
    }
}

} // namespace resilience
} // namespace botfleet
