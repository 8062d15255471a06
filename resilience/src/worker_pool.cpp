#include "botfleet/resilience/worker_pool.hpp"

namespace botfleet {
namespace resilience {

WorkerPool::WorkerPool(size_t threads, std::shared_ptr<Observability> observability)
    : observability_(std::move(observability)) {
    if (threads == 0) {
        threads = 1;
    }
    for (size_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this]() { this->run(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::post(Task task) {
    {
        std::unique_lock<std::mutex> lk(mu_);
        if (stop_) {
            throw std::runtime_error("worker pool is shut down");
        }
        q_.push(std::move(task));
    }
    cv_.notify_one();
}

void WorkerPool::shutdown() {
    {
        std::unique_lock<std::mutex> lk(mu_);
        if (stop_) {
            return;
        }
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
}

size_t WorkerPool::queue_depth() const {
    std::unique_lock<std::mutex> lk(mu_);
    return q_.size();
}

void WorkerPool::run() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [this] { return stop_ || !q_.empty(); });
            if (stop_ && q_.empty()) {
                return;
            }
            task = std::move(q_.front());
            q_.pop();
        }
        try {
            task();
        } catch (const std::exception& e) {
            observability_->log_error("Worker task failed", "", {{"error", e.what()}});
        }
    }
}

} // namespace resilience
} // namespace botfleet
