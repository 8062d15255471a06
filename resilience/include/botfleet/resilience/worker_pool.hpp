#pragma once

#include "botfleet/resilience/observability.hpp"
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace botfleet {
namespace resilience {

/**
 * Fixed-size pool shared by all tenants. Guarded calls are multiplexed over it;
 * no tenant gets a dedicated thread.
 */
class WorkerPool {
public:
    WorkerPool(size_t threads, std::shared_ptr<Observability> observability);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    using Task = std::function<void()>;

    // Exceptions escaping a posted task are logged
    void post(Task task);

    // Exceptions propagate through the returned future
    template <class F>
    auto submit(F&& fn) -> std::future<typename std::result_of<F()>::type> {
        using Result = typename std::result_of<F()>::type;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
        auto future = task->get_future();
        post([task]() { (*task)(); });
        return future;
    }

    // Drains queued tasks and joins; later posts throw
    void shutdown();

    size_t queue_depth() const;
    size_t size() const { return threads_.size(); }

private:
    std::shared_ptr<Observability> observability_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::queue<Task> q_;
    bool stop_ = false;
    std::vector<std::thread> threads_;

    void run();
};

} // namespace resilience
} // namespace botfleet
