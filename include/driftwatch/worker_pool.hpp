#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace driftwatch {

// Fixed-size pool used to run the per-file checks of one batch in parallel
class WorkerPool {
public:
    explicit WorkerPool(size_t thread_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template<typename Fn>
    auto submit(Fn fn) -> std::future<decltype(fn())> {
        using Result = decltype(fn());
        auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
        std::future<Result> future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw std::runtime_error("WorkerPool is shutting down");
            }
            tasks_.push([task]() { (*task)(); });
        }
        cv_.notify_one();
        return future;
    }

    size_t size() const { return workers_.size(); }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

// Runs fn on a detached thread. The returned future does not block on
// destruction, so a caller that stops waiting after a timeout is not held
// up by a task that keeps running.
template<typename Fn>
auto run_detached(Fn fn) -> std::future<decltype(fn())> {
    using Result = decltype(fn());
    auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    std::future<Result> future = task->get_future();
    std::thread([task]() { (*task)(); }).detach();
    return future;
}

} // namespace driftwatch
