#pragma once
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace clipmind {

// Fixed set of threads draining a FIFO job queue. Background embedding,
// index rebuilds and clustering passes run here.
class WorkerPool {
public:
    explicit WorkerPool(size_t threads);
    ~WorkerPool();   // finishes queued jobs, then joins

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Exceptions thrown by the job surface through the future.
    template <typename F>
    auto submit(F&& job) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(job));
        auto future = task->get_future();
        enqueue([task]() { (*task)(); });
        return future;
    }

    size_t pending() const;
    size_t thread_count() const { return threads_.size(); }

private:
    void enqueue(std::function<void()> job);
    void run();

    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> jobs_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
};

} // namespace clipmind
