// include/thread_pool.hpp
#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <memory>
#include <condition_variable>
#include <future>      // For std::future, std::packaged_task
#include <functional>  // For std::function
#include <type_traits> // For std::invoke_result_t

#include "errors.hpp"

namespace ChunkStore {
namespace Concurrency {

// Fixed set of workers draining a FIFO of tasks. The worker count is the
// upper bound on concurrent backend calls.
class ThreadPool {
public:
    // Throws ConfigurationError for zero threads.
    explicit ThreadPool(size_t num_threads);

    // Runs every queued task, then joins the workers.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Queues a callable; its result or exception arrives through the future.
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F>>;

    size_t size() const { return workers.size(); }

private:
    void workerLoop();

    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;

    std::mutex queue_mutex;
    std::condition_variable condition;
    bool stop_all = false;
};

template<class F>
auto ThreadPool::enqueue(F&& f) -> std::future<std::invoke_result_t<F>>
{
    using return_type = std::invoke_result_t<F>;

    // packaged_task is move-only; std::function needs a copyable wrapper.
    auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    std::future<return_type> res = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (stop_all)
            throw ConfigurationError("enqueue on stopped ThreadPool");
        tasks.emplace([task]() { (*task)(); });
    }
    condition.notify_one();
    return res;
}

} // namespace Concurrency
} // namespace ChunkStore
