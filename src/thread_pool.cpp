// src/thread_pool.cpp
#include "thread_pool.hpp"

namespace ChunkStore
{
    namespace Concurrency
    {

        ThreadPool::ThreadPool(size_t num_threads)
        {
            if (num_threads == 0)
            {
                throw ConfigurationError("ThreadPool cannot be initialized with 0 threads");
            }
            workers.reserve(num_threads);
            for (size_t i = 0; i < num_threads; ++i)
            {
                workers.emplace_back([this] { workerLoop(); });
            }
        }

        void ThreadPool::workerLoop()
        {
            for (;;)
            {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex);
                    condition.wait(lock, [this] { return stop_all || !tasks.empty(); });

                    // Drain the queue before exiting
                    if (stop_all && tasks.empty())
                        return;

                    task = std::move(tasks.front());
                    tasks.pop();
                }
                // packaged_task stores any exception in its future
                task();
            }
        }

        ThreadPool::~ThreadPool()
        {
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                stop_all = true;
            }
            condition.notify_all();
            for (std::thread &worker : workers)
            {
                if (worker.joinable())
                {
                    worker.join();
                }
            }
        }

    } // namespace Concurrency
} // namespace ChunkStore
