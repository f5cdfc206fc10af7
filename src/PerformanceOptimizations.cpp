/**
 * @file PerformanceOptimizations.cpp
 * @brief Thread pool implementation
 */

#include "PerformanceOptimizations.hpp"

namespace OWF {
namespace Performance {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) num_threads = 1;

    for (size_t i = 0; i < num_threads; ++i) {
        workers.emplace_back([this] {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex);
                    condition.wait(lock, [this] {
                        return stop || !tasks.empty();
                    });
                    if (stop && tasks.empty()) return;
                    task = std::move(tasks.front());
                    tasks.pop();
                }
                task();
            }
        });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        stop = true;
    }
    condition.notify_all();
    for (auto& worker : workers) {
        worker.join();
    }
}

void ThreadPool::parallelFor(size_t start, size_t end,
                             const std::function<void(size_t, size_t)>& body) {
    if (end <= start) return;

    size_t n_threads = workers.size();
    size_t chunk = (end - start + n_threads - 1) / n_threads;

    std::atomic<size_t> completed{0};
    size_t launched = 0;

    for (size_t i = 0; i < n_threads; ++i) {
        size_t chunk_start = start + i * chunk;
        size_t chunk_end = std::min(chunk_start + chunk, end);

        if (chunk_start < end) {
            ++launched;
            enqueue([&, chunk_start, chunk_end] {
                body(chunk_start, chunk_end);
                completed.fetch_add(1);
            });
        }
    }

    // Wait for completion
    while (completed.load() < launched) {
        std::this_thread::yield();
    }
}

} // namespace Performance
} // namespace OWF
