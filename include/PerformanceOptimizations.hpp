/**
 * @file PerformanceOptimizations.hpp
 * @brief Performance utilities for the displacement hot path
 *
 * Provides:
 * - Polynomial sine/cosine approximations for the summation loop
 * - Thread pool for parallel surface updates
 * - Cache-blocked range iteration
 * - High-resolution timer
 */

#ifndef OWF_PERFORMANCE_OPTIMIZATIONS_HPP
#define OWF_PERFORMANCE_OPTIMIZATIONS_HPP

#include <cstddef>
#include <cmath>
#include <algorithm>
#include <vector>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <atomic>
#include <chrono>

namespace OWF {
namespace Performance {

// =============================================================================
// Fast Trigonometry
// =============================================================================

namespace FastTrig {
    constexpr double PI = 3.14159265358979323846;
    constexpr double TWO_PI = 2.0 * PI;
    constexpr double HALF_PI = 0.5 * PI;

    constexpr double B = 4.0 / PI;
    constexpr double C = -4.0 / (PI * PI);
    constexpr double P = 0.225;              ///< Refinement weight

    /**
     * @brief Reduce x modulo 2π into (-π, π]
     */
    inline double wrapPhase(double x) {
        double r = std::fmod(x, TWO_PI);
        if (r < 0.0) r += TWO_PI;
        if (r > PI) r -= TWO_PI;
        return r;
    }
}

/**
 * @brief Parabolic sine approximation
 *
 * y = B x + C x |x| on the reduced argument. Maximum absolute error is
 * about 0.056; exact at 0, ±π/2 and π.
 */
inline double approxSin(double x) {
    x = FastTrig::wrapPhase(x);
    return FastTrig::B * x + FastTrig::C * x * std::abs(x);
}

inline double approxCos(double x) {
    return approxSin(x + FastTrig::HALF_PI);
}

/**
 * @brief Parabolic sine with one refinement pass (max error ~0.001)
 */
inline double approxSinRefined(double x) {
    double y = approxSin(x);
    return FastTrig::P * (y * std::abs(y) - y) + y;
}

inline double approxCosRefined(double x) {
    return approxSinRefined(x + FastTrig::HALF_PI);
}

// =============================================================================
// Cache-Aware Iteration
// =============================================================================

/**
 * @brief Cache-blocked iteration
 */
class BlockIterator {
public:
    size_t total_size;
    size_t block_size;

    BlockIterator(size_t total, size_t block = 256)
        : total_size(total), block_size(block) {}

    template<typename Func>
    void iterate(Func&& f) const {
        for (size_t start = 0; start < total_size; start += block_size) {
            size_t end = std::min(start + block_size, total_size);
            f(start, end);
        }
    }
};

// =============================================================================
// Thread Pool
// =============================================================================

/**
 * @brief Simple thread pool for parallel operations
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F>
    void enqueue(F&& f) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            tasks.emplace(std::forward<F>(f));
        }
        condition.notify_one();
    }

    /**
     * @brief Split [start, end) into one contiguous chunk per worker and block
     * until every chunk has run
     *
     * @p body runs on worker threads and must not throw; an escaping
     * exception terminates the process.
     */
    void parallelFor(size_t start, size_t end,
                     const std::function<void(size_t, size_t)>& body);

    size_t numThreads() const { return workers.size(); }

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    std::mutex queue_mutex;
    std::condition_variable condition;
    bool stop = false;
};

// =============================================================================
// Performance Metrics
// =============================================================================

/**
 * @brief High-resolution timer
 */
class Timer {
public:
    void start() {
        start_time = std::chrono::high_resolution_clock::now();
    }

    double stop() {
        auto end_time = std::chrono::high_resolution_clock::now();
        return std::chrono::duration<double>(end_time - start_time).count();
    }

    double elapsed() const {
        auto now = std::chrono::high_resolution_clock::now();
        return std::chrono::duration<double>(now - start_time).count();
    }

private:
    std::chrono::high_resolution_clock::time_point start_time;
};

} // namespace Performance
} // namespace OWF

#endif // OWF_PERFORMANCE_OPTIMIZATIONS_HPP
