#pragma once

/**
 * @file veil_thread_pool.hpp
 * @brief Fixed-size worker pool for per-frame video work
 *
 * Tasks run in submission order across the workers; an exception thrown by
 * a task is delivered through its future. Destruction drains the queue.
 *
 * parallel_for() is the per-frame fan-out the video codec uses: one task per
 * index, every task joined before it returns.
 */

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <atomic>
#include <exception>
#include <memory>
#include <type_traits>
#include <stdexcept>

namespace veil {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit task, returns future with result
    template<class F, class... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>;

    /**
     * Run fn(i) for every i in [0, count) and wait for all of them. When
     * tasks throw, the exception of the lowest index is rethrown once every
     * task has finished, so fn's captures stay valid throughout.
     */
    template<class Fn>
    void parallel_for(size_t count, Fn&& fn);

    /// Graceful shutdown
    void shutdown();

    size_t total_threads() const noexcept;
    bool is_running() const noexcept;

private:
    void worker_loop();

    std::vector<std::thread>              workers_;
    std::queue<std::function<void()>>     tasks_;
    mutable std::mutex                    queue_mutex_;
    std::condition_variable               condition_;
    std::atomic<bool>                     stop_{false};
};

// Template implementation must be in header
template<class F, class... Args>
auto ThreadPool::submit(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>>
{
    using return_type = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("submit on stopped ThreadPool");
        }
        tasks_.emplace([task]() { (*task)(); });
    }

    condition_.notify_one();
    return result;
}

template<class Fn>
void ThreadPool::parallel_for(size_t count, Fn&& fn)
{
    if (stop_) {
        throw std::runtime_error("parallel_for on stopped ThreadPool");
    }

    std::vector<std::future<void>> pending;
    pending.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        pending.push_back(submit([&fn, i] { fn(i); }));
    }

    std::exception_ptr first_error;
    for (auto& f : pending) {
        try {
            f.get();
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

} // namespace veil
