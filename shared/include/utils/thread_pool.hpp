#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <future>
#include <functional>
#include <atomic>
#include <memory>
#include <stdexcept>

namespace pmx {
namespace utils {

// Fixed-size worker pool. Tasks run in submission order; results come back through futures.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    // Run fn(0) .. fn(count - 1) on the pool and return the results in index order
    template<typename F>
    auto map_indexed(size_t count, F fn) -> std::vector<std::invoke_result_t<F, size_t>>;

    void wait_for_all();

    size_t thread_count() const { return threads_.size(); }
    size_t pending_tasks() const;
    bool is_running() const { return !stop_; }

    void shutdown();

private:
    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::condition_variable finished_condition_;
    std::atomic<bool> stop_{false};
    size_t active_tasks_{0};

    void worker_thread();
};

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using return_type = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        if (stop_) {
            throw std::runtime_error("Cannot submit task to stopped ThreadPool");
        }

        tasks_.emplace([task]() { (*task)(); });
    }

    condition_.notify_one();
    return result;
}

template<typename F>
auto ThreadPool::map_indexed(size_t count, F fn) -> std::vector<std::invoke_result_t<F, size_t>> {
    using value_type = std::invoke_result_t<F, size_t>;

    std::vector<std::future<value_type>> futures;
    futures.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        futures.push_back(submit(fn, i));
    }

    std::vector<value_type> results;
    results.reserve(count);
    for (auto& future : futures) {
        results.push_back(future.get());
    }
    return results;
}

} // namespace utils
} // namespace pmx
