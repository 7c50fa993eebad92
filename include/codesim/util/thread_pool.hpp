#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace codesim {

/**
 * Fixed-size worker pool.
 *
 * Tasks run in submission order on whichever worker is free. Exceptions
 * thrown by a task surface from the returned future. The destructor drains
 * the queue and joins all workers.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template <typename F>
    auto submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;

        auto packaged = std::make_shared<std::packaged_task<R()>>(std::forward<F>(task));
        std::future<R> future = packaged->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.emplace_back([packaged]() { (*packaged)(); });
        }
        cv_.notify_one();
        return future;
    }

    /**
     * Run body(i) for every i in [0, count) and wait for all of them.
     * The first exception thrown by any call is rethrown here.
     */
    template <typename F>
    void parallel_for(size_t count, F&& body) {
        std::vector<std::future<void>> futures;
        futures.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            futures.push_back(submit([&body, i]() { body(i); }));
        }
        for (auto& f : futures) {
            f.wait();
        }
        for (auto& f : futures) {
            f.get();
        }
    }

    size_t size() const { return workers_.size(); }

    // hardware_concurrency(), never 0, optionally capped
    static size_t default_thread_count(size_t max_threads = 0);

private:
    void worker_loop();
    void shutdown();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

}  // namespace codesim
