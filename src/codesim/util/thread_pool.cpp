#include <codesim/util/thread_pool.hpp>

#include <algorithm>

namespace codesim {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    try {
        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this]() { worker_loop(); });
        }
    } catch (...) {
        // Workers already started must be joined before members go away
        shutdown();
        throw;
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;  // stopping and drained
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        task();
    }
}

size_t ThreadPool::default_thread_count(size_t max_threads) {
    size_t hw = std::thread::hardware_concurrency();
    if (hw == 0) {
        hw = 1;
    }
    if (max_threads > 0) {
        hw = std::min(hw, max_threads);
    }
    return hw;
}

}  // namespace codesim
