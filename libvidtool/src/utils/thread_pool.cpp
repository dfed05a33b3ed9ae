#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <string>

ThreadPool::ThreadPool(unsigned threads) {
    threads = std::max(threads, 1u);
    workers_.reserve(threads);
    for (std::size_t slot = 0; slot < threads; ++slot) {
        workers_.emplace_back([this, slot](const std::stop_token& st) { worker_loop(st, slot); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::worker_loop(const std::stop_token& st, const std::size_t slot) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(mtx_);
            if (!work_cv_.wait(lock, st, [this] { return closed_ || !queue_.empty(); })) {
                return; // stop requested
            }
            if (queue_.empty()) return; // closed and drained
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            task(st);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error,
                        "Unhandled exception in worker slot " + std::to_string(slot) + ": " + e.what(),
                        "ThreadPool");
        }
        finish_one();
    }
}

void ThreadPool::finish_one() {
    {
        std::lock_guard lock(mtx_);
        if (unfinished_ > 0) --unfinished_;
    }
    idle_cv_.notify_all();
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(mtx_);
    idle_cv_.wait(lock, [this] { return unfinished_ == 0; });
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(mtx_);
        if (closed_) return;
        closed_ = true;
        unfinished_ -= std::min(unfinished_, queue_.size());
        queue_.clear();
    }
    work_cv_.notify_all();
    idle_cv_.notify_all();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}
