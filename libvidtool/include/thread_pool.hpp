/**
 * @file thread_pool.hpp
 * @brief Fixed set of worker slots used by the JobOrchestrator.
 */

#ifndef VIDTOOL_THREAD_POOL_HPP
#define VIDTOOL_THREAD_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

/**
 * @brief A fixed-size thread pool; each worker is one "worker slot".
 *
 * @details Workers are std::jthread instances and are joined on
 * destruction. Tasks receive the worker's std::stop_token, which is only
 * triggered when the pool itself shuts down; batch cancellation is
 * handled by the orchestrator's own stop source. Tasks are dequeued in
 * FIFO order, so with a single worker they run strictly in enqueue order.
 */
class ThreadPool {
public:
    /**
     * @brief Constructs the thread pool and starts worker threads.
     * @param threads Number of worker slots; 0 is treated as 1.
     */
    explicit ThreadPool(unsigned threads = 1);

    /// Calls shutdown().
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueues a task to be executed by a worker thread.
     *
     * @tparam F A callable accepting a `std::stop_token`.
     * @return A std::future for the task's result.
     * @throws std::runtime_error if the pool is shutting down.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
            std::forward<F>(f)
        );
        {
            std::lock_guard lock(mtx_);
            if (closed_) throw std::runtime_error("enqueue on a ThreadPool that was shut down");
            ++unfinished_;
            queue_.emplace_back([task](const std::stop_token& st) { (*task)(st); });
        }
        work_cv_.notify_one();
        return task->get_future();
    }

    /**
     * @brief Blocks the calling thread until every enqueued task has finished.
     */
    void wait_idle();

    /**
     * @brief Refuses further tasks, drops the queued ones and joins the workers.
     *
     * Tasks already running are allowed to finish. Idempotent.
     */
    void shutdown();

    /// @return Number of worker slots.
    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

private:
    using Task = std::function<void(const std::stop_token&)>;

    void worker_loop(const std::stop_token& st, std::size_t slot);
    void finish_one();

    std::mutex mtx_;                      ///< Guards queue_, closed_ and unfinished_
    std::condition_variable_any work_cv_; ///< Wakes workers on new work or stop
    std::condition_variable idle_cv_;     ///< Wakes wait_idle() when unfinished_ drops to zero
    std::deque<Task> queue_;              ///< Pending tasks, FIFO
    bool closed_{false};                  ///< Set by shutdown()
    std::size_t unfinished_{0};           ///< Tasks queued or running
    std::vector<std::jthread> workers_;   ///< One thread per slot
};

#endif // VIDTOOL_THREAD_POOL_HPP
