#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <vector>

namespace mediafetch::downloader {

/**
 * Fixed-size FIFO thread pool shared by all jobs.
 *
 * Thread-safe and follows RAII principles: the destructor stops accepting work, drains the
 * queue and joins the workers.
 */
class WorkerPool {
public:
    using Task = std::function<void()>;
    // Receives false when the cancel predicate fired before dispatch.
    using CancellableTask = std::function<void(bool dispatched)>;

    /**
     * Create a pool with the specified number of threads (0 = hardware concurrency).
     */
    explicit WorkerPool(std::size_t num_threads);

    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    /**
     * Queue a task. Returns false if the pool is stopping (task not queued).
     */
    bool enqueue(Task task);

    /**
     * Queue a task whose cancel predicate is evaluated right before dispatch. The task always
     * runs exactly once: with dispatched=true normally, with dispatched=false when the predicate
     * returned true, so completion accounting sees every task. Returns false if the pool is
     * stopping.
     */
    bool enqueueCancellable(std::function<bool()> shouldCancel, CancellableTask task);

    /**
     * Stop the pool. No new tasks are accepted; queued tasks still run.
     */
    void stop();

    std::size_t queue_size() const;
    std::size_t thread_count() const noexcept { return threadCount_; }
    bool is_stopping() const { return state_->stopping.load(); }

private:
    struct PoolState {
        std::queue<Task> tasks;
        mutable std::mutex queue_mutex;
        std::condition_variable condition;
        std::atomic<bool> stopping{false};
    };

    static void worker_thread(std::shared_ptr<PoolState> state, std::stop_token token);

    std::vector<std::jthread> workers_;
    std::shared_ptr<PoolState> state_;
    std::size_t threadCount_{0};
};

} // namespace mediafetch::downloader
