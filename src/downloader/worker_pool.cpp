#include <mediafetch/downloader/worker_pool.h>

#include <spdlog/spdlog.h>

#include <exception>

namespace mediafetch::downloader {

WorkerPool::WorkerPool(std::size_t num_threads) : state_(std::make_shared<PoolState>()) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) {
            num_threads = 4; // Fallback to 4 threads
        }
    }
    threadCount_ = num_threads;

    workers_.reserve(num_threads);
    for (std::size_t i = 0; i < num_threads; ++i) {
        // Capture shared state by value so threads have their own shared_ptr
        workers_.emplace_back(
            [state = state_](std::stop_token token) { worker_thread(state, token); });
    }
}

WorkerPool::~WorkerPool() {
    stop();
}

bool WorkerPool::enqueue(Task task) {
    {
        std::unique_lock<std::mutex> lock(state_->queue_mutex);
        if (state_->stopping) {
            return false;
        }
        state_->tasks.emplace(std::move(task));
    }
    state_->condition.notify_one();
    return true;
}

bool WorkerPool::enqueueCancellable(std::function<bool()> shouldCancel, CancellableTask task) {
    return enqueue([shouldCancel = std::move(shouldCancel), task = std::move(task)]() {
        const bool cancelled = shouldCancel && shouldCancel();
        task(!cancelled);
    });
}

void WorkerPool::stop() {
    {
        std::unique_lock<std::mutex> lock(state_->queue_mutex);
        if (state_->stopping) {
            return; // Already stopping
        }
        state_->stopping = true;
    }

    state_->condition.notify_all();

    // Workers drain the queue before exiting; join them all before returning.
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

std::size_t WorkerPool::queue_size() const {
    std::unique_lock<std::mutex> lock(state_->queue_mutex);
    return state_->tasks.size();
}

void WorkerPool::worker_thread(std::shared_ptr<PoolState> state, std::stop_token token) {
    for (;;) {
        Task task;

        {
            std::unique_lock<std::mutex> lock(state->queue_mutex);

            // Wait for work or stop signal
            state->condition.wait(lock, [&state, &token] {
                return state->stopping || !state->tasks.empty() || token.stop_requested();
            });

            // Exit once stopping and the queue is drained
            if (state->tasks.empty()) {
                if (state->stopping || token.stop_requested())
                    return;
                continue;
            }

            task = std::move(state->tasks.front());
            state->tasks.pop();
        }

        // Execute task outside of lock; tasks report their own errors through Result.
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Worker task threw: {}", e.what());
        } catch (...) {
            spdlog::error("Worker task threw a non-standard exception");
        }
    }
}

} // namespace mediafetch::downloader
