// scheduler/worker_pool.cpp
#include "gantry/scheduler/worker_pool.h"
#include "gantry/common/logger.h"
#include <string>

namespace gantry {

WorkerPool::WorkerPool(int workers) noexcept : workers_(workers < 1 ? 1 : workers) {}

WorkerPool::~WorkerPool() {
    stop();
}

bool WorkerPool::start() {
    if (running_.load()) {
        GANTRY_LOG_WARN("Worker pool already running");
        return false;
    }
    running_.store(true);
    shutdown_.store(false);

    try {
        threads_.reserve(static_cast<size_t>(workers_));
        for (int i = 0; i < workers_; ++i) {
            threads_.emplace_back(&WorkerPool::worker_loop, this, i);
        }
    } catch (const std::exception& e) {
        GANTRY_LOG_ERROR("Failed to start worker pool: " + std::string(e.what()));
        stop();
        return false;
    }
    GANTRY_LOG_DEBUG("Worker pool started with " + std::to_string(workers_) + " threads");
    return true;
}

void WorkerPool::stop() noexcept {
    if (!running_.load()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_.store(true);
    }
    task_available_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    running_.store(false);
    GANTRY_LOG_DEBUG("Worker pool stopped");
}

bool WorkerPool::submit(Task task) {
    if (!running_.load() || shutdown_.load()) {
        GANTRY_LOG_WARN("Cannot submit task to a stopped worker pool");
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        tasks_.push(std::move(task));
    }
    task_available_.notify_one();
    return true;
}

void WorkerPool::worker_loop(int worker_id) {
    set_thread_label("worker-" + std::to_string(worker_id));

    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            task_available_.wait(lock, [this] { return !tasks_.empty() || shutdown_.load(); });
            if (tasks_.empty()) {
                break;   // shutdown with nothing left to run
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            GANTRY_LOG_ERROR("Worker " + std::to_string(worker_id) + " task error: " + e.what());
        }
        set_thread_label("worker-" + std::to_string(worker_id));
    }
}

} // namespace gantry
