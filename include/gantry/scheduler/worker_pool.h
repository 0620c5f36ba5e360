// gantry/scheduler/worker_pool.h
#ifndef GANTRY_SCHEDULER_WORKER_POOL_H
#define GANTRY_SCHEDULER_WORKER_POOL_H

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace gantry {

using Task = std::function<void()>;

// Fixed set of threads draining a FIFO task queue
class WorkerPool {
public:
    explicit WorkerPool(int workers) noexcept;
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    [[nodiscard]] bool start();
    // Runs every queued task, then joins the workers
    void stop() noexcept;
    [[nodiscard]] bool submit(Task task);

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

private:
    void worker_loop(int worker_id);

    int workers_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex queue_mutex_;
    std::condition_variable task_available_;
    std::queue<Task> tasks_;

    std::vector<std::thread> threads_;
};

} // namespace gantry

#endif // GANTRY_SCHEDULER_WORKER_POOL_H
