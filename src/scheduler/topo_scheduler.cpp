// scheduler/topo_scheduler.cpp
#include "gantry/scheduler/topo_scheduler.h"
#include "gantry/common/errors.h"
#include "gantry/common/logger.h"
#include <chrono>

namespace gantry {

namespace {

constexpr auto kCancelPollInterval = std::chrono::milliseconds(100);

} // namespace

bool ScheduleResult::success() const {
    for (const auto& [name, outcome] : outcomes) {
        if (outcome.status != JobStatus::SUCCEEDED) return false;
    }
    return true;
}

TopoScheduler::TopoScheduler(const JobGraph& graph, const CancellationToken& token, Config config, RunTrace* trace)
    : graph_(graph), token_(token), config_(config), trace_(trace) {
    if (config_.concurrency < 1) {
        throw ConfigError("Concurrency must be >= 1, got " + std::to_string(config_.concurrency));
    }
}

ScheduleResult TopoScheduler::execute(const JobRunnerFn& run_job) {
    ScheduleResult result;
    WorkerPool pool(config_.concurrency);
    if (!pool.start()) {
        throw SetupFailure("Cannot start worker pool");
    }

    std::unique_lock<std::mutex> lock(mutex_);
    in_degree_.clear();
    state_.clear();
    ready_queue_.clear();
    held_locks_.clear();
    completed_.clear();
    running_ = 0;

    for (const auto& job : graph_.jobs()) {
        in_degree_[job.name] = static_cast<int>(job.dependencies.size());
        state_[job.name] = JobOutcome{};
        if (job.dependencies.empty()) {
            ready_queue_.push_back(job.name);
        }
    }

    while (true) {
        for (const auto& [name, outcome] : completed_) {
            complete_locked(name, outcome);
        }
        completed_.clear();

        if (token_.is_cancelled()) {
            cancel_pending_locked();
        }
        dispatch_ready_locked(run_job, pool, result);

        if (running_ == 0) {
            break;
        }
        changed_.wait_for(lock, kCancelPollInterval);
    }
    lock.unlock();
    pool.stop();

    for (const auto& job : graph_.jobs()) {
        JobOutcome outcome = state_[job.name];
        if (outcome.status == JobStatus::PENDING) {
            // Unreachable for a valid graph unless cancelled mid-dispatch
            outcome.status = JobStatus::CANCELLED;
            outcome.failure_class = FailureClass::CANCELLED;
            outcome.message = "never started";
        }
        if (outcome.status != JobStatus::BLOCKED) {
            result.worst = worst_of(result.worst, outcome.failure_class);
        }
        result.outcomes[job.name] = outcome;
    }
    return result;
}

bool TopoScheduler::locks_free_locked(const Job& job) const {
    for (const auto& name : job.locks) {
        if (held_locks_.count(name) > 0) return false;
    }
    return true;
}

void TopoScheduler::dispatch_ready_locked(const JobRunnerFn& run_job, WorkerPool& pool, ScheduleResult& result) {
    for (auto it = ready_queue_.begin(); it != ready_queue_.end() && running_ < config_.concurrency;) {
        const Job& job = graph_.job(*it);
        if (!locks_free_locked(job)) {
            ++it;   // a later ready job may still fit
            continue;
        }
        for (const auto& name : job.locks) held_locks_.insert(name);
        state_[job.name].status = JobStatus::RUNNING;
        ++running_;
        result.start_order.push_back(job.name);
        it = ready_queue_.erase(it);

        GANTRY_LOG_DEBUG("Dispatching job " + job.name);
        if (trace_ != nullptr) trace_->on_job_start(job.name);

        const Job* job_ptr = &job;
        bool submitted = pool.submit([this, job_ptr, &run_job] {
            JobOutcome outcome;
            try {
                outcome = run_job(*job_ptr);
            } catch (const PipelineError& e) {
                outcome = JobOutcome{JobStatus::FAILED, e.failure_class(), e.what()};
            } catch (const std::exception& e) {
                outcome = JobOutcome{JobStatus::FAILED, FailureClass::SETUP, e.what()};
            }
            if (trace_ != nullptr) {
                trace_->on_job_end(job_ptr->name, outcome.status, outcome.failure_class, outcome.message);
            }
            {
                std::lock_guard<std::mutex> guard(mutex_);
                completed_.emplace_back(job_ptr->name, std::move(outcome));
            }
            changed_.notify_one();
        });
        if (!submitted) {
            throw SetupFailure("Worker pool rejected job " + job.name);
        }
    }
}

void TopoScheduler::complete_locked(const JobName& name, const JobOutcome& outcome) {
    --running_;
    for (const auto& lock_name : graph_.job(name).locks) held_locks_.erase(lock_name);
    state_[name] = outcome;

    if (outcome.status == JobStatus::SUCCEEDED) {
        for (const auto& succ : graph_.dependents(name)) {
            if (--in_degree_[succ] == 0 && state_[succ].status == JobStatus::PENDING) {
                ready_queue_.push_back(succ);
            }
        }
        return;
    }
    GANTRY_LOG_WARN("Job " + name + " " + to_string(outcome.status) +
                    (outcome.message.empty() ? "" : ": " + outcome.message));
    if (!token_.is_cancelled()) {
        block_dependents_locked(name);
    }
}

void TopoScheduler::block_dependents_locked(const JobName& failed) {
    std::vector<JobName> stack(graph_.dependents(failed).begin(), graph_.dependents(failed).end());
    while (!stack.empty()) {
        JobName current = stack.back();
        stack.pop_back();
        JobOutcome& state = state_[current];
        if (state.status != JobStatus::PENDING) continue;
        state.status = JobStatus::BLOCKED;
        state.message = "blocked by " + failed;
        GANTRY_LOG_INFO("Job " + current + " blocked by " + failed);
        if (trace_ != nullptr) trace_->on_job_skipped(current, JobStatus::BLOCKED, state.message);
        for (const auto& succ : graph_.dependents(current)) stack.push_back(succ);
    }
}

void TopoScheduler::cancel_pending_locked() {
    for (const auto& job : graph_.jobs()) {
        JobOutcome& state = state_[job.name];
        if (state.status != JobStatus::PENDING) continue;
        state.status = JobStatus::CANCELLED;
        state.failure_class = FailureClass::CANCELLED;
        state.message = "cancelled before start";
        if (trace_ != nullptr) trace_->on_job_skipped(job.name, JobStatus::CANCELLED, state.message);
    }
    ready_queue_.clear();
}

} // namespace gantry
