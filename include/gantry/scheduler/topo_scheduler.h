// gantry/scheduler/topo_scheduler.h
#ifndef GANTRY_SCHEDULER_TOPO_SCHEDULER_H
#define GANTRY_SCHEDULER_TOPO_SCHEDULER_H

#include "gantry/common/cancellation.h"
#include "gantry/report/run_trace.h"
#include "gantry/scheduler/job_graph.h"
#include "gantry/scheduler/worker_pool.h"
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <unordered_map>
#include <vector>

namespace gantry {

using JobRunnerFn = std::function<JobOutcome(const Job&)>;

struct ScheduleResult {
    std::map<JobName, JobOutcome> outcomes;
    std::vector<JobName> start_order;
    FailureClass worst = FailureClass::NONE;

    bool success() const;
    int exit_code() const { return exit_code_for(worst); }
};

// Runs a JobGraph with in-degree counters and a ready queue. Up to
// `concurrency` jobs run at once on a worker pool; jobs naming the same lock
// never overlap. A failed job blocks its transitive dependents while
// independent branches continue.
class TopoScheduler {
public:
    struct Config {
        int concurrency;
        Config() : concurrency(4) {}
    };

    TopoScheduler(const JobGraph& graph, const CancellationToken& token,
                  Config config = {}, RunTrace* trace = nullptr);

    // Blocks until every job has an outcome
    ScheduleResult execute(const JobRunnerFn& run_job);

private:
    void dispatch_ready_locked(const JobRunnerFn& run_job, WorkerPool& pool, ScheduleResult& result);
    bool locks_free_locked(const Job& job) const;
    void complete_locked(const JobName& name, const JobOutcome& outcome);
    void block_dependents_locked(const JobName& failed);
    void cancel_pending_locked();

    const JobGraph& graph_;
    const CancellationToken& token_;
    Config config_;
    RunTrace* trace_;

    std::mutex mutex_;
    std::condition_variable changed_;
    std::unordered_map<JobName, int> in_degree_;
    std::unordered_map<JobName, JobOutcome> state_;
    std::deque<JobName> ready_queue_;
    std::set<std::string> held_locks_;
    std::vector<std::pair<JobName, JobOutcome>> completed_;
    int running_ = 0;
};

} // namespace gantry

#endif // GANTRY_SCHEDULER_TOPO_SCHEDULER_H
