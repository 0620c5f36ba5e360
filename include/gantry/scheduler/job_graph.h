// gantry/scheduler/job_graph.h
#ifndef GANTRY_SCHEDULER_JOB_GRAPH_H
#define GANTRY_SCHEDULER_JOB_GRAPH_H

#include "gantry/scheduler/job.h"
#include <unordered_map>
#include <vector>

namespace gantry {

// Validated dependency DAG over a set of jobs. Construction fails with
// ConfigError for duplicate names or unknown `requires`, and with CycleError
// when the relation is not acyclic, so a JobGraph that exists can be run.
class JobGraph {
public:
    explicit JobGraph(std::vector<Job> jobs);

    bool contains(const JobName& name) const { return index_.count(name) > 0; }
    const Job& job(const JobName& name) const;
    const std::vector<Job>& jobs() const { return jobs_; }
    size_t size() const { return jobs_.size(); }

    // Jobs that list `name` in their requires, in definition order
    const std::vector<JobName>& dependents(const JobName& name) const;

    // Kahn order; among ready jobs the one defined first comes first
    const std::vector<JobName>& topological_order() const { return order_; }

    // `roots` plus everything they transitively require. Unknown roots are a ConfigError.
    JobGraph closure(const std::vector<JobName>& roots) const;

private:
    std::vector<Job> jobs_;
    std::unordered_map<JobName, size_t> index_;
    std::unordered_map<JobName, std::vector<JobName>> dependents_;
    std::vector<JobName> order_;
};

} // namespace gantry

#endif // GANTRY_SCHEDULER_JOB_GRAPH_H
