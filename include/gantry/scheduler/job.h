// gantry/scheduler/job.h
#ifndef GANTRY_SCHEDULER_JOB_H
#define GANTRY_SCHEDULER_JOB_H

#include "gantry/common/types.h"
#include "gantry/executor/action.h"
#include <string>
#include <vector>

namespace gantry {

struct Job {
    JobName name;
    std::vector<Step> steps;
    std::vector<JobName> dependencies;   // `requires:` in the pipeline file
    std::vector<std::string> locks;      // jobs sharing a lock never overlap
    int parallelism = 1;
    std::string working_directory;
    EnvMap environment;
};

struct JobOutcome {
    JobStatus status = JobStatus::PENDING;
    FailureClass failure_class = FailureClass::NONE;
    std::string message;
};

} // namespace gantry

#endif // GANTRY_SCHEDULER_JOB_H
