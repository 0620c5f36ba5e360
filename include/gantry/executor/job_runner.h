// gantry/executor/job_runner.h
#ifndef GANTRY_EXECUTOR_JOB_RUNNER_H
#define GANTRY_EXECUTOR_JOB_RUNNER_H

#include "gantry/common/cancellation.h"
#include "gantry/common/run_config.h"
#include "gantry/report/report.h"
#include "gantry/scheduler/job.h"
#include <filesystem>

namespace gantry {

// Runs the steps of one job in order and always produces its Report.
//
//   setup failure          abort; no further steps, `always` ones included
//   build/test/determinism remaining `on_success` steps skipped, `always` steps run
//   cancellation           remaining steps skipped, job marked Cancelled
//
// Job-scoped resources are released before run() returns.
class JobRunner {
public:
    JobRunner(const RunConfig& config, const CancellationToken& token, std::filesystem::path output_dir);

    // Writes <output>/<job>/report.json and junit.xml as a side effect
    Report run(const Job& job) const;

private:
    const RunConfig& config_;
    const CancellationToken& token_;
    std::filesystem::path output_dir_;
};

JobOutcome outcome_of(const Report& report);

} // namespace gantry

#endif // GANTRY_EXECUTOR_JOB_RUNNER_H
