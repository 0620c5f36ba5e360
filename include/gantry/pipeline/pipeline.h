// gantry/pipeline/pipeline.h
#ifndef GANTRY_PIPELINE_PIPELINE_H
#define GANTRY_PIPELINE_PIPELINE_H

#include "gantry/common/cancellation.h"
#include "gantry/common/run_config.h"
#include "gantry/pipeline/pipeline_parser.h"
#include "gantry/report/report.h"
#include "gantry/scheduler/topo_scheduler.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gantry {

struct RunOptions {
    std::optional<std::string> workflow;
    std::vector<JobName> jobs;           // empty: the whole workflow
};

struct RunResult {
    ScheduleResult schedule;
    std::map<JobName, Report> reports;   // jobs that were attempted
    nlohmann::json summary;
    int exit_code = 0;

    bool success() const { return exit_code == 0; }
};

// A parsed pipeline bound to its run configuration.
class Pipeline {
public:
    Pipeline(PipelineDefinition definition, RunConfig config);

    static Pipeline from_file(const std::string& path,
                              const std::map<std::string, std::string>& overrides,
                              RunConfig config);
    static Pipeline from_yaml(const std::string& yaml,
                              const std::map<std::string, std::string>& overrides,
                              RunConfig config);

    const PipelineDefinition& definition() const { return definition_; }
    const RunConfig& config() const { return config_; }

    // Selected jobs as a validated graph; throws ConfigError / CycleError
    JobGraph plan(const RunOptions& options) const;

    // Runs the selected jobs and writes every report, summary.json and the
    // refreshed timings.json under the output directory. Structural errors
    // are thrown before any job starts.
    RunResult run(const RunOptions& options, const CancellationToken& token) const;

private:
    void refresh_timings(const std::map<JobName, Report>& reports) const;

    PipelineDefinition definition_;
    RunConfig config_;
};

} // namespace gantry

#endif // GANTRY_PIPELINE_PIPELINE_H
