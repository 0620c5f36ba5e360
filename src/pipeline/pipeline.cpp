// pipeline/pipeline.cpp
#include "gantry/pipeline/pipeline.h"
#include "gantry/common/errors.h"
#include "gantry/common/logger.h"
#include "gantry/common/yaml_json.h"
#include "gantry/executor/job_runner.h"
#include "gantry/partition/timing_snapshot.h"
#include "gantry/report/run_trace.h"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace gantry {

namespace fs = std::filesystem;

namespace {

std::string utc_timestamp() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&t, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

nlohmann::json summarize(const ScheduleResult& schedule, const std::map<JobName, Report>& reports,
                         const RunTrace& trace, int exit_code) {
    nlohmann::json jobs = nlohmann::json::object();
    for (const auto& [name, outcome] : schedule.outcomes) {
        nlohmann::json entry = {
            {"status", to_string(outcome.status)},
            {"failure_class", to_string(outcome.failure_class)},
            {"message", outcome.message}
        };
        auto it = reports.find(name);
        if (it != reports.end()) {
            entry["tests"] = {
                {"passed", it->second.count(TestStatus::PASS)},
                {"failed", it->second.count(TestStatus::FAIL)},
                {"skipped", it->second.count(TestStatus::SKIP)}
            };
        }
        jobs[name] = std::move(entry);
    }
    return nlohmann::json{
        {"run_id", trace.run_id()},
        {"status", exit_code == 0 ? "succeeded" : "failed"},
        {"exit_code", exit_code},
        {"failure_class", to_string(schedule.worst)},
        {"start_order", schedule.start_order},
        {"jobs", jobs},
        {"trace", trace.to_json()["jobs"]}
    };
}

} // namespace

Pipeline::Pipeline(PipelineDefinition definition, RunConfig config)
    : definition_(std::move(definition)), config_(std::move(config)) {}

Pipeline Pipeline::from_file(const std::string& path,
                             const std::map<std::string, std::string>& overrides,
                             RunConfig config) {
    return Pipeline(PipelineParser::parse_file(path, overrides), std::move(config));
}

Pipeline Pipeline::from_yaml(const std::string& yaml,
                             const std::map<std::string, std::string>& overrides,
                             RunConfig config) {
    return Pipeline(PipelineParser::parse_string(yaml, overrides), std::move(config));
}

JobGraph Pipeline::plan(const RunOptions& options) const {
    return definition_.graph_for(options.workflow, options.jobs);
}

RunResult Pipeline::run(const RunOptions& options, const CancellationToken& token) const {
    JobGraph graph = plan(options);

    const fs::path output_dir(config_.output_dir);
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        throw SetupFailure("Cannot create output directory " + output_dir.string() + ": " + ec.message());
    }

    std::string order;
    for (const auto& name : graph.topological_order()) order += (order.empty() ? "" : " -> ") + name;
    GANTRY_LOG_INFO("Running " + std::to_string(graph.size()) + " jobs: " + order);

    RunTrace trace("run-" + utc_timestamp());
    JobRunner runner(config_, token, output_dir);
    std::mutex reports_mutex;
    RunResult result;

    TopoScheduler::Config scheduler_config;
    scheduler_config.concurrency = config_.concurrency;
    TopoScheduler scheduler(graph, token, scheduler_config, &trace);
    result.schedule = scheduler.execute([&](const Job& job) {
        Report report = runner.run(job);
        JobOutcome outcome = outcome_of(report);
        std::lock_guard<std::mutex> lock(reports_mutex);
        result.reports[job.name] = std::move(report);
        return outcome;
    });

    result.exit_code = result.schedule.exit_code();
    if (result.exit_code == 0 && !result.schedule.success()) {
        result.exit_code = exit_code_for(FailureClass::TEST);
    }

    result.summary = summarize(result.schedule, result.reports, trace, result.exit_code);
    fs::path summary_path = output_dir / "summary.json";
    std::ofstream summary(summary_path);
    summary << dump_json(result.summary) << "\n";
    if (!summary) {
        GANTRY_LOG_ERROR("Cannot write " + summary_path.string());
    }

    refresh_timings(result.reports);

    if (result.exit_code == 0) {
        GANTRY_LOG_INFO("Run succeeded");
    } else {
        GANTRY_LOG_ERROR("Run failed (" + to_string(result.schedule.worst) + "), exit code " +
                         std::to_string(result.exit_code));
    }
    return result;
}

void Pipeline::refresh_timings(const std::map<JobName, Report>& reports) const {
    // Shards are usually cut by package, so each suite also gets the sum of its tests
    std::vector<TimingRecord> observed;
    std::map<std::string, double> suite_totals;
    for (const auto& [name, report] : reports) {
        for (const auto& r : report.results) {
            if (r.status == TestStatus::SKIP) continue;
            observed.push_back(TimingRecord{r.id, r.duration_sec});
            if (!r.suite.empty()) suite_totals[r.suite] += r.duration_sec;
        }
    }
    for (const auto& [suite, total] : suite_totals) {
        observed.push_back(TimingRecord{suite, total});
    }
    if (observed.empty()) {
        return;
    }

    const fs::path target = fs::path(config_.output_dir) / "timings.json";
    const std::string source = config_.timings_path.empty() ? target.string() : config_.timings_path;
    try {
        TimingSnapshot previous = TimingSnapshot::load(source);
        previous.merged_with(observed, utc_timestamp()).save(target.string());
        GANTRY_LOG_INFO("Timing snapshot refreshed with " + std::to_string(observed.size()) + " durations");
    } catch (const std::exception& e) {
        // Timings only affect the next run's balance
        GANTRY_LOG_WARN("Cannot refresh timings: " + std::string(e.what()));
    }
}

} // namespace gantry
