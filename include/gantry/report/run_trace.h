// gantry/report/run_trace.h
#ifndef GANTRY_REPORT_RUN_TRACE_H
#define GANTRY_REPORT_RUN_TRACE_H

#include "gantry/common/types.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gantry {

struct JobTraceRecord {
    std::string run_id;
    JobName job;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    JobStatus status = JobStatus::PENDING;
    FailureClass failure_class = FailureClass::NONE;
    std::optional<std::string> message;
};

// Collects job start/end events for the run summary. Called from worker
// threads, so every method locks.
class RunTrace {
public:
    explicit RunTrace(std::string run_id = "run-default");

    void on_job_start(const JobName& job);
    void on_job_end(const JobName& job, JobStatus status, FailureClass failure_class,
                    const std::optional<std::string>& message);
    // Records jobs that never started (blocked or cancelled before dispatch)
    void on_job_skipped(const JobName& job, JobStatus status, const std::string& message);

    std::vector<JobTraceRecord> get_records() const;
    nlohmann::json to_json() const;

    const std::string& run_id() const { return run_id_; }

private:
    mutable std::mutex mutex_;
    std::string run_id_;
    std::vector<JobTraceRecord> records_;
};

} // namespace gantry

#endif // GANTRY_REPORT_RUN_TRACE_H
