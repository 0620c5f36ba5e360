// report/run_trace.cpp
#include "gantry/report/run_trace.h"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace gantry {

namespace {

std::string format_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace

RunTrace::RunTrace(std::string run_id) : run_id_(std::move(run_id)) {}

void RunTrace::on_job_start(const JobName& job) {
    JobTraceRecord record;
    record.run_id = run_id_;
    record.job = job;
    record.start_time = std::chrono::system_clock::now();
    record.status = JobStatus::RUNNING;

    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(std::move(record));
}

void RunTrace::on_job_end(const JobName& job, JobStatus status, FailureClass failure_class,
                          const std::optional<std::string>& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(records_.rbegin(), records_.rend(), [&job](const JobTraceRecord& r) {
        return r.job == job && r.status == JobStatus::RUNNING;
    });
    if (it == records_.rend()) {
        return;
    }
    it->end_time = std::chrono::system_clock::now();
    it->status = status;
    it->failure_class = failure_class;
    it->message = message;
}

void RunTrace::on_job_skipped(const JobName& job, JobStatus status, const std::string& message) {
    JobTraceRecord record;
    record.run_id = run_id_;
    record.job = job;
    record.start_time = std::chrono::system_clock::now();
    record.end_time = record.start_time;
    record.status = status;
    record.failure_class = status == JobStatus::CANCELLED ? FailureClass::CANCELLED : FailureClass::NONE;
    record.message = message;

    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(std::move(record));
}

std::vector<JobTraceRecord> RunTrace::get_records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

nlohmann::json RunTrace::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json jobs = nlohmann::json::array();
    for (const auto& r : records_) {
        nlohmann::json entry;
        entry["job"] = r.job;
        entry["status"] = to_string(r.status);
        entry["failure_class"] = to_string(r.failure_class);
        entry["start_time"] = format_time(r.start_time);
        entry["end_time"] = format_time(r.end_time);
        entry["duration_sec"] = std::chrono::duration<double>(r.end_time - r.start_time).count();
        if (r.message.has_value()) entry["message"] = *r.message;
        jobs.push_back(std::move(entry));
    }
    return nlohmann::json{{"run_id", run_id_}, {"jobs", jobs}};
}

} // namespace gantry
