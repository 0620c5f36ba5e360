// gantry/report/report.h
#ifndef GANTRY_REPORT_REPORT_H
#define GANTRY_REPORT_REPORT_H

#include "gantry/common/types.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace gantry {

struct TestResult {
    TestId id;            // "<suite>.<name>" once the suite is known
    std::string suite;    // package or suite name, may be empty
    TestStatus status = TestStatus::PASS;
    double duration_sec = 0.0;
    std::string output;   // lines captured between the test's start and its result
};

struct StepOutcome {
    std::string name;
    StepKind kind = StepKind::BUILD;
    std::string status;          // "succeeded", "failed", "skipped", "cancelled", "timed_out"
    std::optional<int> exit_code;
    double duration_sec = 0.0;
    std::string message;
};

// Per-job record of test outcomes plus the job's own status.
//
// `passed()` reflects the test results alone (failed iff some result failed);
// the job's status is kept separately so a cleanly generated report can never
// turn a failed execution into a success.
struct Report {
    JobName job;
    std::vector<TestResult> results;
    std::vector<std::string> diagnostics;   // unparseable output, warnings
    std::vector<StepOutcome> steps;
    JobStatus job_status = JobStatus::PENDING;
    FailureClass failure_class = FailureClass::NONE;
    std::string message;
    std::optional<nlohmann::json> determinism_diff;

    bool passed() const;
    size_t count(TestStatus status) const;
    const TestResult* find(const TestId& id) const;
    double total_duration() const;

    nlohmann::json to_json() const;
    std::string to_junit_xml() const;

    void write_json(const std::string& path) const;
    void write_junit(const std::string& path) const;
};

std::string escape_xml(const std::string& s);

} // namespace gantry

#endif // GANTRY_REPORT_REPORT_H
