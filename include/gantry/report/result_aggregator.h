// gantry/report/result_aggregator.h
#ifndef GANTRY_REPORT_RESULT_AGGREGATOR_H
#define GANTRY_REPORT_RESULT_AGGREGATOR_H

#include "gantry/report/report.h"
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gantry {

// Results parsed from one stream of raw output (one shard or one step)
struct ParsedOutput {
    std::vector<TestResult> results;
    std::vector<std::string> diagnostics;
};

// Incremental parser for `go test -v` text.
//
//   === RUN   TestFoo
//       foo_test.go:12: boom
//   --- FAIL: TestFoo (0.01s)
//   FAIL
//   FAIL    example.com/foo 0.012s
//
// Results become "<package>.<test>" once the package line is seen. Tests that
// start but never report a result are classified as failed.
class GoTestOutputParser {
public:
    // `default_suite` names results whose package line never arrives
    explicit GoTestOutputParser(std::string default_suite = "");

    // Accepts arbitrary chunks; lines are split on '\n'
    void feed(std::string_view chunk);
    void feed_line(const std::string& line);

    // Flushes the trailing partial line and any open tests
    ParsedOutput finish();

    static ParsedOutput parse(const std::string& raw, const std::string& default_suite = "");

private:
    struct PendingTest {
        std::string name;
        std::optional<TestStatus> status;
        double duration_sec = 0.0;
        std::string output;
    };

    void record_result(const std::string& name, TestStatus status, double duration_sec);
    void close_package(const std::string& package, std::optional<TestStatus> package_status,
                       double duration_sec, const std::string& detail);
    void append_output(PendingTest& test, const std::string& line);
    // Moves open tests into the output under `suite`; true if any failed
    bool flush_pending(const std::string& suite);
    PendingTest& pending_for(const std::string& name);

    std::string default_suite_;
    std::string partial_line_;
    std::vector<PendingTest> pending_;
    std::unordered_map<std::string, size_t> pending_index_;
    std::optional<size_t> last_touched_;
    ParsedOutput out_;
};

// Merges partial reports from shards or sequential steps into one per-job
// Report. append() may be called concurrently from shard workers; every
// identifier appears once in the merged report and a failure is never
// replaced by a later pass or skip.
class ResultAggregator {
public:
    explicit ResultAggregator(JobName job);

    void append(ParsedOutput partial);
    void add_diagnostic(const std::string& line);

    size_t size() const;
    bool has_failures() const;

    // Copy of the merged state; safe while other threads append
    Report snapshot() const;

private:
    void merge_result_locked(TestResult result);

    mutable std::mutex mutex_;
    JobName job_;
    std::vector<TestResult> results_;
    std::unordered_map<TestId, size_t> index_;
    std::vector<std::string> diagnostics_;
};

// Final status of a test execution. A known nonzero exit code is
// authoritative; parsed failures can only turn a zero exit into a failure,
// never the other way round.
bool test_execution_failed(std::optional<int> exit_code, const ParsedOutput& parsed);

} // namespace gantry

#endif // GANTRY_REPORT_RESULT_AGGREGATOR_H
