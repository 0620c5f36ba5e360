// report/result_aggregator.cpp
#include "gantry/report/result_aggregator.h"
#include "gantry/common/logger.h"
#include <algorithm>
#include <regex>

namespace gantry {

namespace {

const std::regex& run_pattern() {
    static const std::regex re(R"(^=== (RUN|PAUSE|CONT|NAME)\s+(\S+)\s*$)");
    return re;
}

const std::regex& result_pattern() {
    static const std::regex re(R"(^\s*--- (PASS|FAIL|SKIP): (\S+)(?: \(([0-9.]+)s\))?\s*$)");
    return re;
}

const std::regex& ok_pattern() {
    static const std::regex re(R"(^ok\s+(\S+)(?:\s+([0-9.]+)s)?.*$)");
    return re;
}

const std::regex& fail_package_pattern() {
    static const std::regex re(R"(^FAIL\s+(\S+)(?:\s+([0-9.]+)s)?(.*)$)");
    return re;
}

const std::regex& no_test_files_pattern() {
    static const std::regex re(R"(^\?\s+(\S+)\s+\[no test files\].*$)");
    return re;
}

TestStatus status_from(const std::string& word) {
    if (word == "PASS") return TestStatus::PASS;
    if (word == "SKIP") return TestStatus::SKIP;
    return TestStatus::FAIL;
}

double parse_seconds(const std::ssub_match& m) {
    if (!m.matched) return 0.0;
    try {
        return std::stod(m.str());
    } catch (const std::exception&) {
        return 0.0;
    }
}

std::string qualify(const std::string& suite, const std::string& name) {
    return suite.empty() ? name : suite + "." + name;
}

} // namespace

// --- GoTestOutputParser ---

GoTestOutputParser::GoTestOutputParser(std::string default_suite)
    : default_suite_(std::move(default_suite)) {}

void GoTestOutputParser::feed(std::string_view chunk) {
    partial_line_.append(chunk.data(), chunk.size());
    size_t start = 0;
    size_t newline;
    while ((newline = partial_line_.find('\n', start)) != std::string::npos) {
        feed_line(partial_line_.substr(start, newline - start));
        start = newline + 1;
    }
    partial_line_.erase(0, start);
}

void GoTestOutputParser::feed_line(const std::string& raw_line) {
    std::string line = raw_line;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    std::smatch m;
    if (std::regex_match(line, m, run_pattern())) {
        // Output after CONT/NAME belongs to the resumed test; PAUSE changes nothing
        if (m[1] != "PAUSE") {
            auto& test = pending_for(m[2].str());
            last_touched_ = pending_index_.at(test.name);
        }
        return;
    }
    if (std::regex_match(line, m, result_pattern())) {
        record_result(m[2].str(), status_from(m[1].str()), parse_seconds(m[3]));
        return;
    }
    if (line == "PASS" || line == "FAIL") {
        return; // per-package summary, the package line carries the verdict
    }
    if (std::regex_match(line, m, ok_pattern())) {
        close_package(m[1].str(), TestStatus::PASS, parse_seconds(m[2]), "");
        return;
    }
    if (std::regex_match(line, m, no_test_files_pattern())) {
        close_package(m[1].str(), TestStatus::SKIP, 0.0, "[no test files]");
        return;
    }
    if (std::regex_match(line, m, fail_package_pattern())) {
        std::string detail = m[3].str();
        detail.erase(0, detail.find_first_not_of(" \t"));
        close_package(m[1].str(), TestStatus::FAIL, parse_seconds(m[2]), detail);
        return;
    }

    if (last_touched_.has_value()) {
        PendingTest& test = pending_[*last_touched_];
        bool indented = !line.empty() && (line[0] == ' ' || line[0] == '\t');
        if (!test.status.has_value() || indented) {
            append_output(test, line);
            return;
        }
    }
    if (!line.empty()) {
        out_.diagnostics.push_back(line);
    }
}

GoTestOutputParser::PendingTest& GoTestOutputParser::pending_for(const std::string& name) {
    auto it = pending_index_.find(name);
    if (it != pending_index_.end()) {
        return pending_[it->second];
    }
    pending_index_[name] = pending_.size();
    pending_.push_back(PendingTest{name, std::nullopt, 0.0, ""});
    return pending_.back();
}

void GoTestOutputParser::record_result(const std::string& name, TestStatus status, double duration_sec) {
    PendingTest& test = pending_for(name);
    // Repeated runs (-count=N) collapse into one entry; a failure sticks
    if (!(test.status.has_value() && *test.status == TestStatus::FAIL)) {
        test.status = status;
    }
    test.duration_sec = duration_sec;
    last_touched_ = pending_index_.at(name);
}

void GoTestOutputParser::append_output(PendingTest& test, const std::string& line) {
    test.output += line;
    test.output += '\n';
}

bool GoTestOutputParser::flush_pending(const std::string& suite) {
    bool any_failed = false;
    for (auto& test : pending_) {
        TestResult result;
        result.suite = suite;
        result.id = qualify(suite, test.name);
        result.duration_sec = test.duration_sec;
        result.output = std::move(test.output);
        if (test.status.has_value()) {
            result.status = *test.status;
        } else {
            result.status = TestStatus::FAIL;
            result.output += "test started but reported no result\n";
        }
        any_failed = any_failed || result.status == TestStatus::FAIL;
        out_.results.push_back(std::move(result));
    }
    pending_.clear();
    pending_index_.clear();
    last_touched_.reset();
    return any_failed;
}

void GoTestOutputParser::close_package(const std::string& package, std::optional<TestStatus> package_status,
                                       double duration_sec, const std::string& detail) {
    bool had_tests = !pending_.empty();
    bool any_failed = flush_pending(package);

    // Package verdicts without a matching test verdict (build failures,
    // TestMain exits, packages run without -v) get an entry of their own.
    bool needs_package_entry = !had_tests || (package_status == TestStatus::FAIL && !any_failed);
    if (package_status.has_value() && needs_package_entry) {
        TestResult result;
        result.id = package;
        result.status = *package_status;
        result.duration_sec = duration_sec;
        if (!detail.empty()) result.output = detail + "\n";
        out_.results.push_back(std::move(result));
    }
}

ParsedOutput GoTestOutputParser::finish() {
    if (!partial_line_.empty()) {
        std::string last = std::move(partial_line_);
        partial_line_.clear();
        feed_line(last);
    }
    // Stream ended before a package line, e.g. a killed process
    flush_pending(default_suite_);
    ParsedOutput result = std::move(out_);
    out_ = ParsedOutput{};
    return result;
}

ParsedOutput GoTestOutputParser::parse(const std::string& raw, const std::string& default_suite) {
    GoTestOutputParser parser(default_suite);
    parser.feed(raw);
    return parser.finish();
}

// --- ResultAggregator ---

ResultAggregator::ResultAggregator(JobName job) : job_(std::move(job)) {}

void ResultAggregator::append(ParsedOutput partial) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& result : partial.results) {
        merge_result_locked(std::move(result));
    }
    for (auto& line : partial.diagnostics) {
        diagnostics_.push_back(std::move(line));
    }
}

void ResultAggregator::merge_result_locked(TestResult result) {
    auto it = index_.find(result.id);
    if (it == index_.end()) {
        index_[result.id] = results_.size();
        results_.push_back(std::move(result));
        return;
    }
    // Shards partition the identifier space, so this only happens when one
    // stream reports the same test twice.
    TestResult& existing = results_[it->second];
    GANTRY_LOG_DEBUG("Duplicate result for " + result.id + " in job " + job_);
    if (existing.status != TestStatus::FAIL) {
        existing.status = result.status;
        existing.duration_sec = result.duration_sec;
    }
    if (!result.output.empty()) {
        existing.output += result.output;
    }
}

void ResultAggregator::add_diagnostic(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    diagnostics_.push_back(line);
}

size_t ResultAggregator::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.size();
}

bool ResultAggregator::has_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(results_.begin(), results_.end(),
                       [](const TestResult& r) { return r.status == TestStatus::FAIL; });
}

Report ResultAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Report report;
    report.job = job_;
    report.results = results_;
    report.diagnostics = diagnostics_;
    return report;
}

bool test_execution_failed(std::optional<int> exit_code, const ParsedOutput& parsed) {
    if (exit_code.has_value() && *exit_code != 0) {
        return true;
    }
    return std::any_of(parsed.results.begin(), parsed.results.end(),
                       [](const TestResult& r) { return r.status == TestStatus::FAIL; });
}

} // namespace gantry
