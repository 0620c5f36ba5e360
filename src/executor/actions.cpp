// executor/actions.cpp
#include "gantry/executor/actions.h"
#include "gantry/common/errors.h"
#include "gantry/common/logger.h"
#include "gantry/common/yaml_json.h"
#include "gantry/filter/exclusion_filter.h"
#include "gantry/partition/partitioner.h"
#include "gantry/partition/timing_snapshot.h"
#include <csignal>
#include <exception>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace gantry {

namespace fs = std::filesystem;

namespace {

fs::path resolve_in(const JobContext& context, const std::string& path) {
    fs::path p(path);
    if (p.is_absolute() || context.working_directory().empty()) return p;
    return fs::path(context.working_directory()) / p;
}

std::string tail_lines(const std::string& text, size_t count) {
    size_t pos = text.size();
    if (pos > 0 && text[pos - 1] == '\n') --pos;
    size_t seen = 0;
    while (pos > 0) {
        size_t nl = text.rfind('\n', pos - 1);
        ++seen;
        if (nl == std::string::npos) return text;
        if (seen == count) return text.substr(nl + 1);
        pos = nl;
    }
    return text;
}

void add_stderr_diagnostics(ParsedOutput& parsed, const std::string& stderr_text, const std::string& prefix) {
    std::istringstream in(stderr_text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) parsed.diagnostics.push_back(prefix + line);
    }
}

ActionResult result_from(const ProcessResult& process, bool tests_failed) {
    ActionResult result;
    result.exit_code = process.exit_code;
    result.cancelled = process.cancelled;
    result.timed_out = process.timed_out;
    result.success = process.success() && !tests_failed;
    if (!result.success) {
        result.message = (process.success() && tests_failed) ? "test failures reported" : process.describe();
    }
    return result;
}

// Output of a process killed after the cancellation grace period is dropped
bool keeps_partial_output(const ProcessResult& process) {
    return !(process.cancelled && process.term_signal == SIGKILL);
}

struct ShardRun {
    ParsedOutput parsed;
    ProcessResult process;
    bool ran = false;
    bool failed = false;
    std::exception_ptr error;
    FailureClass error_class = FailureClass::NONE;
    std::string error_message;
};

} // namespace

ReportFormat parse_report_format(const std::string& name) {
    if (name.empty() || name == "none") return ReportFormat::NONE;
    if (name == "go-test" || name == "go_test") return ReportFormat::GO_TEST;
    throw ConfigError("Unknown report format: " + name);
}

std::string to_string(ReportFormat format) {
    return format == ReportFormat::GO_TEST ? "go-test" : "none";
}

// --- ShellAction ---

ShellAction::ShellAction(std::string command, EnvMap environment,
                         std::optional<std::chrono::milliseconds> no_output_timeout, ReportFormat report)
    : command(std::move(command)),
      environment(std::move(environment)),
      no_output_timeout(no_output_timeout),
      report(report) {}

ActionResult ShellAction::execute(JobContext& context) {
    if (report == ReportFormat::NONE) {
        ProcessResult process = context.run_shell(command, environment, no_output_timeout);
        if (!process.success() && !process.stderr_text.empty()) {
            GANTRY_LOG_WARN("stderr of failed command:\n" + tail_lines(process.stderr_text, 20));
        }
        return result_from(process, false);
    }

    GoTestOutputParser parser;
    ProcessResult process = context.run_shell(command, environment, no_output_timeout,
        [&parser](OutputStream stream, std::string_view chunk) {
            if (stream == OutputStream::STDOUT) parser.feed(chunk);
        });
    ParsedOutput parsed = parser.finish();
    add_stderr_diagnostics(parsed, process.stderr_text, "stderr: ");
    bool failed = test_execution_failed(process.exit_code, parsed);
    if (keeps_partial_output(process)) {
        context.aggregator().append(std::move(parsed));
    }
    return result_from(process, failed);
}

std::unique_ptr<Action> ShellAction::clone() const {
    return std::make_unique<ShellAction>(*this);
}

// --- CheckoutAction ---

ActionResult CheckoutAction::execute(JobContext& context) {
    if (context.working_directory().empty()) {
        return ActionResult{};
    }
    std::error_code ec;
    fs::create_directories(context.working_directory(), ec);
    if (ec) {
        throw SetupFailure("Cannot prepare working directory " + context.working_directory() + ": " + ec.message());
    }
    GANTRY_LOG_DEBUG("Working directory ready: " + context.working_directory());
    return ActionResult{};
}

std::unique_ptr<Action> CheckoutAction::clone() const {
    return std::make_unique<CheckoutAction>(*this);
}

// --- StoreTestResultsAction ---

StoreTestResultsAction::StoreTestResultsAction(std::string path) : path(std::move(path)) {}

ActionResult StoreTestResultsAction::execute(JobContext& context) {
    fs::path source = resolve_in(context, path);
    std::error_code ec;
    if (!fs::exists(source, ec)) {
        GANTRY_LOG_WARN("No test results found at " + source.string());
        return ActionResult{};
    }
    fs::path dest = context.report_dir() / "stored" / source.filename();
    fs::create_directories(dest.parent_path(), ec);
    if (!ec) {
        fs::copy(source, dest, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
    }
    if (ec) {
        ActionResult result;
        result.success = false;
        result.message = "Cannot store " + source.string() + ": " + ec.message();
        return result;
    }
    GANTRY_LOG_INFO("Stored test results from " + source.string());
    return ActionResult{};
}

std::unique_ptr<Action> StoreTestResultsAction::clone() const {
    return std::make_unique<StoreTestResultsAction>(*this);
}

// --- ShardedTestAction ---

std::vector<TestId> ShardedTestAction::resolve_tests(JobContext& context) const {
    if (list_command.empty()) {
        return tests;
    }
    ProcessResult listing = context.run_shell(list_command, {}, no_output_timeout);
    if (listing.cancelled) {
        throw PipelineError(FailureClass::CANCELLED, "Cancelled while listing tests");
    }
    if (!listing.success()) {
        throw SetupFailure("Test listing command failed (" + listing.describe() + "): " +
                           tail_lines(listing.stderr_text, 5));
    }
    std::vector<TestId> ids;
    std::istringstream in(listing.stdout_text);
    std::string line;
    while (std::getline(in, line)) {
        size_t start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos) continue;
        size_t end = line.find_last_not_of(" \t\r");
        ids.push_back(line.substr(start, end - start + 1));
    }
    return ids;
}

ActionResult ShardedTestAction::execute(JobContext& context) {
    std::vector<TestId> candidates = resolve_tests(context);

    ExclusionFilter filter;
    if (!exclusions_path.empty()) {
        filter = ExclusionFilter::from_file(resolve_in(context, exclusions_path).string());
    }
    FilterResult filtered = filter.apply(candidates);
    GANTRY_LOG_INFO(std::to_string(candidates.size()) + " tests listed, " + std::to_string(filtered.removed) +
                    " excluded, " + std::to_string(filtered.kept.size()) + " to run");

    TimingSnapshot timings;
    if (!timings_path.empty()) {
        timings = TimingSnapshot::load(resolve_in(context, timings_path).string());
    } else if (!context.config().timings_path.empty()) {
        timings = TimingSnapshot::load(context.config().timings_path);
    }

    TestPartitioner::Config partition_config;
    partition_config.fallback_weight = fallback_weight.value_or(context.config().fallback_weight);
    partition_config.imbalance_threshold = context.config().imbalance_threshold;
    PartitionResult plan = TestPartitioner(partition_config).partition(filtered.kept, timings, shards);
    if (plan.imbalance.has_value()) {
        context.aggregator().add_diagnostic(plan.imbalance->describe());
    }

    const std::string job = context.job();
    std::vector<ShardRun> runs(plan.shards.size());
    std::vector<std::thread> workers;
    workers.reserve(plan.shards.size());

    for (size_t i = 0; i < plan.shards.size(); ++i) {
        workers.emplace_back([this, &context, &plan, &runs, &job, i] {
            const Shard& shard = plan.shards[i];
            ShardRun& run = runs[i];
            set_thread_label(job + "/shard-" + std::to_string(shard.index));
            try {
                if (shard.empty()) {
                    GANTRY_LOG_INFO("Shard " + std::to_string(shard.index) + "/" + std::to_string(shard.total) +
                                    " has no tests");
                    return;
                }
                fs::path shard_file = context.temp_dir() / ("shard-" + std::to_string(shard.index) + ".txt");
                std::string joined;
                {
                    std::ofstream out(shard_file);
                    for (const auto& id : shard.tests) {
                        out << id << '\n';
                        if (!joined.empty()) joined += ' ';
                        joined += id;
                    }
                    if (!out) {
                        throw SetupFailure("Cannot write " + shard_file.string());
                    }
                }
                EnvMap env = {
                    {"GANTRY_NODE_INDEX", std::to_string(shard.index)},
                    {"GANTRY_NODE_TOTAL", std::to_string(shard.total)},
                    {"GANTRY_SHARD_TESTS", joined},
                    {"GANTRY_SHARD_FILE", shard_file.string()},
                };
                GANTRY_LOG_INFO("Running " + std::to_string(shard.tests.size()) + " tests (expected " +
                                std::to_string(shard.weight) + "s)");

                GoTestOutputParser parser;
                bool parse = report == ReportFormat::GO_TEST;
                fs::path bash_env = context.temp_dir() / ("shard-" + std::to_string(shard.index) + ".bash_env");
                run.process = context.run_isolated_shell(bash_env, command, env, no_output_timeout,
                    [&parser, parse](OutputStream stream, std::string_view chunk) {
                        if (parse && stream == OutputStream::STDOUT) parser.feed(chunk);
                    });
                run.ran = true;
                run.parsed = parser.finish();
                add_stderr_diagnostics(run.parsed, run.process.stderr_text,
                                       "shard " + std::to_string(shard.index) + " stderr: ");
                run.failed = test_execution_failed(run.process.exit_code, run.parsed) || !run.process.success();
            } catch (const PipelineError& e) {
                run.error = std::current_exception();
                run.error_class = e.failure_class();
                run.error_message = e.what();
            } catch (const std::exception& e) {
                run.error = std::current_exception();
                run.error_class = FailureClass::TEST;
                run.error_message = e.what();
            }
        });
    }
    // Barrier: every shard finishes before anything is merged
    for (auto& worker : workers) {
        worker.join();
    }

    // Completed shards are merged and written even when another shard threw
    ActionResult result;
    std::vector<std::string> failed_shards;
    const ShardRun* worst = nullptr;
    for (size_t i = 0; i < runs.size(); ++i) {
        ShardRun& run = runs[i];
        const Shard& shard = plan.shards[i];
        if (run.error && (worst == nullptr || worst_of(worst->error_class, run.error_class) != worst->error_class)) {
            worst = &run;
        }

        Report shard_report;
        shard_report.job = job;
        shard_report.results = run.parsed.results;
        shard_report.diagnostics = run.parsed.diagnostics;
        shard_report.job_status = (run.failed || run.error) ? JobStatus::FAILED : JobStatus::SUCCEEDED;
        shard_report.failure_class = run.error ? run.error_class : (run.failed ? FailureClass::TEST : FailureClass::NONE);
        std::string status = run.error ? run.error_message : (run.ran ? run.process.describe() : "no tests");
        shard_report.message = "shard " + std::to_string(shard.index) + " of " + std::to_string(shard.total) +
                               ": " + status;
        shard_report.write_json((context.report_dir() / ("shard-" + std::to_string(shard.index) + ".json")).string());

        if (run.failed) {
            failed_shards.push_back(std::to_string(shard.index));
            result.success = false;
            result.cancelled = result.cancelled || run.process.cancelled;
            result.timed_out = result.timed_out || run.process.timed_out;
            if (!result.exit_code.has_value()) result.exit_code = run.process.exit_code;
        }
        if (run.ran && keeps_partial_output(run.process)) {
            context.aggregator().append(std::move(run.parsed));
        }
    }
    if (worst != nullptr) {
        std::rethrow_exception(worst->error);
    }

    if (!result.success) {
        std::string list;
        for (const auto& s : failed_shards) list += (list.empty() ? "" : ", ") + s;
        result.message = std::to_string(failed_shards.size()) + " of " + std::to_string(runs.size()) +
                         " shards failed (" + list + ")";
    }
    return result;
}

std::unique_ptr<Action> ShardedTestAction::clone() const {
    return std::make_unique<ShardedTestAction>(*this);
}

// --- DeterminismAction ---

ActionResult DeterminismAction::execute(JobContext& context) {
    if (configurations.size() != 2) {
        throw ConfigError("verify_determinism needs exactly two configurations, got " +
                          std::to_string(configurations.size()));
    }

    auto build = [this, &context](const BuildConfiguration& cfg) {
        fs::path artifact = resolve_in(context, cfg.artifact_path);
        EnvMap env = cfg.environment;
        env["GANTRY_ARTIFACT"] = artifact.string();
        env["GANTRY_CONFIGURATION"] = cfg.name;

        std::error_code ec;
        fs::remove(artifact, ec);   // never compare a stale artifact

        ProcessResult process = context.run_shell(command, env);
        if (process.cancelled) {
            throw PipelineError(FailureClass::CANCELLED, "Cancelled while building '" + cfg.name + "'");
        }
        if (!process.success()) {
            throw BuildFailure("Build under configuration '" + cfg.name + "' failed: " + process.describe(),
                               process.exit_code.value_or(-1));
        }
        std::ifstream in(artifact, std::ios::binary);
        if (!in) {
            throw BuildFailure("Build under configuration '" + cfg.name + "' produced no artifact at " +
                               artifact.string());
        }
        std::stringstream bytes;
        bytes << in.rdbuf();
        return BuildArtifact{cfg.name, bytes.str(), cfg.ignore};
    };

    DeterminismVerifier verifier(verifier_config);
    try {
        verifier.verify(build, configurations[0], configurations[1]);
    } catch (const DeterminismViolation& e) {
        context.set_determinism_diff(e.diff());
        fs::path diff_path = context.report_dir() / "determinism-diff.json";
        std::ofstream out(diff_path);
        out << dump_json(e.diff()) << '\n';
        if (!out) {
            GANTRY_LOG_ERROR("Cannot write " + diff_path.string());
        }
        throw;
    }

    ActionResult result;
    result.exit_code = 0;
    result.message = "artifacts identical";
    return result;
}

std::unique_ptr<Action> DeterminismAction::clone() const {
    return std::make_unique<DeterminismAction>(*this);
}

} // namespace gantry
