// gantry/executor/actions.h
#ifndef GANTRY_EXECUTOR_ACTIONS_H
#define GANTRY_EXECUTOR_ACTIONS_H

#include "gantry/executor/action.h"
#include "gantry/executor/job_context.h"
#include "gantry/verify/determinism_verifier.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace gantry {

// How a step's stdout is turned into TestResults
enum class ReportFormat : uint8_t {
    NONE,
    GO_TEST
};

ReportFormat parse_report_format(const std::string& name);   // throws ConfigError
std::string to_string(ReportFormat format);

// `run:` a shell command
struct ShellAction : public Action {
    std::string command;
    EnvMap environment;
    std::optional<std::chrono::milliseconds> no_output_timeout;
    ReportFormat report = ReportFormat::NONE;

    ShellAction(std::string command, EnvMap environment = {},
                std::optional<std::chrono::milliseconds> no_output_timeout = std::nullopt,
                ReportFormat report = ReportFormat::NONE);

    [[nodiscard]] ActionResult execute(JobContext& context) override;
    std::unique_ptr<Action> clone() const override;
    std::string type() const override { return "run"; }
};

// `checkout`: prepares the job's working directory. Fetching sources is the
// job of whatever populates that directory.
struct CheckoutAction : public Action {
    [[nodiscard]] ActionResult execute(JobContext& context) override;
    std::unique_ptr<Action> clone() const override;
    std::string type() const override { return "checkout"; }
};

// `store_test_results:` copies a file or directory into the job's report dir
struct StoreTestResultsAction : public Action {
    std::string path;

    explicit StoreTestResultsAction(std::string path);

    [[nodiscard]] ActionResult execute(JobContext& context) override;
    std::unique_ptr<Action> clone() const override;
    std::string type() const override { return "store_test_results"; }
};

// `sharded_tests:` lists, filters and partitions test identifiers, then runs
// `command` once per shard concurrently. Each shard sees
//   GANTRY_NODE_INDEX, GANTRY_NODE_TOTAL   shard position
//   GANTRY_SHARD_TESTS                     space-separated identifiers
//   GANTRY_SHARD_FILE                      same, one per line
// Empty shards succeed without running anything.
struct ShardedTestAction : public Action {
    std::vector<TestId> tests;              // used when list_command is empty
    std::string list_command;               // prints one identifier per line
    std::string exclusions_path;
    std::string timings_path;
    std::optional<double> fallback_weight;  // overrides the run configuration
    std::string command;
    int shards = 1;
    ReportFormat report = ReportFormat::GO_TEST;
    std::optional<std::chrono::milliseconds> no_output_timeout;

    [[nodiscard]] ActionResult execute(JobContext& context) override;
    std::unique_ptr<Action> clone() const override;
    std::string type() const override { return "sharded_tests"; }

private:
    std::vector<TestId> resolve_tests(JobContext& context) const;
};

// `verify_determinism:` runs one build command under two configurations and
// compares the artifacts each writes to its `artifact` path. The artifact
// path is also exported to the build as GANTRY_ARTIFACT.
struct DeterminismAction : public Action {
    std::string command;
    std::vector<BuildConfiguration> configurations;   // exactly two
    DeterminismVerifier::Config verifier_config;

    [[nodiscard]] ActionResult execute(JobContext& context) override;
    std::unique_ptr<Action> clone() const override;
    std::string type() const override { return "verify_determinism"; }
};

} // namespace gantry

#endif // GANTRY_EXECUTOR_ACTIONS_H
