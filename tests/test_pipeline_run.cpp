// tests/test_pipeline_run.cpp
#include <catch2/catch_test_macros.hpp>
#include "gantry/common/errors.h"
#include "gantry/pipeline/pipeline.h"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace gantry;
namespace fs = std::filesystem;

namespace {

// Fresh output directory per test case
class ScratchDir {
public:
    explicit ScratchDir(const std::string& name)
        : path_(fs::temp_directory_path() / ("gantry_run_" + name)) {
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

RunConfig config_for(const ScratchDir& dir) {
    RunConfig config;
    config.output_dir = (dir.path() / "reports").string();
    config.concurrency = 2;
    return config;
}

nlohmann::json read_json(const fs::path& path) {
    std::ifstream in(path);
    REQUIRE(in.is_open());
    nlohmann::json j;
    in >> j;
    return j;
}

// Prints go test -v style results for every test in the shard; TestBroken fails
const char* kFakeGoTest = R"(|
            status=0
            for t in $GANTRY_SHARD_TESTS; do
              echo "=== RUN   $t"
              if [ "$t" = "TestBroken" ]; then
                echo "    broken_test.go:7: want 1, got 2"
                echo "--- FAIL: $t (0.02s)"
                status=1
              else
                echo "--- PASS: $t (0.01s)"
              fi
            done
            if [ $status -eq 0 ]; then echo "ok   example.com/std 0.05s"; else echo "FAIL example.com/std 0.05s"; fi
            exit $status)";

std::string pipeline_yaml(const std::string& tests) {
    std::ostringstream yaml;
    yaml << R"(
jobs:
  toolchain:
    steps:
      - run:
          name: install toolchain
          command: echo 'export GOROOT_BOOTSTRAP=/opt/go1.20' >> "$BASH_ENV"
      - run:
          name: check bootstrap
          command: test "$GOROOT_BOOTSTRAP" = /opt/go1.20
  unit:
    requires: [toolchain]
    parallelism: 2
    steps:
      - run:
          name: bootstrap stays in its job
          command: test -z "$GOROOT_BOOTSTRAP"
      - sharded_tests:
          tests: )" << tests << R"(
          command: )" << kFakeGoTest << R"(
  lint:
    steps:
      - run:
          name: no bootstrap here
          command: test -z "$GOROOT_BOOTSTRAP"
  publish:
    requires: [unit, lint]
    steps:
      - run: echo publish
)";
    return yaml.str();
}

} // namespace

// Test 1: a passing run writes every report and exits 0
TEST_CASE("Passing pipeline succeeds end to end", "[pipeline][run]") {
    ScratchDir dir("pass");
    auto pipeline = Pipeline::from_yaml(pipeline_yaml("[TestA, TestB, TestC, TestD]"), {}, config_for(dir));
    CancellationToken token;

    RunResult result = pipeline.run(RunOptions{}, token);

    REQUIRE(result.exit_code == 0);
    REQUIRE(result.success());
    REQUIRE(result.schedule.start_order.front() == "toolchain");
    REQUIRE(result.schedule.start_order.back() == "publish");
    REQUIRE(result.schedule.outcomes.at("lint").status == JobStatus::SUCCEEDED);

    const Report& unit = result.reports.at("unit");
    REQUIRE(unit.results.size() == 4);
    REQUIRE(unit.count(TestStatus::PASS) == 4);
    REQUIRE(unit.find("example.com/std.TestC") != nullptr);

    const fs::path reports = dir.path() / "reports";
    REQUIRE(fs::exists(reports / "unit" / "report.json"));
    REQUIRE(fs::exists(reports / "unit" / "junit.xml"));
    REQUIRE(fs::exists(reports / "unit" / "shard-0.json"));
    REQUIRE(fs::exists(reports / "unit" / "shard-1.json"));

    auto summary = read_json(reports / "summary.json");
    REQUIRE(summary["status"] == "succeeded");
    REQUIRE(summary["exit_code"] == 0);
    REQUIRE(summary["jobs"]["unit"]["tests"]["passed"] == 4);

    auto timings = read_json(reports / "timings.json");
    REQUIRE(timings["timings"].contains("example.com/std.TestA"));
    REQUIRE(timings["timings"].contains("example.com/std"));
}

// Test 2: a failing test fails its job, blocks dependents and exits 1
TEST_CASE("Test failure blocks dependents and exits 1", "[pipeline][run]") {
    ScratchDir dir("fail");
    auto pipeline = Pipeline::from_yaml(pipeline_yaml("[TestA, TestBroken, TestC]"), {}, config_for(dir));
    CancellationToken token;

    RunResult result = pipeline.run(RunOptions{}, token);

    REQUIRE(result.exit_code == 1);
    REQUIRE(result.schedule.outcomes.at("unit").status == JobStatus::FAILED);
    REQUIRE(result.schedule.outcomes.at("unit").failure_class == FailureClass::TEST);
    REQUIRE(result.schedule.outcomes.at("publish").status == JobStatus::BLOCKED);
    REQUIRE(result.schedule.outcomes.at("lint").status == JobStatus::SUCCEEDED);

    const Report& unit = result.reports.at("unit");
    REQUIRE(unit.find("example.com/std.TestBroken")->status == TestStatus::FAIL);
    REQUIRE(unit.find("example.com/std.TestBroken")->output.find("want 1, got 2") != std::string::npos);
    REQUIRE(unit.count(TestStatus::PASS) == 2);
    REQUIRE(result.reports.count("publish") == 0);
    REQUIRE(result.summary["jobs"]["publish"]["status"] == "blocked");
}

TEST_CASE("Selecting a job runs only its closure", "[pipeline][run]") {
    ScratchDir dir("only");
    auto pipeline = Pipeline::from_yaml(pipeline_yaml("[TestA]"), {}, config_for(dir));
    CancellationToken token;

    RunOptions options;
    options.jobs = {"lint"};
    RunResult result = pipeline.run(options, token);
    REQUIRE(result.success());
    REQUIRE(result.schedule.start_order == std::vector<JobName>{"lint"});
}

TEST_CASE("Failing tests fail the job even when the command exits 0", "[pipeline][run]") {
    ScratchDir dir("clean_exit");
    auto pipeline = Pipeline::from_yaml(R"(
jobs:
  vet:
    steps:
      - run:
          name: go test ./...
          report: go-test
          command: |
            echo "=== RUN   TestGood"
            echo "--- PASS: TestGood (0.01s)"
            echo "=== RUN   TestBad"
            echo "    bad_test.go:4: mismatch"
            echo "--- FAIL: TestBad (0.01s)"
            echo "FAIL example.com/vet 0.02s"
            exit 0
)", {}, config_for(dir));
    CancellationToken token;

    RunResult result = pipeline.run(RunOptions{}, token);
    REQUIRE(result.exit_code == 1);
    REQUIRE(result.schedule.outcomes.at("vet").status == JobStatus::FAILED);
    REQUIRE(result.schedule.outcomes.at("vet").failure_class == FailureClass::TEST);

    const Report& vet = result.reports.at("vet");
    REQUIRE(vet.steps[0].exit_code.value() == 0);
    REQUIRE(vet.steps[0].status == "failed");
    REQUIRE(vet.find("example.com/vet.TestBad")->status == TestStatus::FAIL);
    REQUIRE(vet.find("example.com/vet.TestGood")->status == TestStatus::PASS);

    auto report = read_json(dir.path() / "reports" / "vet" / "report.json");
    REQUIRE(report["status"] == "failed");
    REQUIRE(report["summary"]["fail"] == 1);
}

TEST_CASE("Shards without tests finish cleanly", "[pipeline][run]") {
    ScratchDir dir("empty_shards");
    std::ostringstream yaml;
    yaml << R"(
jobs:
  unit:
    parallelism: 4
    steps:
      - sharded_tests:
          tests: [TestA, TestB]
          command: )" << kFakeGoTest << "\n";
    auto pipeline = Pipeline::from_yaml(yaml.str(), {}, config_for(dir));
    CancellationToken token;

    RunResult result = pipeline.run(RunOptions{}, token);
    REQUIRE(result.exit_code == 0);
    const Report& unit = result.reports.at("unit");
    REQUIRE(unit.results.size() == 2);
    REQUIRE(unit.count(TestStatus::PASS) == 2);

    const fs::path reports = dir.path() / "reports" / "unit";
    int empty = 0;
    for (int i = 0; i < 4; ++i) {
        auto shard = read_json(reports / ("shard-" + std::to_string(i) + ".json"));
        REQUIRE(shard["status"] == "succeeded");
        if (shard["tests"].empty()) {
            ++empty;
            REQUIRE(shard["message"].get<std::string>().find("no tests") != std::string::npos);
        }
    }
    REQUIRE(empty == 2);
}

TEST_CASE("A shard that cannot start keeps the other shards' results", "[pipeline][run]") {
    ScratchDir dir("shard_setup");
    std::ostringstream yaml;
    yaml << R"(
jobs:
  unit:
    parallelism: 2
    steps:
      - sharded_tests:
          list: mkdir "$GANTRY_TEMP_DIR/shard-1.txt" && printf 'TestA\nTestB\n'
          command: )" << kFakeGoTest << "\n";
    auto pipeline = Pipeline::from_yaml(yaml.str(), {}, config_for(dir));
    CancellationToken token;

    RunResult result = pipeline.run(RunOptions{}, token);
    REQUIRE(result.exit_code == 4);
    REQUIRE(result.schedule.outcomes.at("unit").failure_class == FailureClass::SETUP);

    const Report& unit = result.reports.at("unit");
    REQUIRE(unit.results.size() == 1);
    REQUIRE(unit.find("example.com/std.TestA")->status == TestStatus::PASS);

    const fs::path reports = dir.path() / "reports" / "unit";
    REQUIRE(read_json(reports / "shard-0.json")["status"] == "succeeded");
    auto broken = read_json(reports / "shard-1.json");
    REQUIRE(broken["status"] == "failed");
    REQUIRE(broken["message"].get<std::string>().find("Cannot write") != std::string::npos);
}

TEST_CASE("Build failure exits 2 and still runs always steps", "[pipeline][run]") {
    ScratchDir dir("build");
    const std::string marker = (dir.path() / "stored-marker").string();
    auto pipeline = Pipeline::from_yaml(R"(
jobs:
  compile:
    steps:
      - run:
          name: make.bash
          command: echo "compile error" >&2; exit 2
      - run:
          name: never
          command: touch )" + marker + R"(
      - run:
          name: collect logs
          when: always
          command: echo collected
)", {}, config_for(dir));
    CancellationToken token;

    RunResult result = pipeline.run(RunOptions{}, token);
    REQUIRE(result.exit_code == 2);
    REQUIRE_FALSE(fs::exists(marker));

    const auto& steps = result.reports.at("compile").steps;
    REQUIRE(steps.size() == 3);
    REQUIRE(steps[0].status == "failed");
    REQUIRE(steps[0].exit_code.value() == 2);
    REQUIRE(steps[1].status == "skipped");
    REQUIRE(steps[2].status == "succeeded");
}

TEST_CASE("Setup failure exits 4 and skips the rest of the job", "[pipeline][run]") {
    ScratchDir dir("setup");
    auto pipeline = Pipeline::from_yaml(R"(
jobs:
  bootstrap:
    working_directory: /proc/gantry-cannot-exist/src
    steps:
      - checkout
      - run:
          name: collect logs
          when: always
          command: echo collected
)", {}, config_for(dir));
    CancellationToken token;

    RunResult result = pipeline.run(RunOptions{}, token);
    REQUIRE(result.exit_code == 4);
    const auto& steps = result.reports.at("bootstrap").steps;
    REQUIRE(steps[0].status == "failed");
    REQUIRE(steps[1].status == "skipped");
}

TEST_CASE("Leaked build paths fail the determinism check with exit 3", "[pipeline][run][verify]") {
    ScratchDir dir("determinism");
    const std::string a = (dir.path() / "a").string();
    const std::string b = (dir.path() / "b").string();
    std::ostringstream yaml;
    yaml << R"(
jobs:
  repro:
    steps:
      - verify_determinism:
          command: mkdir -p "$GOPATH" && echo "built in $GOPATH $LEAK" > "$GANTRY_ARTIFACT"
          configurations:
            - name: gopath-a
              environment: {GOPATH: )" << a << R"(, LEAK: )" << a << R"(}
              artifact: )" << a << R"(/go.bin
              ignore: [)" << a << R"(]
            - name: gopath-b
              environment: {GOPATH: )" << b << R"(, LEAK: )" << b << R"(-extra}
              artifact: )" << b << R"(/go.bin
              ignore: [)" << b << R"(]
)";
    auto pipeline = Pipeline::from_yaml(yaml.str(), {}, config_for(dir));
    CancellationToken token;

    RunResult result = pipeline.run(RunOptions{}, token);
    REQUIRE(result.exit_code == 3);
    const Report& repro = result.reports.at("repro");
    REQUIRE(repro.failure_class == FailureClass::DETERMINISM);
    REQUIRE(repro.determinism_diff.has_value());
    REQUIRE((*repro.determinism_diff)["identical"] == false);
    REQUIRE(fs::exists(dir.path() / "reports" / "repro" / "determinism-diff.json"));
}

TEST_CASE("Matching builds pass the determinism check", "[pipeline][run][verify]") {
    ScratchDir dir("reproducible");
    const std::string a = (dir.path() / "a").string();
    const std::string b = (dir.path() / "b").string();
    std::ostringstream yaml;
    yaml << R"(
jobs:
  repro:
    steps:
      - verify_determinism:
          command: mkdir -p "$GOPATH" && echo "built in $GOPATH" > "$GANTRY_ARTIFACT"
          configurations:
            - {name: a, environment: {GOPATH: )" << a << R"(}, artifact: )" << a << R"(/go.bin, ignore: [)" << a << R"(]}
            - {name: b, environment: {GOPATH: )" << b << R"(}, artifact: )" << b << R"(/go.bin, ignore: [)" << b << R"(]}
)";
    auto pipeline = Pipeline::from_yaml(yaml.str(), {}, config_for(dir));
    CancellationToken token;

    RunResult result = pipeline.run(RunOptions{}, token);
    REQUIRE(result.exit_code == 0);
}

TEST_CASE("Structural errors surface before any job runs", "[pipeline][run]") {
    ScratchDir dir("structure");
    auto pipeline = Pipeline::from_yaml(R"(
jobs:
  a: {requires: [b], steps: [{run: "touch should-not-exist"}]}
  b: {requires: [a], steps: [{run: "true"}]}
)", {}, config_for(dir));
    CancellationToken token;
    REQUIRE_THROWS_AS(pipeline.run(RunOptions{}, token), CycleError);
    REQUIRE_FALSE(fs::exists(dir.path() / "reports" / "summary.json"));
}
