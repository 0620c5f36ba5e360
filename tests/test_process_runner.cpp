// tests/test_process_runner.cpp
#include <catch2/catch_test_macros.hpp>
#include "gantry/executor/job_context.h"
#include "gantry/executor/process_runner.h"
#include <filesystem>
#include <thread>

using namespace gantry;
using namespace std::chrono_literals;

namespace {

ProcessSpec shell_spec(const std::string& command) {
    ProcessSpec spec;
    spec.command = command;
    spec.environment = ProcessRunner::inherited_environment();
    return spec;
}

} // namespace

// Test 1: exit codes and streams are captured separately
TEST_CASE("Process runner captures exit code and output", "[process]") {
    ProcessRunner runner;
    auto result = runner.run(shell_spec("echo out; echo err >&2; exit 3"));

    REQUIRE(result.exit_code.value() == 3);
    REQUIRE_FALSE(result.success());
    REQUIRE(result.stdout_text == "out\n");
    REQUIRE(result.stderr_text == "err\n");
    REQUIRE(result.describe() == "exit code 3");
}

TEST_CASE("Child sees exactly the given environment and directory", "[process]") {
    auto dir = std::filesystem::temp_directory_path() / "gantry_test_cwd";
    std::filesystem::create_directories(dir);

    ProcessSpec spec;
    spec.command = "echo \"$GANTRY_PROBE:$(pwd)\"";
    spec.environment = {{"GANTRY_PROBE", "seen"}, {"PATH", "/usr/bin:/bin"}};
    spec.working_directory = dir.string();

    ProcessRunner runner;
    auto result = runner.run(spec);
    REQUIRE(result.success());
    REQUIRE(result.stdout_text == "seen:" + std::filesystem::canonical(dir).string() + "\n");
    std::filesystem::remove_all(dir);
}

TEST_CASE("Output callback receives streamed chunks", "[process]") {
    std::string streamed;
    auto spec = shell_spec("printf 'a\\nb\\n'");
    spec.on_output = [&streamed](OutputStream stream, std::string_view chunk) {
        if (stream == OutputStream::STDOUT) streamed.append(chunk.data(), chunk.size());
    };
    ProcessRunner runner;
    auto result = runner.run(spec);
    REQUIRE(result.success());
    REQUIRE(streamed == "a\nb\n");
}

TEST_CASE("Silent child is stopped by the no-output timeout", "[process]") {
    auto spec = shell_spec("echo started; sleep 30");
    spec.no_output_timeout = 300ms;

    ProcessRunner runner;
    auto start = std::chrono::steady_clock::now();
    auto result = runner.run(spec);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.timed_out);
    REQUIRE_FALSE(result.success());
    REQUIRE(result.stdout_text == "started\n");
    REQUIRE(elapsed < 10s);
}

TEST_CASE("Cancellation terminates the process group", "[process][cancel]") {
    CancellationToken token(200ms);
    ProcessRunner runner(&token);

    std::thread canceller([&token]() {
        std::this_thread::sleep_for(300ms);
        token.request_cancel();
    });
    // The grandchild sleep must die with the shell
    auto result = runner.run(shell_spec("sleep 30 & wait"));
    canceller.join();

    REQUIRE(result.cancelled);
    REQUIRE(result.describe() == "cancelled");
    REQUIRE(result.duration_sec < 10.0);
}

TEST_CASE("Missing working directory fails in the child", "[process]") {
    auto spec = shell_spec("true");
    spec.working_directory = "/nonexistent/gantry/dir";
    ProcessRunner runner;
    auto result = runner.run(spec);
    REQUIRE(result.exit_code.value() == 127);
}

TEST_CASE("env -0 output is split into variables", "[process][bash_env]") {
    std::string block("GOROOT=/usr/local/go", 20);
    block += '\0';
    block += "GOFLAGS=-mod=vendor -p=4";
    block += '\0';
    block += "MULTI=line one\nline two";
    block += '\0';
    block += "EMPTY=";
    block += '\0';

    auto env = parse_env_block(block);
    REQUIRE(env.size() == 4);
    REQUIRE(env.at("GOROOT") == "/usr/local/go");
    REQUIRE(env.at("GOFLAGS") == "-mod=vendor -p=4");
    REQUIRE(env.at("MULTI") == "line one\nline two");
    REQUIRE(env.at("EMPTY").empty());
}

// Test 2: exports written by one step are visible to the next
TEST_CASE("Job context carries BASH_ENV exports between steps", "[process][bash_env]") {
    RunConfig config;
    CancellationToken token;
    auto report_dir = std::filesystem::temp_directory_path() / "gantry_test_ctx_reports";
    std::filesystem::path temp;
    {
        JobContext context("ctx", "", {{"JOB_LEVEL", "job"}}, report_dir, config, token);
        temp = context.temp_dir();
        REQUIRE(std::filesystem::exists(context.bash_env_path()));

        auto first = context.run_shell("echo 'export FROM_STEP=one' >> \"$BASH_ENV\"");
        REQUIRE(first.success());
        REQUIRE(context.env().at("FROM_STEP") == "one");

        auto second = context.run_shell("echo \"$JOB_LEVEL $FROM_STEP $STEP_ONLY $GANTRY_JOB\"", {{"STEP_ONLY", "s"}});
        REQUIRE(second.stdout_text == "job one s ctx\n");
        REQUIRE(context.env().count("STEP_ONLY") == 0);

        // Exports that build on the current value are expanded by the shell
        auto extend = context.run_shell("echo 'export PATH=\"$PATH:/opt/gantry-go/bin\"' >> \"$BASH_ENV\"");
        REQUIRE(extend.success());
        const std::string path = context.env().at("PATH");
        REQUIRE(path.find('$') == std::string::npos);
        REQUIRE(path.size() > std::string(":/opt/gantry-go/bin").size());
        REQUIRE(path.rfind(":/opt/gantry-go/bin") == path.size() - std::string(":/opt/gantry-go/bin").size());

        auto tools = context.run_shell("ls / > /dev/null && echo \"$PATH\"");
        REQUIRE(tools.success());
        REQUIRE(tools.stdout_text == path + "\n");

        auto again = context.run_shell("echo \"$PATH\"");
        REQUIRE(again.stdout_text == path + "\n");
        REQUIRE(context.env().at("PATH") == path);
    }
    REQUIRE_FALSE(std::filesystem::exists(temp));
    std::filesystem::remove_all(report_dir);
}

TEST_CASE("Isolated runs keep their exports to themselves", "[process][bash_env]") {
    RunConfig config;
    CancellationToken token;
    auto report_dir = std::filesystem::temp_directory_path() / "gantry_test_isolated_reports";
    {
        JobContext context("iso", "", {}, report_dir, config, token);
        REQUIRE(context.run_shell("echo 'export SHARED=job' >> \"$BASH_ENV\"").success());

        auto private_env = context.temp_dir() / "shard-0.bash_env";
        auto shard = context.run_isolated_shell(private_env,
            "echo \"$SHARED\"; echo 'export SHARD_ONLY=0' >> \"$BASH_ENV\"");
        REQUIRE(shard.success());
        REQUIRE(shard.stdout_text == "job\n");

        REQUIRE(context.env().count("SHARD_ONLY") == 0);
        auto later = context.run_shell("echo \"[$SHARD_ONLY]\"");
        REQUIRE(later.stdout_text == "[]\n");
        REQUIRE(context.env().at("SHARED") == "job");
    }
    std::filesystem::remove_all(report_dir);
}
