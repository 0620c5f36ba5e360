// tests/test_scheduler.cpp
#include <catch2/catch_test_macros.hpp>
#include "gantry/common/errors.h"
#include "gantry/scheduler/topo_scheduler.h"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

using namespace gantry;
using namespace std::chrono_literals;

namespace {

Job make_job(const std::string& name, std::vector<JobName> deps = {}, std::vector<std::string> locks = {}) {
    Job job;
    job.name = name;
    job.dependencies = std::move(deps);
    job.locks = std::move(locks);
    return job;
}

JobOutcome succeeded() {
    return JobOutcome{JobStatus::SUCCEEDED, FailureClass::NONE, ""};
}

size_t position(const std::vector<JobName>& order, const JobName& name) {
    return static_cast<size_t>(std::find(order.begin(), order.end(), name) - order.begin());
}

// Tracks how many jobs overlap
class OverlapProbe {
public:
    void enter() {
        int now = ++active_;
        int seen = peak_.load();
        while (now > seen && !peak_.compare_exchange_weak(seen, now)) {}
    }
    void leave() { --active_; }
    int peak() const { return peak_.load(); }

private:
    std::atomic<int> active_{0};
    std::atomic<int> peak_{0};
};

} // namespace

// Test 1: a job starts only after everything it requires has succeeded
TEST_CASE("Jobs start after their requirements", "[scheduler]") {
    JobGraph graph({make_job("A"), make_job("B", {"A"}), make_job("C", {"A"}), make_job("D", {"B", "C"})});
    CancellationToken token;
    TopoScheduler scheduler(graph, token);

    std::mutex mutex;
    std::vector<JobName> finished;
    bool order_violated = false;
    auto result = scheduler.execute([&](const Job& job) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& dep : job.dependencies) {
            if (std::find(finished.begin(), finished.end(), dep) == finished.end()) order_violated = true;
        }
        finished.push_back(job.name);
        return succeeded();
    });

    REQUIRE_FALSE(order_violated);
    REQUIRE(result.success());
    REQUIRE(result.exit_code() == 0);
    REQUIRE(result.start_order.front() == "A");
    REQUIRE(result.start_order.back() == "D");
    REQUIRE(position(result.start_order, "B") < position(result.start_order, "D"));
}

TEST_CASE("Concurrency limit is respected", "[scheduler]") {
    std::vector<Job> jobs;
    for (int i = 0; i < 6; ++i) jobs.push_back(make_job("job" + std::to_string(i)));
    JobGraph graph(jobs);
    CancellationToken token;
    TopoScheduler::Config config;
    config.concurrency = 2;
    TopoScheduler scheduler(graph, token, config);

    OverlapProbe probe;
    auto result = scheduler.execute([&probe](const Job&) {
        probe.enter();
        std::this_thread::sleep_for(50ms);
        probe.leave();
        return succeeded();
    });
    REQUIRE(result.success());
    REQUIRE(probe.peak() <= 2);
    REQUIRE(result.start_order.size() == 6);
}

TEST_CASE("Concurrency below one is rejected", "[scheduler]") {
    JobGraph graph({make_job("A")});
    CancellationToken token;
    TopoScheduler::Config config;
    config.concurrency = 0;
    REQUIRE_THROWS_AS(TopoScheduler(graph, token, config), ConfigError);
}

// Test 2: a failure blocks dependents but not independent branches
TEST_CASE("Failed job blocks its dependents only", "[scheduler]") {
    JobGraph graph({make_job("build"), make_job("unit", {"build"}), make_job("publish", {"unit"}),
                    make_job("lint")});
    CancellationToken token;
    RunTrace trace("run-test");
    TopoScheduler scheduler(graph, token, {}, &trace);

    auto result = scheduler.execute([](const Job& job) {
        if (job.name == "build") {
            throw BuildFailure("compile error", 2);
        }
        return succeeded();
    });

    REQUIRE_FALSE(result.success());
    REQUIRE(result.outcomes.at("build").status == JobStatus::FAILED);
    REQUIRE(result.outcomes.at("build").failure_class == FailureClass::BUILD);
    REQUIRE(result.outcomes.at("unit").status == JobStatus::BLOCKED);
    REQUIRE(result.outcomes.at("publish").status == JobStatus::BLOCKED);
    REQUIRE(result.outcomes.at("lint").status == JobStatus::SUCCEEDED);
    REQUIRE(result.worst == FailureClass::BUILD);
    REQUIRE(result.exit_code() == 2);

    auto records = trace.get_records();
    REQUIRE(records.size() == 4);
    auto j = trace.to_json();
    REQUIRE(j["run_id"] == "run-test");
}

TEST_CASE("Worst failure class decides the exit code", "[scheduler]") {
    JobGraph graph({make_job("unit"), make_job("repro")});
    CancellationToken token;
    TopoScheduler scheduler(graph, token);

    auto result = scheduler.execute([](const Job& job) {
        if (job.name == "unit") return JobOutcome{JobStatus::FAILED, FailureClass::TEST, "2 tests failed"};
        throw DeterminismViolation("artifacts differ", nlohmann::json::object());
    });
    REQUIRE(result.worst == FailureClass::DETERMINISM);
    REQUIRE(result.exit_code() == 3);
}

TEST_CASE("Jobs sharing a lock never overlap", "[scheduler]") {
    JobGraph graph({make_job("a", {}, {"gocache"}), make_job("b", {}, {"gocache"}),
                    make_job("c", {}, {"gocache"}), make_job("free")});
    CancellationToken token;
    TopoScheduler scheduler(graph, token);

    OverlapProbe probe;
    auto result = scheduler.execute([&probe](const Job& job) {
        if (job.locks.empty()) return succeeded();
        probe.enter();
        std::this_thread::sleep_for(30ms);
        probe.leave();
        return succeeded();
    });
    REQUIRE(result.success());
    REQUIRE(probe.peak() == 1);
}

TEST_CASE("Cancellation stops pending jobs", "[scheduler][cancel]") {
    JobGraph graph({make_job("first"), make_job("second", {"first"}), make_job("third", {"second"})});
    CancellationToken token;
    TopoScheduler scheduler(graph, token);

    auto result = scheduler.execute([&token](const Job& job) {
        if (job.name == "first") {
            token.request_cancel();
            return JobOutcome{JobStatus::CANCELLED, FailureClass::CANCELLED, "interrupted"};
        }
        return succeeded();
    });

    REQUIRE(result.start_order == std::vector<JobName>{"first"});
    REQUIRE(result.outcomes.at("second").status == JobStatus::CANCELLED);
    REQUIRE(result.outcomes.at("third").status == JobStatus::CANCELLED);
    REQUIRE(result.exit_code() == 130);
}
