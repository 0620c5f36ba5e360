// tests/test_partitioner.cpp
#include <catch2/catch_test_macros.hpp>
#include "gantry/common/errors.h"
#include "gantry/common/run_config.h"
#include "gantry/partition/partitioner.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>

using namespace gantry;

namespace {

TimingSnapshot snapshot_of(const std::vector<std::pair<TestId, double>>& entries) {
    std::vector<TimingRecord> records;
    for (const auto& [id, d] : entries) records.push_back(TimingRecord{id, d});
    return TimingSnapshot("test", records);
}

std::vector<TestId> all_tests(const PartitionResult& result) {
    std::vector<TestId> out;
    for (const auto& shard : result.shards) {
        out.insert(out.end(), shard.tests.begin(), shard.tests.end());
    }
    return out;
}

} // namespace

// Test 1: four heavy tests and six light ones over two shards
TEST_CASE("Heavy tests are split evenly across two shards", "[partition]") {
    auto timings = snapshot_of({{"h1", 5}, {"h2", 5}, {"h3", 5}, {"h4", 5},
                                {"l1", 1}, {"l2", 1}, {"l3", 1}, {"l4", 1}, {"l5", 1}, {"l6", 1}});
    std::vector<TestId> tests = {"h1", "h2", "h3", "h4", "l1", "l2", "l3", "l4", "l5", "l6"};

    TestPartitioner partitioner;
    auto result = partitioner.partition(tests, timings, 2);

    REQUIRE(result.shards.size() == 2);
    REQUIRE(result.total_weight == 26.0);
    REQUIRE(result.heaviest_item == 5.0);
    REQUIRE(result.balance_bound() == 18.0);

    for (const auto& shard : result.shards) {
        auto heavy = std::count_if(shard.tests.begin(), shard.tests.end(),
                                   [](const TestId& id) { return id[0] == 'h'; });
        REQUIRE(heavy == 2);
        REQUIRE(shard.weight == 13.0);
        REQUIRE(shard.weight <= result.balance_bound());
    }
    REQUIRE_FALSE(result.imbalance.has_value());
}

// Test 2: every test lands in exactly one shard
TEST_CASE("Partition is complete and disjoint", "[partition]") {
    std::vector<TestId> tests;
    std::vector<std::pair<TestId, double>> entries;
    for (int i = 0; i < 37; ++i) {
        tests.push_back("pkg/" + std::to_string(i));
        entries.emplace_back(tests.back(), static_cast<double>((i * 7) % 11 + 1));
    }
    TestPartitioner partitioner;
    auto result = partitioner.partition(tests, snapshot_of(entries), 5);

    auto assigned = all_tests(result);
    REQUIRE(assigned.size() == tests.size());
    REQUIRE(std::set<TestId>(assigned.begin(), assigned.end()) == std::set<TestId>(tests.begin(), tests.end()));
    for (const auto& shard : result.shards) {
        REQUIRE(shard.weight <= result.balance_bound());
        REQUIRE(shard.total == 5);
    }
}

// Test 3: identical inputs give identical shards
TEST_CASE("Partition is deterministic", "[partition]") {
    std::vector<TestId> tests = {"a", "b", "c", "d", "e", "f", "g"};
    auto timings = snapshot_of({{"a", 2}, {"b", 2}, {"c", 2}, {"d", 3}});
    TestPartitioner partitioner;

    auto first = partitioner.partition(tests, timings, 3);
    auto second = partitioner.partition(tests, timings, 3);
    for (size_t i = 0; i < first.shards.size(); ++i) {
        REQUIRE(first.shards[i].tests == second.shards[i].tests);
    }
}

TEST_CASE("Tests without history use the fallback weight", "[partition]") {
    TestPartitioner::Config config;
    config.fallback_weight = 10.0;
    TestPartitioner partitioner(config);

    auto result = partitioner.partition({"known", "unknown"}, snapshot_of({{"known", 1}}), 1);
    REQUIRE(result.total_weight == 11.0);
    REQUIRE(result.shards[0].tests.front() == "unknown");
}

TEST_CASE("More shards than tests leaves empty shards", "[partition]") {
    TestPartitioner partitioner;
    auto result = partitioner.partition({"only"}, TimingSnapshot{}, 4);
    REQUIRE(result.shards.size() == 4);
    REQUIRE(result.shards[0].tests == std::vector<TestId>{"only"});
    for (size_t i = 1; i < 4; ++i) {
        REQUIRE(result.shards[i].empty());
    }
}

TEST_CASE("Empty test list yields empty shards", "[partition]") {
    TestPartitioner partitioner;
    auto result = partitioner.partition({}, TimingSnapshot{}, 3);
    REQUIRE(result.shards.size() == 3);
    REQUIRE(all_tests(result).empty());
    REQUIRE_FALSE(result.imbalance.has_value());
}

TEST_CASE("Shard count below one is a ConfigError", "[partition]") {
    TestPartitioner partitioner;
    REQUIRE_THROWS_AS(partitioner.partition({"a"}, TimingSnapshot{}, 0), ConfigError);
    REQUIRE_THROWS_AS(partitioner.partition({"a"}, TimingSnapshot{}, -2), ConfigError);
}

TEST_CASE("Negative fallback weight is a ConfigError", "[partition]") {
    TestPartitioner::Config config;
    config.fallback_weight = -1.0;
    REQUIRE_THROWS_AS(TestPartitioner(config), ConfigError);

    config.fallback_weight = 0.0;
    auto result = TestPartitioner(config).partition({"a", "b"}, TimingSnapshot{}, 2);
    REQUIRE(all_tests(result).size() == 2);

    auto path = std::filesystem::temp_directory_path() / "gantry_test_negative_weight.json";
    {
        std::ofstream out(path);
        out << R"({"fallback_weight": -5})";
    }
    REQUIRE_THROWS_AS(load_run_config(path.string()), ConfigError);
    std::filesystem::remove(path);
}

TEST_CASE("Duplicate test ids are assigned once", "[partition]") {
    TestPartitioner partitioner;
    auto result = partitioner.partition({"a", "b", "a", "c", "b"}, TimingSnapshot{}, 2);
    REQUIRE(result.duplicates_dropped == 2);
    REQUIRE(all_tests(result).size() == 3);
}

TEST_CASE("A lopsided split reports an imbalance", "[partition]") {
    // Two heavy tests and one light one over three shards cannot be balanced
    // but no shard holds more than one test, so nothing is reported.
    TestPartitioner partitioner;
    auto spread = partitioner.partition({"x", "y", "z"}, snapshot_of({{"x", 100}, {"y", 100}, {"z", 1}}), 3);
    REQUIRE_FALSE(spread.imbalance.has_value());

    TestPartitioner::Config strict;
    strict.imbalance_threshold = 1.01;
    TestPartitioner tight(strict);
    auto result = tight.partition({"x", "y", "z"}, snapshot_of({{"x", 10}, {"y", 6}, {"z", 5}}), 2);
    // Shards hold {x} = 10 and {y, z} = 11 against a mean of 10.5
    REQUIRE(result.imbalance.has_value());
    REQUIRE(result.imbalance->heaviest_shard == 1);
    REQUIRE(result.imbalance->max_weight == 11.0);
}

TEST_CASE("Timing snapshot round-trips through a file", "[partition][timings]") {
    auto path = (std::filesystem::temp_directory_path() / "gantry_test_timings.json").string();
    auto snapshot = snapshot_of({{"fmt", 3.5}, {"math/big", 41.0}});
    snapshot.save(path);

    auto loaded = TimingSnapshot::load(path);
    REQUIRE(loaded.size() == 2);
    REQUIRE(loaded.lookup("math/big").value() == 41.0);
    REQUIRE_FALSE(loaded.lookup("strings").has_value());

    auto merged = loaded.merged_with({TimingRecord{"fmt", 4.0}, TimingRecord{"sort", 1.0}}, "v2");
    REQUIRE(merged.version() == "v2");
    REQUIRE(merged.lookup("fmt").value() == 4.0);
    REQUIRE(merged.size() == 3);
    std::filesystem::remove(path);
}

TEST_CASE("Missing timing file is an empty snapshot", "[partition][timings]") {
    auto snapshot = TimingSnapshot::load("/nonexistent/gantry/timings.json");
    REQUIRE(snapshot.empty());
}

TEST_CASE("Malformed timing snapshot is a ConfigError", "[partition][timings]") {
    REQUIRE_THROWS_AS(TimingSnapshot::from_json(nlohmann::json::array()), ConfigError);
    REQUIRE_THROWS_AS(TimingSnapshot::from_json({{"timings", {{"fmt", "slow"}}}}), ConfigError);
    REQUIRE_THROWS_AS(TimingSnapshot::from_json({{"timings", {{"fmt", -1}}}}), ConfigError);
}
