// partition/partitioner.cpp
#include "gantry/partition/partitioner.h"
#include "gantry/common/errors.h"
#include "gantry/common/logger.h"
#include <algorithm>
#include <functional>
#include <iomanip>
#include <numeric>
#include <queue>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace gantry {

std::string PartitionImbalance::describe() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "PartitionImbalance: shard " << heaviest_shard << " carries " << max_weight
        << "s against a mean of " << mean_weight << "s (threshold x" << threshold << ")";
    return oss.str();
}

double PartitionResult::balance_bound() const {
    if (shards.empty()) return 0.0;
    return total_weight / static_cast<double>(shards.size()) + heaviest_item;
}

TestPartitioner::TestPartitioner(Config config) : config_(config) {
    if (config_.fallback_weight < 0) {
        throw ConfigError("Fallback weight must be >= 0, got " + std::to_string(config_.fallback_weight));
    }
}

PartitionResult TestPartitioner::partition(const std::vector<TestId>& tests,
                                           const TimingSnapshot& timings,
                                           int shard_count) const {
    if (shard_count < 1) {
        throw ConfigError("Shard count must be >= 1, got " + std::to_string(shard_count));
    }

    PartitionResult result;
    result.shards.resize(static_cast<size_t>(shard_count));
    for (int i = 0; i < shard_count; ++i) {
        result.shards[i].index = i;
        result.shards[i].total = shard_count;
    }

    // Deduplicate, first occurrence wins
    std::vector<TestId> unique_tests;
    unique_tests.reserve(tests.size());
    std::unordered_set<TestId> seen;
    for (const auto& id : tests) {
        if (seen.insert(id).second) {
            unique_tests.push_back(id);
        } else {
            ++result.duplicates_dropped;
        }
    }

    std::vector<double> weights;
    weights.reserve(unique_tests.size());
    for (const auto& id : unique_tests) {
        weights.push_back(timings.weight_of(id, config_.fallback_weight));
    }

    // Heaviest first; equal weights keep input order so the result only
    // depends on the inputs, never on hash or sort internals.
    std::vector<size_t> order(unique_tests.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&weights](size_t a, size_t b) {
        return weights[a] > weights[b];
    });

    // Min-heap of (accumulated weight, shard index): ties pick the lowest index
    using Bin = std::pair<double, int>;
    std::priority_queue<Bin, std::vector<Bin>, std::greater<Bin>> bins;
    for (int i = 0; i < shard_count; ++i) {
        bins.emplace(0.0, i);
    }

    for (size_t idx : order) {
        Bin lightest = bins.top();
        bins.pop();
        Shard& shard = result.shards[static_cast<size_t>(lightest.second)];
        shard.tests.push_back(unique_tests[idx]);
        shard.weight += weights[idx];
        result.total_weight += weights[idx];
        result.heaviest_item = std::max(result.heaviest_item, weights[idx]);
        bins.emplace(shard.weight, lightest.second);
    }

    if (result.total_weight > 0.0) {
        double mean = result.total_weight / static_cast<double>(shard_count);
        auto heaviest = std::max_element(result.shards.begin(), result.shards.end(),
                                         [](const Shard& a, const Shard& b) { return a.weight < b.weight; });
        // A shard holding a single oversized test cannot be split further
        if (heaviest->weight > config_.imbalance_threshold * mean && heaviest->tests.size() > 1) {
            PartitionImbalance imbalance;
            imbalance.max_weight = heaviest->weight;
            imbalance.mean_weight = mean;
            imbalance.threshold = config_.imbalance_threshold;
            imbalance.heaviest_shard = heaviest->index;
            GANTRY_LOG_WARN(imbalance.describe());
            result.imbalance = imbalance;
        }
    }

    GANTRY_LOG_DEBUG("Partitioned " + std::to_string(unique_tests.size()) + " tests into " +
                     std::to_string(shard_count) + " shards");
    return result;
}

} // namespace gantry
