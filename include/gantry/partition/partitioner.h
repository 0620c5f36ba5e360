// gantry/partition/partitioner.h
#ifndef GANTRY_PARTITION_PARTITIONER_H
#define GANTRY_PARTITION_PARTITIONER_H

#include "gantry/common/types.h"
#include "gantry/partition/timing_snapshot.h"
#include <optional>
#include <string>
#include <vector>

namespace gantry {

struct Shard {
    int index = 0;
    int total = 1;
    std::vector<TestId> tests;   // heaviest first
    double weight = 0.0;

    bool empty() const { return tests.empty(); }
};

// Advisory only; never fails a run
struct PartitionImbalance {
    double max_weight = 0.0;
    double mean_weight = 0.0;
    double threshold = 0.0;
    int heaviest_shard = 0;

    std::string describe() const;
};

struct PartitionResult {
    std::vector<Shard> shards;
    double total_weight = 0.0;
    double heaviest_item = 0.0;
    size_t duplicates_dropped = 0;
    std::optional<PartitionImbalance> imbalance;

    // total / N + heaviest item
    double balance_bound() const;
};

// Greedy longest-processing-time bin packing over historical timings.
class TestPartitioner {
public:
    struct Config {
        double fallback_weight;
        double imbalance_threshold;
        Config() : fallback_weight(1.0), imbalance_threshold(1.5) {}
    };

    explicit TestPartitioner(Config config = {});

    // Deterministic for identical (tests, timings, shard_count). Throws
    // ConfigError when shard_count < 1.
    PartitionResult partition(const std::vector<TestId>& tests,
                              const TimingSnapshot& timings,
                              int shard_count) const;

    const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace gantry

#endif // GANTRY_PARTITION_PARTITIONER_H
