// gantry/partition/timing_snapshot.h
#ifndef GANTRY_PARTITION_TIMING_SNAPSHOT_H
#define GANTRY_PARTITION_TIMING_SNAPSHOT_H

#include "gantry/common/types.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gantry {

struct TimingRecord {
    TestId id;
    double duration_sec = 0.0;
};

// Last-observed duration per test, frozen for the length of a run.
//
// On-disk form:
//   {"version": "2026-10-19T12:00:00Z", "timings": {"fmt": 3.2, "math/big": 41.0}}
class TimingSnapshot {
public:
    TimingSnapshot() = default;
    TimingSnapshot(std::string version, std::vector<TimingRecord> records);

    // Missing file: empty snapshot (first run). Unparseable file: ConfigError.
    static TimingSnapshot load(const std::string& path);
    static TimingSnapshot from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;
    void save(const std::string& path) const;

    std::optional<double> lookup(const TestId& id) const;
    double weight_of(const TestId& id, double fallback_weight) const;

    // Returns a copy where `records` override existing entries
    TimingSnapshot merged_with(const std::vector<TimingRecord>& records, std::string version) const;

    const std::string& version() const { return version_; }
    size_t size() const { return durations_.size(); }
    bool empty() const { return durations_.empty(); }

private:
    std::string version_;
    std::unordered_map<TestId, double> durations_;
};

} // namespace gantry

#endif // GANTRY_PARTITION_TIMING_SNAPSHOT_H
