// partition/timing_snapshot.cpp
#include "gantry/partition/timing_snapshot.h"
#include "gantry/common/errors.h"
#include "gantry/common/logger.h"
#include "gantry/common/yaml_json.h"
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace gantry {

TimingSnapshot::TimingSnapshot(std::string version, std::vector<TimingRecord> records)
    : version_(std::move(version)) {
    for (auto& record : records) {
        durations_[std::move(record.id)] = record.duration_sec;
    }
}

TimingSnapshot TimingSnapshot::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        GANTRY_LOG_WARN("No timing data at " + path + ", all tests use the fallback weight");
        return TimingSnapshot{};
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Cannot parse timing snapshot " + path + ": " + e.what());
    }
    return from_json(j);
}

TimingSnapshot TimingSnapshot::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("timings") || !j["timings"].is_object()) {
        throw ConfigError("Timing snapshot must be an object with a 'timings' object");
    }
    std::vector<TimingRecord> records;
    for (auto it = j["timings"].begin(); it != j["timings"].end(); ++it) {
        if (!it.value().is_number()) {
            throw ConfigError("Timing for '" + it.key() + "' is not a number");
        }
        double duration = it.value().get<double>();
        if (duration < 0.0) {
            throw ConfigError("Timing for '" + it.key() + "' is negative");
        }
        records.push_back({it.key(), duration});
    }
    return TimingSnapshot(j.value("version", ""), std::move(records));
}

nlohmann::json TimingSnapshot::to_json() const {
    // Sorted keys keep the file diff-friendly between runs
    std::vector<std::pair<TestId, double>> sorted(durations_.begin(), durations_.end());
    std::sort(sorted.begin(), sorted.end());

    nlohmann::json timings = nlohmann::json::object();
    for (const auto& [id, duration] : sorted) {
        timings[id] = duration;
    }
    return nlohmann::json{{"version", version_}, {"timings", timings}};
}

void TimingSnapshot::save(const std::string& path) const {
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path());
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot write timing snapshot: " + path);
    }
    out << dump_json(to_json()) << "\n";
}

std::optional<double> TimingSnapshot::lookup(const TestId& id) const {
    auto it = durations_.find(id);
    if (it == durations_.end()) return std::nullopt;
    return it->second;
}

double TimingSnapshot::weight_of(const TestId& id, double fallback_weight) const {
    auto it = durations_.find(id);
    return it != durations_.end() ? it->second : fallback_weight;
}

TimingSnapshot TimingSnapshot::merged_with(const std::vector<TimingRecord>& records, std::string version) const {
    TimingSnapshot merged;
    merged.version_ = std::move(version);
    merged.durations_ = durations_;
    for (const auto& record : records) {
        merged.durations_[record.id] = record.duration_sec;
    }
    return merged;
}

} // namespace gantry
