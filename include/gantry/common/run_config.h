// gantry/common/run_config.h
#ifndef GANTRY_COMMON_RUN_CONFIG_H
#define GANTRY_COMMON_RUN_CONFIG_H

#include <chrono>
#include <string>

namespace gantry {

// Knobs for one `gantry run`. Defaults apply, then gantry.json, then CLI flags.
struct RunConfig {
    int concurrency = 4;
    std::string output_dir = "test-reports";
    std::chrono::milliseconds grace_period = std::chrono::seconds(10);
    double fallback_weight = 1.0;        // seconds assumed for tests missing from the timing snapshot
    double imbalance_threshold = 1.5;    // warn when max shard weight exceeds this multiple of the mean
    std::string timings_path;            // snapshot read when a sharded step names none
    std::string shell = "/bin/bash";
    std::string log_level = "info";
};

// Loads `config_path` over the defaults. A missing file yields the defaults;
// a file that exists but cannot be parsed throws ConfigError.
RunConfig load_run_config(const std::string& config_path = "gantry.json");

} // namespace gantry

#endif // GANTRY_COMMON_RUN_CONFIG_H
