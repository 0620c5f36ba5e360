// common/run_config.cpp
#include "gantry/common/run_config.h"
#include "gantry/common/errors.h"
#include "gantry/common/logger.h"
#include <nlohmann/json.hpp>
#include <fstream>

namespace gantry {

RunConfig load_run_config(const std::string& config_path) {
    RunConfig config;

    std::ifstream file(config_path);
    if (!file.is_open()) {
        GANTRY_LOG_DEBUG("No run config at " + config_path + ", using defaults");
        return config;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Cannot parse run config " + config_path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("Run config " + config_path + " must be a JSON object");
    }

    if (j.contains("concurrency") && j["concurrency"].is_number_integer()) {
        int concurrency = j["concurrency"].get<int>();
        if (concurrency < 1) {
            throw ConfigError("concurrency must be >= 1 in " + config_path);
        }
        config.concurrency = concurrency;
    }
    if (j.contains("output_dir") && j["output_dir"].is_string()) {
        config.output_dir = j["output_dir"].get<std::string>();
    }
    if (j.contains("grace_period_sec") && j["grace_period_sec"].is_number()) {
        config.grace_period = std::chrono::milliseconds(
            static_cast<long long>(j["grace_period_sec"].get<double>() * 1000.0));
    }
    if (j.contains("fallback_weight") && j["fallback_weight"].is_number()) {
        config.fallback_weight = j["fallback_weight"].get<double>();
        if (config.fallback_weight < 0) {
            throw ConfigError("fallback_weight must be >= 0 in " + config_path);
        }
    }
    if (j.contains("imbalance_threshold") && j["imbalance_threshold"].is_number()) {
        config.imbalance_threshold = j["imbalance_threshold"].get<double>();
    }
    if (j.contains("timings") && j["timings"].is_string()) {
        config.timings_path = j["timings"].get<std::string>();
    }
    if (j.contains("shell") && j["shell"].is_string()) {
        config.shell = j["shell"].get<std::string>();
    }
    if (j.contains("log_level") && j["log_level"].is_string()) {
        config.log_level = j["log_level"].get<std::string>();
    }

    return config;
}

} // namespace gantry
