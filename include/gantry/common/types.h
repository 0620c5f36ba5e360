// gantry/common/types.h
#ifndef GANTRY_COMMON_TYPES_H
#define GANTRY_COMMON_TYPES_H

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gantry {

// Pipeline values and template contexts share nlohmann::json
using Value = nlohmann::json;
using Context = nlohmann::json;

using JobName = std::string;
using TestId = std::string;

// Ordered so that reports and child environments are reproducible
using EnvMap = std::map<std::string, std::string>;

using Seconds = std::chrono::duration<double>;

enum class JobStatus : uint8_t {
    PENDING,
    RUNNING,
    SUCCEEDED,
    FAILED,
    BLOCKED,
    CANCELLED
};

enum class TestStatus : uint8_t {
    PASS,
    FAIL,
    SKIP
};

// Ordered by severity; the run exit code reports the most severe class seen.
enum class FailureClass : uint8_t {
    NONE,
    TEST,
    BUILD,
    DETERMINISM,
    SETUP,
    CONFIG,
    CANCELLED
};

// How a step failure is classified
enum class StepKind : uint8_t {
    SETUP,
    BUILD,
    TEST,
    DETERMINISM
};

enum class StepCondition : uint8_t {
    ON_SUCCESS,
    ALWAYS
};

std::string to_string(JobStatus status);
std::string to_string(TestStatus status);
std::string to_string(FailureClass failure_class);
std::string to_string(StepKind kind);

FailureClass failure_class_for(StepKind kind);

// Process exit code for a run whose most severe failure is `failure_class`
int exit_code_for(FailureClass failure_class);

// Returns the more severe of two failure classes
FailureClass worst_of(FailureClass a, FailureClass b);

} // namespace gantry

#endif // GANTRY_COMMON_TYPES_H
