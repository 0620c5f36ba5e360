// gantry/common/errors.h
#ifndef GANTRY_COMMON_ERRORS_H
#define GANTRY_COMMON_ERRORS_H

#include "gantry/common/types.h"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace gantry {

// Base of every pipeline error; the class decides how far a failure propagates.
class PipelineError : public std::runtime_error {
public:
    PipelineError(FailureClass failure_class, const std::string& message)
        : std::runtime_error(message), failure_class_(failure_class) {}

    FailureClass failure_class() const noexcept { return failure_class_; }

private:
    FailureClass failure_class_;
};

// Structural problem in the definition or its inputs; aborts the run before any job starts.
class ConfigError : public PipelineError {
public:
    explicit ConfigError(const std::string& message)
        : PipelineError(FailureClass::CONFIG, message) {}
};

class CycleError : public PipelineError {
public:
    CycleError(const std::string& message, std::vector<std::string> members)
        : PipelineError(FailureClass::CONFIG, message), members_(std::move(members)) {}

    // Jobs left with unsatisfiable in-degree, sorted by name
    const std::vector<std::string>& members() const noexcept { return members_; }

private:
    std::vector<std::string> members_;
};

class SetupFailure : public PipelineError {
public:
    explicit SetupFailure(const std::string& message)
        : PipelineError(FailureClass::SETUP, message) {}
};

class BuildFailure : public PipelineError {
public:
    explicit BuildFailure(const std::string& message, int exit_code = -1)
        : PipelineError(FailureClass::BUILD, message), exit_code_(exit_code) {}

    int exit_code() const noexcept { return exit_code_; }

private:
    int exit_code_;
};

// Carries the structured diff produced by the determinism verifier
class DeterminismViolation : public PipelineError {
public:
    DeterminismViolation(const std::string& message, nlohmann::json diff)
        : PipelineError(FailureClass::DETERMINISM, message), diff_(std::move(diff)) {}

    const nlohmann::json& diff() const noexcept { return diff_; }

private:
    nlohmann::json diff_;
};

} // namespace gantry

#endif // GANTRY_COMMON_ERRORS_H
