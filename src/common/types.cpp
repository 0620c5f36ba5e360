// common/types.cpp
#include "gantry/common/types.h"

namespace gantry {

std::string to_string(JobStatus status) {
    switch (status) {
        case JobStatus::PENDING:   return "pending";
        case JobStatus::RUNNING:   return "running";
        case JobStatus::SUCCEEDED: return "succeeded";
        case JobStatus::FAILED:    return "failed";
        case JobStatus::BLOCKED:   return "blocked";
        case JobStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::string to_string(TestStatus status) {
    switch (status) {
        case TestStatus::PASS: return "pass";
        case TestStatus::FAIL: return "fail";
        case TestStatus::SKIP: return "skip";
    }
    return "unknown";
}

std::string to_string(FailureClass failure_class) {
    switch (failure_class) {
        case FailureClass::NONE:        return "none";
        case FailureClass::TEST:        return "TestFailure";
        case FailureClass::BUILD:       return "BuildFailure";
        case FailureClass::DETERMINISM: return "DeterminismViolation";
        case FailureClass::SETUP:       return "SetupFailure";
        case FailureClass::CONFIG:      return "ConfigError";
        case FailureClass::CANCELLED:   return "Cancelled";
    }
    return "unknown";
}

std::string to_string(StepKind kind) {
    switch (kind) {
        case StepKind::SETUP:       return "setup";
        case StepKind::BUILD:       return "build";
        case StepKind::TEST:        return "test";
        case StepKind::DETERMINISM: return "determinism";
    }
    return "unknown";
}

FailureClass failure_class_for(StepKind kind) {
    switch (kind) {
        case StepKind::SETUP:       return FailureClass::SETUP;
        case StepKind::BUILD:       return FailureClass::BUILD;
        case StepKind::TEST:        return FailureClass::TEST;
        case StepKind::DETERMINISM: return FailureClass::DETERMINISM;
    }
    return FailureClass::BUILD;
}

int exit_code_for(FailureClass failure_class) {
    switch (failure_class) {
        case FailureClass::NONE:        return 0;
        case FailureClass::TEST:        return 1;
        case FailureClass::BUILD:       return 2;
        case FailureClass::DETERMINISM: return 3;
        case FailureClass::SETUP:       return 4;
        case FailureClass::CONFIG:      return 5;
        case FailureClass::CANCELLED:   return 130;
    }
    return 1;
}

FailureClass worst_of(FailureClass a, FailureClass b) {
    return static_cast<uint8_t>(a) >= static_cast<uint8_t>(b) ? a : b;
}

} // namespace gantry
