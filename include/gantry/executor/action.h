// gantry/executor/action.h
#ifndef GANTRY_EXECUTOR_ACTION_H
#define GANTRY_EXECUTOR_ACTION_H

#include "gantry/common/types.h"
#include <memory>
#include <optional>
#include <string>

namespace gantry {

class JobContext;

struct ActionResult {
    bool success = true;
    std::optional<int> exit_code;
    std::string message;
    bool cancelled = false;
    bool timed_out = false;
};

// An opaque unit of work run by a Step. Failures the action can classify
// itself (a determinism mismatch, a failed prerequisite) are thrown as
// PipelineError; everything else is reported through ActionResult and
// classified by the owning Step's kind.
class Action {
public:
    virtual ~Action() = default;

    [[nodiscard]] virtual ActionResult execute(JobContext& context) = 0;
    virtual std::unique_ptr<Action> clone() const = 0;
    virtual std::string type() const = 0;
};

struct Step {
    std::string name;
    StepKind kind = StepKind::BUILD;
    StepCondition when = StepCondition::ON_SUCCESS;
    std::unique_ptr<Action> action;

    Step() = default;
    Step(std::string name, StepKind kind, StepCondition when, std::unique_ptr<Action> action)
        : name(std::move(name)), kind(kind), when(when), action(std::move(action)) {}

    Step(const Step& other)
        : name(other.name), kind(other.kind), when(other.when),
          action(other.action ? other.action->clone() : nullptr) {}
    Step& operator=(const Step& other) {
        if (this != &other) {
            name = other.name;
            kind = other.kind;
            when = other.when;
            action = other.action ? other.action->clone() : nullptr;
        }
        return *this;
    }
    Step(Step&&) = default;
    Step& operator=(Step&&) = default;
};

} // namespace gantry

#endif // GANTRY_EXECUTOR_ACTION_H
