// executor/job_runner.cpp
#include "gantry/executor/job_runner.h"
#include "gantry/common/errors.h"
#include "gantry/common/logger.h"
#include "gantry/executor/job_context.h"
#include <chrono>
#include <memory>

namespace gantry {

namespace {

using Clock = std::chrono::steady_clock;

StepOutcome skipped(const Step& step, const std::string& status, const std::string& why) {
    StepOutcome outcome;
    outcome.name = step.name;
    outcome.kind = step.kind;
    outcome.status = status;
    outcome.message = why;
    return outcome;
}

// Setup and structural errors leave nothing worth running
bool aborts_job(FailureClass failure_class) {
    return failure_class == FailureClass::SETUP || failure_class == FailureClass::CONFIG ||
           failure_class == FailureClass::CANCELLED;
}

void write_reports(const Report& report, const std::filesystem::path& report_dir) {
    try {
        report.write_json((report_dir / "report.json").string());
        report.write_junit((report_dir / "junit.xml").string());
    } catch (const std::exception& e) {
        // The job status stands either way
        GANTRY_LOG_ERROR("Failed to write report for " + report.job + ": " + e.what());
    }
}

} // namespace

JobRunner::JobRunner(const RunConfig& config, const CancellationToken& token, std::filesystem::path output_dir)
    : config_(config), token_(token), output_dir_(std::move(output_dir)) {}

Report JobRunner::run(const Job& job) const {
    const std::filesystem::path report_dir = output_dir_ / job.name;
    const auto job_started = Clock::now();
    set_thread_label("job:" + job.name);
    GANTRY_LOG_INFO("Starting job " + job.name + " (" + std::to_string(job.steps.size()) + " steps)");

    Report report;
    report.job = job.name;
    std::vector<StepOutcome> outcomes;
    FailureClass failure = FailureClass::NONE;
    std::string failure_message;

    auto fail = [&](FailureClass cls, const std::string& message) {
        if (failure_message.empty() || static_cast<uint8_t>(cls) > static_cast<uint8_t>(failure)) {
            failure_message = message;
        }
        failure = worst_of(failure, cls);
    };

    std::unique_ptr<JobContext> context;
    try {
        std::filesystem::create_directories(report_dir);
        context = std::make_unique<JobContext>(job.name, job.working_directory, job.environment,
                                               report_dir, config_, token_);
    } catch (const PipelineError& e) {
        fail(e.failure_class(), e.what());
    } catch (const std::exception& e) {
        fail(FailureClass::SETUP, std::string("Cannot prepare job: ") + e.what());
    }

    if (context) {
        bool aborted = false;
        for (const auto& step : job.steps) {
            if (aborted) {
                outcomes.push_back(skipped(step, "skipped", "job aborted"));
                continue;
            }
            if (token_.is_cancelled()) {
                fail(FailureClass::CANCELLED, "Cancelled before step '" + step.name + "'");
                outcomes.push_back(skipped(step, "cancelled", "run cancelled"));
                aborted = true;
                continue;
            }
            if (failure != FailureClass::NONE && step.when == StepCondition::ON_SUCCESS) {
                outcomes.push_back(skipped(step, "skipped", "an earlier step failed"));
                continue;
            }

            GANTRY_LOG_INFO("Step '" + step.name + "' (" + step.action->type() + ")");
            StepOutcome outcome;
            outcome.name = step.name;
            outcome.kind = step.kind;
            FailureClass step_failure = FailureClass::NONE;
            const auto step_started = Clock::now();
            try {
                ActionResult result = step.action->execute(*context);
                outcome.exit_code = result.exit_code;
                outcome.message = result.message;
                if (result.cancelled) {
                    step_failure = FailureClass::CANCELLED;
                    outcome.status = "cancelled";
                } else if (!result.success) {
                    step_failure = failure_class_for(step.kind);
                    outcome.status = result.timed_out ? "timed_out" : "failed";
                } else {
                    outcome.status = "succeeded";
                }
            } catch (const BuildFailure& e) {
                step_failure = e.failure_class();
                outcome.status = "failed";
                outcome.message = e.what();
                if (e.exit_code() >= 0) outcome.exit_code = e.exit_code();
            } catch (const PipelineError& e) {
                step_failure = e.failure_class();
                outcome.status = step_failure == FailureClass::CANCELLED ? "cancelled" : "failed";
                outcome.message = e.what();
            } catch (const std::exception& e) {
                step_failure = failure_class_for(step.kind);
                outcome.status = "failed";
                outcome.message = e.what();
            }
            outcome.duration_sec = std::chrono::duration<double>(Clock::now() - step_started).count();

            if (step_failure != FailureClass::NONE) {
                GANTRY_LOG_ERROR("Step '" + step.name + "' " + outcome.status +
                                 (outcome.message.empty() ? "" : ": " + outcome.message));
                fail(step_failure, "Step '" + step.name + "' " + outcome.status +
                                   (outcome.message.empty() ? "" : ": " + outcome.message));
                aborted = aborts_job(step_failure);
            }
            outcomes.push_back(std::move(outcome));
        }

        Report merged = context->aggregator().snapshot();
        report.results = std::move(merged.results);
        report.diagnostics = std::move(merged.diagnostics);
        report.determinism_diff = context->determinism_diff();
        // Temp dir and BASH_ENV go away here, before the job counts as done
        context.reset();
    }

    // Failed tests fail the job even when every command exited 0
    if (failure == FailureClass::NONE && !report.passed()) {
        fail(FailureClass::TEST, std::to_string(report.count(TestStatus::FAIL)) + " tests failed");
    }

    report.steps = std::move(outcomes);
    report.failure_class = failure;
    report.message = failure_message;
    if (failure == FailureClass::NONE) {
        report.job_status = JobStatus::SUCCEEDED;
    } else if (failure == FailureClass::CANCELLED) {
        report.job_status = JobStatus::CANCELLED;
    } else {
        report.job_status = JobStatus::FAILED;
    }

    write_reports(report, report_dir);
    const double elapsed = std::chrono::duration<double>(Clock::now() - job_started).count();
    GANTRY_LOG_INFO("Job " + job.name + " " + to_string(report.job_status) + " in " +
                    std::to_string(elapsed) + "s (" + std::to_string(report.count(TestStatus::PASS)) +
                    " passed, " + std::to_string(report.count(TestStatus::FAIL)) + " failed)");
    return report;
}

JobOutcome outcome_of(const Report& report) {
    return JobOutcome{report.job_status, report.failure_class, report.message};
}

} // namespace gantry
