// gantry/executor/process_runner.h
#ifndef GANTRY_EXECUTOR_PROCESS_RUNNER_H
#define GANTRY_EXECUTOR_PROCESS_RUNNER_H

#include "gantry/common/cancellation.h"
#include "gantry/common/types.h"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace gantry {

enum class OutputStream : uint8_t { STDOUT, STDERR };

using OutputCallback = std::function<void(OutputStream, std::string_view)>;

struct ProcessSpec {
    std::string command;                 // passed to `<shell> -c`
    std::string shell = "/bin/bash";
    EnvMap environment;                  // complete child environment
    std::string working_directory;       // empty: inherit
    std::optional<std::chrono::milliseconds> no_output_timeout;
    OutputCallback on_output;            // optional, called from the runner thread
};

struct ProcessResult {
    std::optional<int> exit_code;        // empty when the child died from a signal
    int term_signal = 0;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_sec = 0.0;

    bool success() const { return exit_code.has_value() && *exit_code == 0 && !timed_out && !cancelled; }
    std::string describe() const;
};

// Runs one shell command in its own process group. The group receives
// SIGTERM when the token is cancelled or the no-output timeout expires,
// then SIGKILL once the token's grace period has passed.
class ProcessRunner {
public:
    explicit ProcessRunner(const CancellationToken* token = nullptr);

    // Throws SetupFailure when the process cannot be started at all
    ProcessResult run(const ProcessSpec& spec) const;

    // Environment of the current process
    static EnvMap inherited_environment();

private:
    const CancellationToken* token_;
};

} // namespace gantry

#endif // GANTRY_EXECUTOR_PROCESS_RUNNER_H
