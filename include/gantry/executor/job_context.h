// gantry/executor/job_context.h
#ifndef GANTRY_EXECUTOR_JOB_CONTEXT_H
#define GANTRY_EXECUTOR_JOB_CONTEXT_H

#include "gantry/common/cancellation.h"
#include "gantry/common/run_config.h"
#include "gantry/common/types.h"
#include "gantry/executor/process_runner.h"
#include "gantry/report/result_aggregator.h"
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace gantry {

// Scratch directory removed on every exit path
class TempDir {
public:
    explicit TempDir(const std::string& prefix);
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// State shared by the steps of one job and nothing else: environment
// bindings, the BASH_ENV file, a temp directory and the job's result sink.
class JobContext {
public:
    JobContext(JobName job,
               std::string working_directory,
               EnvMap environment,
               std::filesystem::path report_dir,
               const RunConfig& config,
               const CancellationToken& token);

    JobContext(const JobContext&) = delete;
    JobContext& operator=(const JobContext&) = delete;

    const JobName& job() const { return job_; }
    const std::string& working_directory() const { return working_directory_; }
    const std::filesystem::path& report_dir() const { return report_dir_; }
    const std::filesystem::path& temp_dir() const { return temp_dir_.path(); }
    const std::filesystem::path& bash_env_path() const { return bash_env_path_; }
    const RunConfig& config() const { return config_; }
    const CancellationToken& token() const { return token_; }
    ResultAggregator& aggregator() { return aggregator_; }

    // Job bindings overlaid with the variables $BASH_ENV currently sets
    EnvMap env() const;
    void set_env(const std::string& key, const std::string& value);

    // Runs `command` through the configured shell with the job's environment.
    // The shell sources $BASH_ENV itself; afterwards the file is re-evaluated
    // so env() reflects what later steps will see.
    ProcessResult run_shell(const std::string& command,
                            const EnvMap& step_env = {},
                            std::optional<std::chrono::milliseconds> no_output_timeout = std::nullopt,
                            OutputCallback on_output = nullptr);

    // Like run_shell, but against a private copy of $BASH_ENV at `bash_env`.
    // Nothing the command exports reaches the job. Used for concurrent shards.
    ProcessResult run_isolated_shell(const std::filesystem::path& bash_env,
                                     const std::string& command,
                                     const EnvMap& step_env = {},
                                     std::optional<std::chrono::milliseconds> no_output_timeout = std::nullopt,
                                     OutputCallback on_output = nullptr);

    // Sources $BASH_ENV in a fresh shell and records the variables it changes
    void refresh_from_bash_env();

    void set_determinism_diff(nlohmann::json diff);
    std::optional<nlohmann::json> determinism_diff() const;

private:
    // Inherited process environment, then job bindings, then `step_env`,
    // plus BASH_ENV and the GANTRY_* variables.
    EnvMap child_environment(const EnvMap& step_env, const std::filesystem::path& bash_env) const;

    ProcessResult spawn(const std::string& command,
                        const EnvMap& step_env,
                        std::optional<std::chrono::milliseconds> no_output_timeout,
                        OutputCallback on_output,
                        const std::filesystem::path& bash_env);

    JobName job_;
    std::string working_directory_;
    std::filesystem::path report_dir_;
    const RunConfig& config_;
    const CancellationToken& token_;
    TempDir temp_dir_;
    std::filesystem::path bash_env_path_;
    ResultAggregator aggregator_;

    mutable std::mutex mutex_;
    EnvMap env_;
    EnvMap bash_env_exports_;
    std::optional<nlohmann::json> determinism_diff_;
};

// Parses the NUL-separated NAME=value records printed by `env -0`
EnvMap parse_env_block(const std::string& block);

} // namespace gantry

#endif // GANTRY_EXECUTOR_JOB_CONTEXT_H
