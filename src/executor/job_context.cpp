// executor/job_context.cpp
#include "gantry/executor/job_context.h"
#include "gantry/common/errors.h"
#include "gantry/common/logger.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdlib.h>

namespace gantry {

namespace {

std::string sanitize(const std::string& name) {
    std::string out = name;
    std::replace_if(out.begin(), out.end(), [](char c) {
        return !(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_');
    }, '_');
    return out;
}

// Variables bash maintains on its own
bool shell_managed(const std::string& name) {
    return name == "_" || name == "SHLVL" || name == "PWD" || name == "OLDPWD" ||
           name == "GANTRY_BASH_ENV" || name.rfind("BASH_FUNC_", 0) == 0;
}

} // namespace

// --- TempDir ---

TempDir::TempDir(const std::string& prefix) {
    std::error_code ec;
    std::filesystem::path base = std::filesystem::temp_directory_path(ec);
    if (ec) base = "/tmp";
    std::string tmpl = (base / (prefix + "-XXXXXX")).string();
    if (::mkdtemp(tmpl.data()) == nullptr) {
        throw SetupFailure("Cannot create temp dir " + tmpl + ": " + std::strerror(errno));
    }
    path_ = tmpl;
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        GANTRY_LOG_WARN("Failed to remove " + path_.string() + ": " + ec.message());
    }
}

// --- JobContext ---

JobContext::JobContext(JobName job,
                       std::string working_directory,
                       EnvMap environment,
                       std::filesystem::path report_dir,
                       const RunConfig& config,
                       const CancellationToken& token)
    : job_(std::move(job)),
      working_directory_(std::move(working_directory)),
      report_dir_(std::move(report_dir)),
      config_(config),
      token_(token),
      temp_dir_("gantry-" + sanitize(job_)),
      bash_env_path_(temp_dir_.path() / "bash_env"),
      aggregator_(job_),
      env_(std::move(environment)) {
    std::ofstream touch(bash_env_path_);
    if (!touch) {
        throw SetupFailure("Cannot create " + bash_env_path_.string());
    }
}

EnvMap JobContext::env() const {
    std::lock_guard<std::mutex> lock(mutex_);
    EnvMap env = env_;
    for (const auto& [k, v] : bash_env_exports_) env[k] = v;
    return env;
}

void JobContext::set_env(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    env_[key] = value;
}

EnvMap JobContext::child_environment(const EnvMap& step_env, const std::filesystem::path& bash_env) const {
    EnvMap env = ProcessRunner::inherited_environment();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [k, v] : env_) env[k] = v;
    }
    for (const auto& [k, v] : step_env) env[k] = v;
    env["BASH_ENV"] = bash_env.string();
    env["GANTRY_JOB"] = job_;
    env["GANTRY_TEMP_DIR"] = temp_dir_.path().string();
    env["GANTRY_REPORT_DIR"] = report_dir_.string();
    return env;
}

ProcessResult JobContext::spawn(const std::string& command,
                                const EnvMap& step_env,
                                std::optional<std::chrono::milliseconds> no_output_timeout,
                                OutputCallback on_output,
                                const std::filesystem::path& bash_env) {
    ProcessSpec spec;
    spec.command = command;
    spec.shell = config_.shell;
    spec.environment = child_environment(step_env, bash_env);
    spec.working_directory = working_directory_;
    spec.no_output_timeout = no_output_timeout;
    spec.on_output = std::move(on_output);

    ProcessRunner runner(&token_);
    return runner.run(spec);
}

ProcessResult JobContext::run_shell(const std::string& command,
                                    const EnvMap& step_env,
                                    std::optional<std::chrono::milliseconds> no_output_timeout,
                                    OutputCallback on_output) {
    ProcessResult result = spawn(command, step_env, no_output_timeout, std::move(on_output), bash_env_path_);
    refresh_from_bash_env();
    return result;
}

ProcessResult JobContext::run_isolated_shell(const std::filesystem::path& bash_env,
                                             const std::string& command,
                                             const EnvMap& step_env,
                                             std::optional<std::chrono::milliseconds> no_output_timeout,
                                             OutputCallback on_output) {
    std::error_code ec;
    std::filesystem::copy_file(bash_env_path_, bash_env, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        throw SetupFailure("Cannot copy BASH_ENV to " + bash_env.string() + ": " + ec.message());
    }
    return spawn(command, step_env, no_output_timeout, std::move(on_output), bash_env);
}

void JobContext::refresh_from_bash_env() {
    std::error_code ec;
    auto size = std::filesystem::file_size(bash_env_path_, ec);
    if (ec) {
        GANTRY_LOG_WARN("BASH_ENV file vanished for job " + job_);
        return;
    }
    if (size == 0) return;

    // The file is shell code; only a shell can say what it sets
    ProcessSpec spec;
    spec.command = ". \"$GANTRY_BASH_ENV\" >/dev/null 2>&1; exec env -0";
    spec.shell = config_.shell;
    spec.environment = child_environment({}, bash_env_path_);
    spec.environment.erase("BASH_ENV");
    spec.environment["GANTRY_BASH_ENV"] = bash_env_path_.string();
    spec.working_directory = working_directory_;

    ProcessResult result = ProcessRunner().run(spec);
    if (!result.success()) {
        GANTRY_LOG_WARN("Cannot evaluate BASH_ENV for job " + job_ + ": " + result.describe());
        return;
    }

    EnvMap exports;
    for (const auto& [k, v] : parse_env_block(result.stdout_text)) {
        if (shell_managed(k)) continue;
        auto base = spec.environment.find(k);
        if (base == spec.environment.end() || base->second != v) exports[k] = v;
    }
    GANTRY_LOG_DEBUG("BASH_ENV of job " + job_ + " sets " + std::to_string(exports.size()) + " variables");

    std::lock_guard<std::mutex> lock(mutex_);
    bash_env_exports_ = std::move(exports);
}

void JobContext::set_determinism_diff(nlohmann::json diff) {
    std::lock_guard<std::mutex> lock(mutex_);
    determinism_diff_ = std::move(diff);
}

std::optional<nlohmann::json> JobContext::determinism_diff() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return determinism_diff_;
}

EnvMap parse_env_block(const std::string& block) {
    EnvMap env;
    size_t start = 0;
    while (start < block.size()) {
        size_t end = block.find('\0', start);
        if (end == std::string::npos) end = block.size();
        std::string record = block.substr(start, end - start);
        auto eq = record.find('=');
        if (eq != std::string::npos && eq > 0) {
            env[record.substr(0, eq)] = record.substr(eq + 1);
        }
        start = end + 1;
    }
    return env;
}

} // namespace gantry
