// executor/process_runner.cpp
#include "gantry/executor/process_runner.h"
#include "gantry/common/errors.h"
#include "gantry/common/logger.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace gantry {

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kPollIntervalMs = 100;
// How long to keep reading after the shell exits, for output of stray children
constexpr auto kDrainAfterExit = std::chrono::seconds(2);
constexpr auto kDefaultGrace = std::chrono::seconds(10);

struct Pipe {
    int fds[2] = {-1, -1};

    ~Pipe() { close_both(); }

    void close_read() {
        if (fds[0] >= 0) {
            ::close(fds[0]);
            fds[0] = -1;
        }
    }
    void close_write() {
        if (fds[1] >= 0) {
            ::close(fds[1]);
            fds[1] = -1;
        }
    }
    void close_both() {
        close_read();
        close_write();
    }
};

void open_pipe(Pipe& p) {
    if (::pipe2(p.fds, O_CLOEXEC) != 0) {
        throw SetupFailure(std::string("pipe2 failed: ") + std::strerror(errno));
    }
}

// Written to the child's stderr when exec setup fails; async-signal-safe
void child_fail(const char* what) {
    const char* err = std::strerror(errno);
    ssize_t ignored = ::write(STDERR_FILENO, what, std::strlen(what));
    ignored = ::write(STDERR_FILENO, ": ", 2);
    ignored = ::write(STDERR_FILENO, err, std::strlen(err));
    ignored = ::write(STDERR_FILENO, "\n", 1);
    (void)ignored;
    ::_exit(127);
}

} // namespace

std::string ProcessResult::describe() const {
    if (cancelled) return "cancelled";
    if (timed_out) return "no output timeout";
    if (exit_code.has_value()) return "exit code " + std::to_string(*exit_code);
    return std::string("killed by signal ") + std::to_string(term_signal);
}

ProcessRunner::ProcessRunner(const CancellationToken* token) : token_(token) {}

EnvMap ProcessRunner::inherited_environment() {
    EnvMap env;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        env[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    return env;
}

ProcessResult ProcessRunner::run(const ProcessSpec& spec) const {
    ProcessResult result;
    if (token_ != nullptr && token_->is_cancelled()) {
        result.cancelled = true;
        return result;
    }

    // Everything the child needs is prepared before fork(); only
    // async-signal-safe calls happen in between fork() and exec.
    std::vector<std::string> env_entries;
    env_entries.reserve(spec.environment.size());
    for (const auto& [key, value] : spec.environment) {
        env_entries.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& entry : env_entries) envp.push_back(entry.data());
    envp.push_back(nullptr);

    std::string shell = spec.shell;
    std::string flag = "-c";
    std::string command = spec.command;
    std::vector<char*> argv = {shell.data(), flag.data(), command.data(), nullptr};
    const char* workdir = spec.working_directory.empty() ? nullptr : spec.working_directory.c_str();

    Pipe out_pipe;
    Pipe err_pipe;
    open_pipe(out_pipe);
    open_pipe(err_pipe);

    const auto started = Clock::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        throw SetupFailure(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);
        if (::dup2(out_pipe.fds[1], STDOUT_FILENO) < 0) child_fail("dup2 stdout");
        if (::dup2(err_pipe.fds[1], STDERR_FILENO) < 0) child_fail("dup2 stderr");
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        if (workdir != nullptr && ::chdir(workdir) != 0) child_fail(workdir);
        ::execve(argv[0], argv.data(), envp.data());
        child_fail(argv[0]);
    }

    // Both sides call setpgid so the group exists before any signal is sent
    ::setpgid(pid, pid);
    out_pipe.close_write();
    err_pipe.close_write();
    GANTRY_LOG_TRACE("Started pid " + std::to_string(pid) + ": " + spec.command);

    const auto grace = token_ != nullptr ? token_->grace_period()
                                         : std::chrono::duration_cast<std::chrono::milliseconds>(kDefaultGrace);
    auto last_output = started;
    std::optional<Clock::time_point> term_sent;
    bool kill_sent = false;
    bool reaped = false;
    std::optional<Clock::time_point> reaped_at;
    int status = 0;

    auto terminate = [&](const char* reason) {
        if (term_sent.has_value()) return;
        GANTRY_LOG_WARN("Terminating pid " + std::to_string(pid) + " (" + reason + ")");
        ::kill(-pid, SIGTERM);
        term_sent = Clock::now();
    };

    char buffer[8192];
    while (true) {
        std::vector<pollfd> fds;
        if (out_pipe.fds[0] >= 0) fds.push_back({out_pipe.fds[0], POLLIN, 0});
        if (err_pipe.fds[0] >= 0) fds.push_back({err_pipe.fds[0], POLLIN, 0});
        if (fds.empty() && reaped) break;

        int ready = ::poll(fds.empty() ? nullptr : fds.data(), fds.size(), kPollIntervalMs);
        if (ready < 0 && errno != EINTR) {
            GANTRY_LOG_ERROR(std::string("poll failed: ") + std::strerror(errno));
            ::kill(-pid, SIGKILL);
            kill_sent = true;
        }
        for (const auto& p : fds) {
            if ((p.revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
            ssize_t n = ::read(p.fd, buffer, sizeof(buffer));
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
            bool is_out = p.fd == out_pipe.fds[0];
            if (n <= 0) {
                if (is_out) out_pipe.close_read(); else err_pipe.close_read();
                continue;
            }
            std::string_view chunk(buffer, static_cast<size_t>(n));
            (is_out ? result.stdout_text : result.stderr_text).append(chunk);
            if (spec.on_output) spec.on_output(is_out ? OutputStream::STDOUT : OutputStream::STDERR, chunk);
            last_output = Clock::now();
        }

        if (!reaped) {
            pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid) {
                reaped = true;
                reaped_at = Clock::now();
            }
        }

        const auto now = Clock::now();
        if (reaped) {
            // Background children may hold the pipes open forever
            if (now - *reaped_at > kDrainAfterExit) {
                out_pipe.close_read();
                err_pipe.close_read();
            }
            continue;
        }
        if (token_ != nullptr && token_->is_cancelled() && !result.cancelled) {
            result.cancelled = true;
            terminate("cancelled");
        }
        if (spec.no_output_timeout.has_value() && !result.timed_out && now - last_output > *spec.no_output_timeout) {
            result.timed_out = true;
            terminate("no output timeout");
        }
        if (term_sent.has_value() && !kill_sent && now - *term_sent > grace) {
            GANTRY_LOG_WARN("Grace period expired, killing pid " + std::to_string(pid));
            ::kill(-pid, SIGKILL);
            kill_sent = true;
        }
    }

    result.duration_sec = std::chrono::duration<double>(Clock::now() - started).count();
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }
    GANTRY_LOG_TRACE("pid " + std::to_string(pid) + " finished: " + result.describe());
    return result;
}

} // namespace gantry
