#include "process/process_launcher.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

extern char** environ;

namespace agentcli::process {

using core::errors::EngineError;
using core::errors::ErrorCategory;

namespace {

constexpr int kPollIntervalMs = 50;

// Output still arriving after the child is gone comes from grandchildren
// holding the pipes; stop listening after this long.
constexpr std::int64_t kPostExitDrainMs = 2000;

// Written by the child when it cannot reach exec.
enum class LaunchStage : int {
    ChangeDirectory = 1,
    Exec = 2
};

struct LaunchFailure {
    int stage = 0;
    int error_number = 0;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void set_cloexec(const int fd) {
    const int flags = fcntl(fd, F_GETFD, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}

void drain_pipe(int& fd, std::string& out, const ChunkCallback& on_chunk) {
    if (fd < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            std::string chunk(buffer, static_cast<std::size_t>(n));
            out += chunk;
            if (on_chunk) {
                on_chunk(chunk);
            }
            continue;
        }
        if (n == 0) {
            close_fd(fd);
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        close_fd(fd);
        return;
    }
}

// Every pipe end the parent holds for one launch. Ends are closed when the
// launch returns or a caller callback throws out of it.
struct LaunchPipes {
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    LaunchPipes() = default;
    LaunchPipes(const LaunchPipes&) = delete;
    LaunchPipes& operator=(const LaunchPipes&) = delete;
    ~LaunchPipes() { close_all(); }

    bool open() {
        return pipe(stdin_pipe) == 0 && pipe(stdout_pipe) == 0 && pipe(stderr_pipe) == 0 &&
               pipe(status_pipe) == 0;
    }

    void close_all() {
        for (int* fds : {stdin_pipe, stdout_pipe, stderr_pipe, status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
    }
};

std::vector<std::string> build_environment(
    const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string item(*entry);
        const auto eq = item.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        merged[item.substr(0, eq)] = item.substr(eq + 1);
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        out.push_back(key + "=" + value);
    }
    return out;
}

std::vector<char*> to_pointer_array(std::vector<std::string>& items) {
    std::vector<char*> pointers;
    pointers.reserve(items.size() + 1);
    for (auto& item : items) {
        pointers.push_back(item.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

int decode_wait_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::int64_t elapsed_ms(const std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - since)
        .count();
}

}  // namespace

ChildProcess::ChildProcess(const pid_t pid) : pid_(pid) {}

ChildProcess::~ChildProcess() {
    if (pid_ <= 0 || has_exited()) {
        return;
    }
    LOG_WARN("Killing still-running child process " + std::to_string(pid_));
    static_cast<void>(terminate(0));
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_), exit_code_(other.exit_code_) {
    other.pid_ = -1;
    other.exit_code_.reset();
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        if (pid_ > 0 && !has_exited()) {
            static_cast<void>(terminate(0));
        }
        pid_ = other.pid_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.exit_code_.reset();
    }
    return *this;
}

void ChildProcess::record_status(const int status) {
    exit_code_ = decode_wait_status(status);
}

std::optional<int> ChildProcess::poll_exit() {
    if (has_exited() || pid_ <= 0) {
        return exit_code_;
    }

    int status = 0;
    const pid_t waited = waitpid(pid_, &status, WNOHANG);
    if (waited == pid_) {
        record_status(status);
    } else if (waited < 0 && errno == ECHILD) {
        // Reaped elsewhere; nothing left to signal.
        exit_code_ = -1;
    }
    return exit_code_;
}

int ChildProcess::wait_exit() {
    if (has_exited() || pid_ <= 0) {
        return exit_code_.value_or(-1);
    }

    int status = 0;
    while (true) {
        const pid_t waited = waitpid(pid_, &status, 0);
        if (waited == pid_) {
            record_status(status);
            break;
        }
        if (waited < 0 && errno == EINTR) {
            continue;
        }
        exit_code_ = -1;
        break;
    }
    return exit_code_.value_or(-1);
}

void ChildProcess::signal_group(const int signo) const {
    // Children are started as group leaders so shell wrappers take their
    // own children down with them. Fall back to the pid alone otherwise.
    if (kill(-pid_, signo) != 0) {
        static_cast<void>(kill(pid_, signo));
    }
}

KillResult ChildProcess::terminate(const std::uint32_t grace_ms,
                                   const std::function<void()>& on_wait) {
    KillResult result;
    if (pid_ <= 0 || poll_exit().has_value()) {
        return result;
    }

    LOG_DEBUG("Sending SIGTERM to process " + std::to_string(pid_));
    signal_group(SIGTERM);
    result.killed = true;
    result.signal = SIGTERM;

    const auto started = std::chrono::steady_clock::now();
    while (elapsed_ms(started) < static_cast<std::int64_t>(grace_ms)) {
        if (poll_exit().has_value()) {
            return result;
        }
        if (on_wait) {
            on_wait();
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
        }
    }
    if (poll_exit().has_value()) {
        return result;
    }

    LOG_WARN("Process " + std::to_string(pid_) + " ignored SIGTERM for " +
             std::to_string(grace_ms) + " ms, sending SIGKILL");
    signal_group(SIGKILL);
    result.signal = SIGKILL;
    static_cast<void>(wait_exit());
    return result;
}

KillResult kill_process(ChildProcess& child, const KillOptions& options) {
    return child.terminate(options.grace_ms);
}

core::errors::Result<SpawnResult> ProcessLauncher::run(const SpawnRequest& request) const {
    if (request.cancel_token && request.cancel_token->load()) {
        return EngineError{ErrorCategory::Cancelled, "Process cancelled before start.",
                           "process_cancelled"};
    }
    if (request.executable.empty()) {
        return EngineError{ErrorCategory::Input, "No executable given.",
                           "empty_executable"};
    }

    // Everything the child touches is prepared before fork.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(request.args.size() + 1);
    argv_storage.push_back(request.executable.string());
    argv_storage.insert(argv_storage.end(), request.args.begin(), request.args.end());
    std::vector<char*> argv = to_pointer_array(argv_storage);

    std::vector<std::string> env_storage = build_environment(request.environment);
    std::vector<char*> envp = to_pointer_array(env_storage);

    const std::string cwd =
        request.working_directory.has_value() ? request.working_directory->string() : "";

    LaunchPipes pipes;
    auto& stdin_pipe = pipes.stdin_pipe;
    auto& stdout_pipe = pipes.stdout_pipe;
    auto& stderr_pipe = pipes.stderr_pipe;
    auto& status_pipe = pipes.status_pipe;

    if (!pipes.open()) {
        const std::string reason = std::strerror(errno);
        pipes.close_all();
        return EngineError{ErrorCategory::Internal,
                           "Failed to create process pipes: " + reason,
                           "pipe_creation_failed"};
    }
    set_cloexec(status_pipe[1]);

    LOG_DEBUG("Spawning " + request.executable.string() + " with " +
              std::to_string(request.args.size()) + " argument(s)");

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        pipes.close_all();
        return EngineError{ErrorCategory::Launch, "Failed to fork process: " + reason,
                           "spawn_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdin_pipe[0]));
        static_cast<void>(close(stdin_pipe[1]));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        static_cast<void>(close(status_pipe[0]));

        LaunchFailure failure;
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            failure.stage = static_cast<int>(LaunchStage::ChangeDirectory);
            failure.error_number = errno;
            static_cast<void>(write(status_pipe[1], &failure, sizeof(failure)));
            _exit(126);
        }

        environ = envp.data();
        execvp(argv[0], argv.data());
        failure.stage = static_cast<int>(LaunchStage::Exec);
        failure.error_number = errno;
        static_cast<void>(write(status_pipe[1], &failure, sizeof(failure)));
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    ChildProcess child(pid);

    // Provider CLIs never get interactive input.
    close_fd(stdin_pipe[0]);
    close_fd(stdin_pipe[1]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    // Blocks until exec succeeds (pipe closed by CLOEXEC) or the child
    // reports why it could not get there.
    LaunchFailure failure;
    ssize_t status_read = 0;
    do {
        status_read = read(status_pipe[0], &failure, sizeof(failure));
    } while (status_read < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (status_read == static_cast<ssize_t>(sizeof(failure))) {
        static_cast<void>(child.wait_exit());
        pipes.close_all();
        const std::string reason = std::strerror(failure.error_number);
        if (failure.stage == static_cast<int>(LaunchStage::ChangeDirectory)) {
            return EngineError{ErrorCategory::Launch,
                               "Cannot enter working directory " + cwd + ": " + reason,
                               "chdir_failed"};
        }
        return EngineError{ErrorCategory::Launch,
                           "Failed to execute " + request.executable.string() + ": " +
                               reason,
                           "exec_failed",
                           "Check that the CLI is installed and executable."};
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    SpawnResult capture;
    bool timed_out = false;
    bool cancelled = false;
    bool terminated = false;
    std::optional<std::chrono::steady_clock::time_point> exited_at;

    // One bounded wait for output, then whatever arrived goes to the callbacks.
    auto pump_output = [&]() {
        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_pipe[0] >= 0) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_pipe[0] >= 0) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        static_cast<void>(poll(fds, nfds, kPollIntervalMs));

        drain_pipe(stdout_pipe[0], capture.stdout_text, request.on_stdout);
        drain_pipe(stderr_pipe[0], capture.stderr_text, request.on_stderr);
    };

    while (true) {
        if (!terminated && !child.has_exited()) {
            if (request.cancel_token && request.cancel_token->load()) {
                cancelled = true;
            } else if (request.timeout_ms > 0 &&
                       elapsed_ms(started) > static_cast<std::int64_t>(request.timeout_ms)) {
                timed_out = true;
            }
            if (cancelled || timed_out) {
                LOG_WARN(std::string(cancelled ? "Cancelling" : "Timing out") +
                         " process " + std::to_string(pid));
                // Keep reading so a child flushing on SIGTERM never blocks on a full pipe.
                static_cast<void>(child.terminate(request.kill_grace_ms, pump_output));
                terminated = true;
            }
        }

        pump_output();

        if (!child.has_exited()) {
            static_cast<void>(child.poll_exit());
        }
        if (!child.has_exited()) {
            continue;
        }
        if (stdout_pipe[0] < 0 && stderr_pipe[0] < 0) {
            break;
        }
        if (!exited_at.has_value()) {
            exited_at = std::chrono::steady_clock::now();
        } else if (elapsed_ms(exited_at.value()) > kPostExitDrainMs) {
            LOG_DEBUG("Output pipes still open after exit; closing them");
            break;
        }
    }
    pipes.close_all();

    capture.exit_code = child.exit_code().value_or(-1);
    capture.duration_ms = std::chrono::duration<double, std::milli>(
                              std::chrono::steady_clock::now() - started)
                              .count();

    if (cancelled) {
        return EngineError{ErrorCategory::Cancelled, "Process was cancelled.",
                           "process_cancelled"};
    }
    if (timed_out) {
        return EngineError{ErrorCategory::Timeout,
                           "Process timed out after " + std::to_string(request.timeout_ms) +
                               " ms.",
                           "process_timeout"};
    }

    LOG_DEBUG("Process " + std::to_string(pid) + " exited with code " +
              std::to_string(capture.exit_code));
    return capture;
}

}  // namespace agentcli::process
