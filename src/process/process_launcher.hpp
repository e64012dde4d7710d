#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>
#include "core/config/engine_config.hpp"
#include "core/errors/engine_errors.hpp"

namespace agentcli::process {

using ChunkCallback = std::function<void(const std::string&)>;

struct SpawnRequest {
    std::filesystem::path executable;     // bare names are looked up on PATH
    std::vector<std::string> args;
    std::optional<std::filesystem::path> working_directory;

    // Merged over the inherited environment
    std::map<std::string, std::string> environment;

    std::uint32_t timeout_ms = 0;         // 0 = no deadline
    std::uint32_t kill_grace_ms = core::config::kDefaultKillGraceMs;
    std::shared_ptr<std::atomic_bool> cancel_token;

    ChunkCallback on_stdout;
    ChunkCallback on_stderr;
};

struct SpawnResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = -1;
    double duration_ms = 0.0;
};

struct KillResult {
    bool killed = false;
    std::optional<int> signal;            // last signal sent
};

struct KillOptions {
    std::uint32_t grace_ms = core::config::kDefaultKillGraceMs;
};

// Owns one forked child. The child is reaped exactly once; a ChildProcess
// destroyed while its child still runs kills it first.
class ChildProcess {
public:
    explicit ChildProcess(pid_t pid);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;

    pid_t pid() const { return pid_; }
    bool has_exited() const { return exit_code_.has_value(); }
    std::optional<int> exit_code() const { return exit_code_; }

    // Non-blocking reap. Returns the exit code once the child is gone.
    std::optional<int> poll_exit();

    // Blocking reap.
    int wait_exit();

    // SIGTERM, up to grace_ms for the child to go, then SIGKILL. A child that
    // already exited gets no signal and reports killed=false. While waiting,
    // on_wait runs in place of the sleep between exit checks and must block
    // for a bounded time itself.
    KillResult terminate(std::uint32_t grace_ms, const std::function<void()>& on_wait = {});

private:
    void record_status(int status);
    void signal_group(int signo) const;

    pid_t pid_ = -1;
    std::optional<int> exit_code_;
};

KillResult kill_process(ChildProcess& child, const KillOptions& options = {});

class ProcessLauncher {
public:
    // Runs the request to completion on the calling thread. Timeouts,
    // cancellation and exec failures come back as errors; a non-zero exit
    // is a normal SpawnResult.
    core::errors::Result<SpawnResult> run(const SpawnRequest& request) const;
};

}  // namespace agentcli::process
