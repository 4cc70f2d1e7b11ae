#pragma once

#include <mcp_host/core/deadline.hpp>
#include <mcp_host/core/result.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace mcp_host {

struct SpawnOptions {
    std::vector<std::string> argv;       // argv[0] is resolved through PATH
    std::string working_directory;       // empty: inherit
    bool pipe_stdin = true;              // false: child reads /dev/null
    std::size_t max_stdout_bytes = 8 * 1024 * 1024;
    std::size_t max_stderr_bytes = 256 * 1024;
};

// ---------------------------------------------------------------------------
// ChildProcess - one spawned child with its stdin, stdout and stderr piped
// to this object. Owns the pipes and the pid: destruction kills a child that
// is still running, reaps it, and closes every descriptor.
//
// The child runs in its own process group so Kill() also takes down any
// grandchildren a script started.
// ---------------------------------------------------------------------------
class ChildProcess {
public:
    // Fails with ErrorCategory::Start if the executable cannot be exec'd.
    [[nodiscard]] static Result<ChildProcess, Error> Spawn(const SpawnOptions& options);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;

    [[nodiscard]] pid_t Pid() const noexcept { return pid_; }
    [[nodiscard]] const std::vector<std::string>& Argv() const noexcept { return argv_; }

    // Reaps the child if it has exited. Non-blocking.
    [[nodiscard]] bool IsRunning();

    // Exit code, or 128 + signal number; empty while running.
    [[nodiscard]] std::optional<int> ExitStatus() const noexcept { return exit_status_; }

    // Write all of `data` to the child's stdin. EPIPE maps to BrokenPipe;
    // a child that stops reading until the deadline passes maps to Timeout.
    // Output arriving meanwhile is buffered for ReadLine.
    [[nodiscard]] Result<void, Error> Write(std::string_view data, const Deadline& deadline);

    // Next '\n'-terminated line from stdout, without the terminator.
    // Timeout when the deadline passes, Protocol when stdout reaches EOF.
    // The child is left running in both cases; the caller decides its fate.
    [[nodiscard]] Result<std::string, Error> ReadLine(const Deadline& deadline);

    // Read stdout and stderr until both reach EOF or the deadline passes.
    // Returns false on deadline.
    [[nodiscard]] bool ReadToEnd(const Deadline& deadline);

    // Pick up whatever stderr is available within `wait`, then return
    // everything captured so far (bounded by max_stderr_bytes).
    [[nodiscard]] std::string DrainStderr(std::chrono::milliseconds wait =
                                              std::chrono::milliseconds{0});

    [[nodiscard]] const std::string& StdoutBuffer() const noexcept { return stdout_buffer_; }
    [[nodiscard]] bool StdoutTruncated() const noexcept { return stdout_truncated_; }

    // Wait up to `timeout` for the child to exit. True once it has.
    bool WaitForExit(std::chrono::milliseconds timeout);

    void Terminate();  // SIGTERM to the process group
    void Kill();       // SIGKILL to the process group, then reap

    void CloseStdin();
    void CloseStreams();

private:
    ChildProcess() = default;

    // poll() the open output pipes for up to timeout_ms and read what is ready.
    void Pump(int timeout_ms);
    void ReadAvailable(int& fd, std::string& buffer, std::size_t limit,
                       bool& truncated);
    void RecordStatus(int status);
    void Release() noexcept;

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::vector<std::string> argv_;
    std::optional<int> exit_status_;
    std::string stdout_buffer_;
    std::string stderr_buffer_;
    std::size_t max_stdout_bytes_ = 0;
    std::size_t max_stderr_bytes_ = 0;
    bool stdout_truncated_ = false;
    bool stderr_truncated_ = false;
};

/// "a b 'c d'" rendering of an argv for logs.
[[nodiscard]] std::string FormatCommand(const std::vector<std::string>& argv);

} // namespace mcp_host
