#include <mcp_host/process/child_process.hpp>

#include <mcp_host/core/log.hpp>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
#include <sys/prctl.h>
#endif

namespace mcp_host {

namespace {

constexpr const char* kComponent = "process";
constexpr int kPollSliceMs = 50;

// Writing to a pipe whose reader has exited raises SIGPIPE; we want EPIPE.
void IgnoreSigpipeOnce() {
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void SetNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

struct Pipe {
    int read_end = -1;
    int write_end = -1;

    bool Open() {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) != 0) {
            return false;
        }
        read_end = fds[0];
        write_end = fds[1];
        return true;
    }

    void Close() {
        CloseFd(read_end);
        CloseFd(write_end);
    }
};

Error SpawnError(const std::vector<std::string>& argv, const std::string& message) {
    return Error::Make("ChildProcess::Spawn",
                       argv.empty() ? std::string() : argv.front(),
                       message, ErrorCategory::Start);
}

// Runs in the forked child; only async-signal-safe calls from here on.
[[noreturn]] void ExecChild(const std::vector<char*>& cargv,
                            const std::string& working_directory,
                            int stdin_fd, int stdout_fd, int stderr_fd,
                            int report_fd) {
    (void)setpgid(0, 0);
#ifdef __linux__
    (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif
    std::signal(SIGPIPE, SIG_DFL);

    if (dup2(stdin_fd, STDIN_FILENO) < 0 ||
        dup2(stdout_fd, STDOUT_FILENO) < 0 ||
        dup2(stderr_fd, STDERR_FILENO) < 0) {
        int err = errno;
        (void)!write(report_fd, &err, sizeof(err));
        _exit(127);
    }

    if (!working_directory.empty() && chdir(working_directory.c_str()) != 0) {
        int err = errno;
        (void)!write(report_fd, &err, sizeof(err));
        _exit(127);
    }

    execvp(cargv[0], cargv.data());
    int err = errno;
    (void)!write(report_fd, &err, sizeof(err));
    _exit(127);
}

} // anonymous namespace

std::string FormatCommand(const std::vector<std::string>& argv) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) oss << ' ';
        const auto& arg = argv[i];
        if (!arg.empty() && arg.find_first_of(" \t\"'\\") == std::string::npos) {
            oss << arg;
        } else {
            oss << '\'';
            for (char c : arg) {
                if (c == '\'') oss << "'\\''";
                else oss << c;
            }
            oss << '\'';
        }
    }
    return oss.str();
}

// ---------------------------------------------------------------------------
// Spawn
// ---------------------------------------------------------------------------
Result<ChildProcess, Error> ChildProcess::Spawn(const SpawnOptions& options) {
    if (options.argv.empty() || options.argv.front().empty()) {
        return Result<ChildProcess, Error>::Err(
            SpawnError(options.argv, "empty argv"));
    }
    IgnoreSigpipeOnce();

    Pipe in_pipe, out_pipe, err_pipe, report_pipe;
    auto close_all = [&] {
        in_pipe.Close();
        out_pipe.Close();
        err_pipe.Close();
        report_pipe.Close();
    };

    if (options.pipe_stdin) {
        if (!in_pipe.Open()) {
            return Result<ChildProcess, Error>::Err(SpawnError(
                options.argv, std::string("pipe(stdin) failed: ") + std::strerror(errno)));
        }
    } else {
        in_pipe.read_end = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (in_pipe.read_end < 0) {
            return Result<ChildProcess, Error>::Err(SpawnError(
                options.argv, std::string("open(/dev/null) failed: ") + std::strerror(errno)));
        }
    }
    if (!out_pipe.Open() || !err_pipe.Open() || !report_pipe.Open()) {
        const int err = errno;
        close_all();
        return Result<ChildProcess, Error>::Err(SpawnError(
            options.argv, std::string("pipe failed: ") + std::strerror(err)));
    }

    // Build the exec vector before fork; the child must not allocate.
    std::vector<char*> cargv;
    cargv.reserve(options.argv.size() + 1);
    for (const auto& arg : options.argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        close_all();
        return Result<ChildProcess, Error>::Err(SpawnError(
            options.argv, std::string("fork failed: ") + std::strerror(err)));
    }
    if (pid == 0) {
        ExecChild(cargv, options.working_directory, in_pipe.read_end,
                  out_pipe.write_end, err_pipe.write_end, report_pipe.write_end);
    }

    (void)setpgid(pid, pid);
    CloseFd(in_pipe.read_end);
    CloseFd(out_pipe.write_end);
    CloseFd(err_pipe.write_end);
    CloseFd(report_pipe.write_end);

    // The report pipe is close-on-exec: EOF means exec succeeded, an int
    // means it failed with that errno.
    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(report_pipe.read_end, &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    CloseFd(report_pipe.read_end);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        (void)waitpid(pid, &status, 0);
        close_all();
        return Result<ChildProcess, Error>::Err(SpawnError(
            options.argv, "could not start '" + options.argv.front() +
                          "': " + std::strerror(exec_errno)));
    }

    ChildProcess child;
    child.pid_ = pid;
    child.stdin_fd_ = in_pipe.write_end;
    child.stdout_fd_ = out_pipe.read_end;
    child.stderr_fd_ = err_pipe.read_end;
    if (child.stdin_fd_ >= 0) {
        SetNonBlocking(child.stdin_fd_);
    }
    child.argv_ = options.argv;
    child.max_stdout_bytes_ = options.max_stdout_bytes;
    child.max_stderr_bytes_ = options.max_stderr_bytes;
    SetNonBlocking(child.stdout_fd_);
    SetNonBlocking(child.stderr_fd_);

    LogDebug(kComponent, "spawned pid " + std::to_string(pid) + ": " +
                         FormatCommand(options.argv));
    return Result<ChildProcess, Error>::Ok(std::move(child));
}

// ---------------------------------------------------------------------------
// Lifetime
// ---------------------------------------------------------------------------
ChildProcess::~ChildProcess() {
    Release();
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_),
      stdin_fd_(other.stdin_fd_),
      stdout_fd_(other.stdout_fd_),
      stderr_fd_(other.stderr_fd_),
      argv_(std::move(other.argv_)),
      exit_status_(other.exit_status_),
      stdout_buffer_(std::move(other.stdout_buffer_)),
      stderr_buffer_(std::move(other.stderr_buffer_)),
      max_stdout_bytes_(other.max_stdout_bytes_),
      max_stderr_bytes_(other.max_stderr_bytes_),
      stdout_truncated_(other.stdout_truncated_),
      stderr_truncated_(other.stderr_truncated_) {
    other.pid_ = -1;
    other.stdin_fd_ = other.stdout_fd_ = other.stderr_fd_ = -1;
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        Release();
        pid_ = other.pid_;
        stdin_fd_ = other.stdin_fd_;
        stdout_fd_ = other.stdout_fd_;
        stderr_fd_ = other.stderr_fd_;
        argv_ = std::move(other.argv_);
        exit_status_ = other.exit_status_;
        stdout_buffer_ = std::move(other.stdout_buffer_);
        stderr_buffer_ = std::move(other.stderr_buffer_);
        max_stdout_bytes_ = other.max_stdout_bytes_;
        max_stderr_bytes_ = other.max_stderr_bytes_;
        stdout_truncated_ = other.stdout_truncated_;
        stderr_truncated_ = other.stderr_truncated_;
        other.pid_ = -1;
        other.stdin_fd_ = other.stdout_fd_ = other.stderr_fd_ = -1;
    }
    return *this;
}

void ChildProcess::Release() noexcept {
    if (pid_ > 0 && !exit_status_.has_value()) {
        Kill();
    }
    CloseStreams();
}

// ---------------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------------
void ChildProcess::RecordStatus(int status) {
    if (WIFEXITED(status)) {
        exit_status_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_status_ = 128 + WTERMSIG(status);
    } else {
        exit_status_ = 128;
    }
}

bool ChildProcess::IsRunning() {
    if (pid_ <= 0 || exit_status_.has_value()) {
        return false;
    }
    int status = 0;
    const pid_t w = waitpid(pid_, &status, WNOHANG);
    if (w == pid_) {
        RecordStatus(status);
        return false;
    }
    if (w < 0 && errno == ECHILD) {
        exit_status_ = 128;
        return false;
    }
    return true;
}

bool ChildProcess::WaitForExit(std::chrono::milliseconds timeout) {
    const auto deadline = Deadline::After(timeout);
    while (IsRunning()) {
        if (deadline.Expired()) {
            return false;
        }
        std::this_thread::sleep_for(
            std::chrono::milliseconds(std::min(10, deadline.PollSliceMs(10) + 1)));
    }
    return true;
}

void ChildProcess::Terminate() {
    if (pid_ > 0 && IsRunning()) {
        (void)::kill(-pid_, SIGTERM);
        (void)::kill(pid_, SIGTERM);
    }
}

void ChildProcess::Kill() {
    if (pid_ <= 0 || exit_status_.has_value()) {
        return;
    }
    (void)::kill(-pid_, SIGKILL);
    (void)::kill(pid_, SIGKILL);
    int status = 0;
    pid_t w = 0;
    do {
        w = waitpid(pid_, &status, 0);
    } while (w < 0 && errno == EINTR);
    if (w == pid_) {
        RecordStatus(status);
    } else {
        exit_status_ = 128 + SIGKILL;
    }
    LogDebug(kComponent, "killed pid " + std::to_string(pid_));
}

// ---------------------------------------------------------------------------
// Streams
// ---------------------------------------------------------------------------
void ChildProcess::CloseStdin() {
    CloseFd(stdin_fd_);
}

void ChildProcess::CloseStreams() {
    CloseFd(stdin_fd_);
    CloseFd(stdout_fd_);
    CloseFd(stderr_fd_);
}

Result<void, Error> ChildProcess::Write(std::string_view data, const Deadline& deadline) {
    const std::string target = argv_.empty() ? "" : argv_.front();
    if (stdin_fd_ < 0) {
        return Result<void, Error>::Err(Error::Make(
            "ChildProcess::Write", target, "stdin is closed", ErrorCategory::BrokenPipe));
    }
    // stdin is non-blocking: a full pipe waits in poll() slices, and the
    // output pipes keep draining so a child blocked on stdout cannot deadlock us.
    while (!data.empty()) {
        const ssize_t n = ::write(stdin_fd_, data.data(), data.size());
        if (n > 0) {
            data.remove_prefix(static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            const int err = errno;
            return Result<void, Error>::Err(Error::Make(
                "ChildProcess::Write", target,
                std::string("write failed: ") + std::strerror(err),
                err == EPIPE ? ErrorCategory::BrokenPipe : ErrorCategory::Internal));
        }
        if (deadline.Expired()) {
            return Result<void, Error>::Err(Error::Make(
                "ChildProcess::Write", target,
                "child did not read its input within " +
                    FormatSeconds(deadline.BudgetSeconds()),
                ErrorCategory::Timeout));
        }

        pollfd fds[3];
        nfds_t count = 0;
        fds[count++] = pollfd{stdin_fd_, POLLOUT, 0};
        if (stdout_fd_ >= 0) fds[count++] = pollfd{stdout_fd_, POLLIN, 0};
        if (stderr_fd_ >= 0) fds[count++] = pollfd{stderr_fd_, POLLIN, 0};
        const int ready = ::poll(fds, count, deadline.PollSliceMs(kPollSliceMs));
        if (ready > 0) {
            ReadAvailable(stdout_fd_, stdout_buffer_, max_stdout_bytes_, stdout_truncated_);
            ReadAvailable(stderr_fd_, stderr_buffer_, max_stderr_bytes_, stderr_truncated_);
        }
    }
    return Result<void, Error>::Ok();
}

void ChildProcess::ReadAvailable(int& fd, std::string& buffer, std::size_t limit,
                                 bool& truncated) {
    char chunk[4096];
    while (fd >= 0) {
        const ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            const std::size_t room = limit > buffer.size() ? limit - buffer.size() : 0;
            const std::size_t take = std::min(room, static_cast<std::size_t>(n));
            buffer.append(chunk, take);
            if (take < static_cast<std::size_t>(n)) {
                truncated = true;
            }
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        CloseFd(fd);  // EOF or hard error
    }
}

void ChildProcess::Pump(int timeout_ms) {
    pollfd fds[2];
    nfds_t count = 0;
    if (stdout_fd_ >= 0) fds[count++] = pollfd{stdout_fd_, POLLIN, 0};
    if (stderr_fd_ >= 0) fds[count++] = pollfd{stderr_fd_, POLLIN, 0};
    if (count == 0) {
        return;
    }

    const int ready = ::poll(fds, count, timeout_ms);
    if (ready <= 0) {
        return;
    }
    // POLLHUP without POLLIN still needs a read() to observe EOF.
    ReadAvailable(stdout_fd_, stdout_buffer_, max_stdout_bytes_, stdout_truncated_);
    ReadAvailable(stderr_fd_, stderr_buffer_, max_stderr_bytes_, stderr_truncated_);
}

Result<std::string, Error> ChildProcess::ReadLine(const Deadline& deadline) {
    const std::string target = argv_.empty() ? "" : argv_.front();
    while (true) {
        const auto newline = stdout_buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = stdout_buffer_.substr(0, newline);
            stdout_buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return Result<std::string, Error>::Ok(std::move(line));
        }
        if (stdout_fd_ < 0) {
            if (!stdout_buffer_.empty()) {
                std::string line;
                line.swap(stdout_buffer_);
                return Result<std::string, Error>::Ok(std::move(line));
            }
            auto error = Error::Make("ChildProcess::ReadLine", target,
                                     "child closed its output", ErrorCategory::Protocol);
            error.stderr_text = DrainStderr();
            return Result<std::string, Error>::Err(std::move(error));
        }
        if (deadline.Expired()) {
            return Result<std::string, Error>::Err(Error::Make(
                "ChildProcess::ReadLine", target,
                "no response within " + FormatSeconds(deadline.BudgetSeconds()),
                ErrorCategory::Timeout));
        }
        Pump(deadline.PollSliceMs(kPollSliceMs));
    }
}

bool ChildProcess::ReadToEnd(const Deadline& deadline) {
    while (stdout_fd_ >= 0 || stderr_fd_ >= 0) {
        if (deadline.Expired()) {
            return false;
        }
        Pump(deadline.PollSliceMs(kPollSliceMs));
    }
    return true;
}

std::string ChildProcess::DrainStderr(std::chrono::milliseconds wait) {
    const auto deadline = Deadline::After(wait);
    do {
        if (stderr_fd_ < 0) break;
        pollfd pfd{stderr_fd_, POLLIN, 0};
        if (::poll(&pfd, 1, deadline.PollSliceMs(kPollSliceMs)) > 0) {
            ReadAvailable(stderr_fd_, stderr_buffer_, max_stderr_bytes_,
                          stderr_truncated_);
        }
    } while (!deadline.Expired());
    return stderr_buffer_;
}

} // namespace mcp_host
