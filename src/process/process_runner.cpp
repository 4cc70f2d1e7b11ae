#include <mcp_host/process/process_runner.hpp>

#include <mcp_host/core/log.hpp>
#include <mcp_host/process/child_process.hpp>

#include <chrono>

namespace mcp_host {

namespace {
constexpr const char* kComponent = "process";
constexpr auto kReapGrace = std::chrono::milliseconds{200};
} // anonymous namespace

std::string TrimWhitespace(std::string_view text) {
    constexpr std::string_view kSpace = " \t\r\n\f\v";
    const auto first = text.find_first_not_of(kSpace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kSpace);
    return std::string(text.substr(first, last - first + 1));
}

Result<ProcessOutput, Error> RunProcess(const std::vector<std::string>& argv,
                                        const Deadline& deadline,
                                        const RunOptions& options) {
    SpawnOptions spawn;
    spawn.argv = argv;
    spawn.working_directory = options.working_directory;
    spawn.pipe_stdin = false;
    spawn.max_stdout_bytes = options.max_output_bytes;
    spawn.max_stderr_bytes = options.max_output_bytes;

    auto spawned = ChildProcess::Spawn(spawn);
    if (spawned.IsErr()) {
        LogDebug(kComponent, spawned.Error().ToString());
        return Result<ProcessOutput, Error>::Err(std::move(spawned).Error());
    }
    ChildProcess child = std::move(spawned).Value();

    ProcessOutput output;
    output.command = argv;
    output.timeout_seconds = deadline.BudgetSeconds();
    output.pid = child.Pid();

    bool finished = child.ReadToEnd(deadline);
    if (finished) {
        // Output is closed; the exit itself normally follows immediately.
        const auto left = deadline.IsNever() ? std::chrono::hours{24 * 365}
                                             : deadline.Remaining();
        finished = child.WaitForExit(
            std::chrono::duration_cast<std::chrono::milliseconds>(left));
    }

    if (!finished) {
        child.Kill();
        output.timed_out = true;
        LogWarn(kComponent, "killed after " + FormatSeconds(output.timeout_seconds) +
                            ": " + FormatCommand(argv));
    } else {
        output.returncode = child.ExitStatus();
    }

    // Anything a killed child left in the pipes is still useful diagnostics.
    if (output.timed_out) {
        (void)child.ReadToEnd(Deadline::After(kReapGrace));
    }
    output.stdout_text = TrimWhitespace(child.StdoutBuffer());
    output.stderr_text = TrimWhitespace(child.DrainStderr());
    output.output_truncated = child.StdoutTruncated();
    child.CloseStreams();

    LogDebug(kComponent, FormatCommand(argv) + " -> " +
                         (output.timed_out ? std::string("timeout")
                                           : "exit " + std::to_string(*output.returncode)));
    return Result<ProcessOutput, Error>::Ok(std::move(output));
}

ProcessRunnerFn DefaultProcessRunner() {
    return [](const std::vector<std::string>& argv, const Deadline& deadline) {
        return RunProcess(argv, deadline);
    };
}

} // namespace mcp_host
