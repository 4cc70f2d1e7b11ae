#pragma once

#include <mcp_host/core/deadline.hpp>
#include <mcp_host/core/result.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace mcp_host {

// ---------------------------------------------------------------------------
// ProcessOutput - what one run of an external command produced.
//
// On deadline the child has been SIGKILLed and reaped: timed_out is set and
// returncode is empty. Both text fields are whitespace-trimmed.
// ---------------------------------------------------------------------------
struct ProcessOutput {
    std::vector<std::string> command;
    std::optional<int> returncode;
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;
    double timeout_seconds = 0.0;
    bool output_truncated = false;
    pid_t pid = -1;

    [[nodiscard]] bool Succeeded() const noexcept {
        return !timed_out && returncode.has_value() && *returncode == 0;
    }
};

struct RunOptions {
    std::string working_directory;  // empty: inherit
    std::size_t max_output_bytes = 8 * 1024 * 1024;
};

// ---------------------------------------------------------------------------
// RunProcess - run `argv` to completion or until `deadline`, stdin from
// /dev/null, capturing stdout and stderr separately.
//
// Errors (ErrorCategory::Start) only when the process could not be started.
// A non-zero exit or a timeout is a normal ProcessOutput.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<ProcessOutput, Error> RunProcess(
    const std::vector<std::string>& argv,
    const Deadline& deadline,
    const RunOptions& options = {});

// Injection seam for invokers; defaults to RunProcess.
using ProcessRunnerFn = std::function<Result<ProcessOutput, Error>(
    const std::vector<std::string>& argv, const Deadline& deadline)>;

[[nodiscard]] ProcessRunnerFn DefaultProcessRunner();

/// Strip leading and trailing ASCII whitespace.
[[nodiscard]] std::string TrimWhitespace(std::string_view text);

} // namespace mcp_host
