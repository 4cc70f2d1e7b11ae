#pragma once

#include <mcp_host/core/result.hpp>
#include <mcp_host/process/process_runner.hpp>

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_host {

// ---------------------------------------------------------------------------
// InvocationResult - the uniform envelope every invoker returns.
//
// Invariants:
//   - timed_out implies !ok
//   - ok implies failure is empty
//   - command is exactly the argv attempted last (empty if nothing ran)
// ---------------------------------------------------------------------------
struct InvocationResult {
    bool ok = false;
    std::optional<int> returncode;
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;
    double timeout_seconds = 0.0;
    std::vector<std::string> command;
    std::optional<std::string> error;
    std::optional<nlohmann::json> json;
    std::optional<ErrorCategory> failure;
    std::vector<std::string> searched;  // set on NotFound

    // "ok", or the failure category name ("timeout", "validation_error", ...).
    [[nodiscard]] std::string Status() const;

    [[nodiscard]] bool IsWellFormed() const;

    [[nodiscard]] nlohmann::json ToJson() const;

    static InvocationResult FromProcessOutput(const ProcessOutput& output);
    static InvocationResult FromError(const Error& error,
                                      std::vector<std::string> command = {});

    // Arguments rejected before anything was spawned.
    static InvocationResult Rejected(const std::string& message);

    // No executable found; `searched` lists every path looked at.
    static InvocationResult NotFound(const std::string& tool,
                                     std::vector<std::string> searched);
};

/// Parse `text` as JSON when it looks like an object or array.
[[nodiscard]] std::optional<nlohmann::json> ParseJsonOutput(const std::string& text);

} // namespace mcp_host
