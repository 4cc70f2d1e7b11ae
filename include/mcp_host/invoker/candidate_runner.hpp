#pragma once

#include <mcp_host/invoker/invocation_result.hpp>
#include <mcp_host/process/process_runner.hpp>

#include <string>
#include <vector>

namespace mcp_host {

using CommandLine = std::vector<std::string>;

// ---------------------------------------------------------------------------
// RunCandidates - try each command in order, each with a fresh deadline of
// `timeout_seconds`, stopping at the first exit status 0.
//
// When every candidate fails the result of the LAST one is returned, so its
// command and diagnostics are what the caller sees. A candidate that cannot
// be started counts as a failure like any other. An empty list yields a
// NotFound result with nothing searched; callers that scan the filesystem
// report their own NotFound before calling this.
// ---------------------------------------------------------------------------
[[nodiscard]] InvocationResult RunCandidates(const std::vector<CommandLine>& candidates,
                                             double timeout_seconds,
                                             const ProcessRunnerFn& runner);

} // namespace mcp_host
