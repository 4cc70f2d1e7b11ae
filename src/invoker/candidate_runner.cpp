#include <mcp_host/invoker/candidate_runner.hpp>

#include <mcp_host/core/deadline.hpp>
#include <mcp_host/core/log.hpp>
#include <mcp_host/process/child_process.hpp>

namespace mcp_host {

InvocationResult RunCandidates(const std::vector<CommandLine>& candidates,
                               double timeout_seconds,
                               const ProcessRunnerFn& runner) {
    if (candidates.empty()) {
        return InvocationResult::NotFound("command", {});
    }

    InvocationResult last;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        const auto& argv = candidates[i];
        LogDebug("invoker", "candidate " + std::to_string(i + 1) + "/" +
                 std::to_string(candidates.size()) + ": " + FormatCommand(argv));

        auto run = runner(argv, Deadline::AfterSeconds(timeout_seconds));
        if (run.IsErr()) {
            last = InvocationResult::FromError(run.Error(), argv);
            last.timeout_seconds = timeout_seconds;
        } else {
            last = InvocationResult::FromProcessOutput(run.Value());
            last.timeout_seconds = timeout_seconds;
        }

        if (last.ok) {
            return last;
        }
        LogDebug("invoker", "candidate failed (" + last.Status() + "): " +
                 last.error.value_or(""));
    }
    return last;
}

} // namespace mcp_host
