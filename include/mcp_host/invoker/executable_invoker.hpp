#pragma once

#include <mcp_host/invoker/candidate_runner.hpp>
#include <mcp_host/invoker/tool_invoker.hpp>
#include <mcp_host/process/process_runner.hpp>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_host {

// ---------------------------------------------------------------------------
// ExecutableToolSpec - where a one-shot tool may live.
//
// Candidates, in priority order, each only if the file exists:
//   1. <interpreter> <directory>/<script_name>   (e.g. client.py)
//   2. <directory>/<binary_name>                 (must be executable)
//   3. sh <directory>/<shell_name>               (e.g. client.sh)
// An empty name disables that candidate.
// ---------------------------------------------------------------------------
struct ExecutableToolSpec {
    std::string name;
    std::string directory;
    std::string script_name;
    std::string binary_name;
    std::string shell_name;
    std::string interpreter = "python3";
};

// Map a JSON argument object to flags: {"max_count": 3, "all": true} ->
// ["--max-count", "3", "--all"]. Underscores become dashes; false and null
// are omitted; arrays repeat their elements after one flag; objects are
// passed as compact JSON. Keys keep the object's (sorted) order.
[[nodiscard]] std::vector<std::string> ArgsToArgv(const nlohmann::json& args);

class ExecutableInvoker : public IToolInvoker {
public:
    ExecutableInvoker(ExecutableToolSpec spec,
                      double default_timeout_seconds,
                      ProcessRunnerFn runner = DefaultProcessRunner());

    [[nodiscard]] InvocationResult Invoke(const nlohmann::json& args) override;
    [[nodiscard]] nlohmann::json Describe() override;

    // Candidates for `args` that exist right now; every path looked at is
    // appended to `searched` when it is non-null.
    [[nodiscard]] std::vector<CommandLine> BuildCandidates(
        const nlohmann::json& args,
        std::vector<std::string>* searched = nullptr) const;

    // True when at least one candidate file exists.
    [[nodiscard]] bool Available() const;

private:
    ExecutableToolSpec spec_;
    double default_timeout_seconds_;
    ProcessRunnerFn runner_;
};

} // namespace mcp_host
