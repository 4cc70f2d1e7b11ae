#pragma once

#include <mcp_host/core/result.hpp>
#include <mcp_host/dispatch/plan.hpp>
#include <mcp_host/dispatch/tool_registry.hpp>

#include <optional>

#include <nlohmann/json.hpp>

namespace mcp_host {

// ---------------------------------------------------------------------------
// DispatchOutcome - the envelope {plan, result} plus what the CLI needs to
// pick an exit code.
// ---------------------------------------------------------------------------
struct DispatchOutcome {
    Plan plan;
    nlohmann::json result;
    bool ok = false;
    bool unsupported = false;
    std::optional<ErrorCategory> failure;

    [[nodiscard]] nlohmann::json Envelope() const {
        return {{"plan", plan.ToJson()}, {"result", result}};
    }
};

// Canned answer for targets the host handles itself, nullopt otherwise.
[[nodiscard]] std::optional<nlohmann::json> BuiltinResult(Target target,
                                                          const nlohmann::json& args);

// ---------------------------------------------------------------------------
// Dispatcher - routes a Plan to its invoker, or to a built-in handler when
// no tool is registered for a target that has one.
//
// Never fails: an unknown target yields
//   {status: "unsupported_target", target}
// and every invoker failure is already inside the InvocationResult. An
// invoker that breaks the InvocationResult contract aborts the process.
// ---------------------------------------------------------------------------
class Dispatcher {
public:
    explicit Dispatcher(const ToolRegistry& registry);

    [[nodiscard]] DispatchOutcome Dispatch(const Plan& plan) const;

private:
    const ToolRegistry& registry_;
};

} // namespace mcp_host
