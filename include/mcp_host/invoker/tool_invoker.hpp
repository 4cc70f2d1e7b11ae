#pragma once

#include <mcp_host/invoker/invocation_result.hpp>

#include <nlohmann/json.hpp>

namespace mcp_host {

// ---------------------------------------------------------------------------
// IToolInvoker - one executable capability behind a registry target.
//
// Invoke never throws and never returns an Error: every failure mode is
// encoded in the returned InvocationResult (ok=false plus status/error).
// ---------------------------------------------------------------------------
class IToolInvoker {
public:
    virtual ~IToolInvoker() = default;

    // Non-copyable, non-movable (polymorphic base).
    IToolInvoker(const IToolInvoker&) = delete;
    IToolInvoker& operator=(const IToolInvoker&) = delete;
    IToolInvoker(IToolInvoker&&) = delete;
    IToolInvoker& operator=(IToolInvoker&&) = delete;

    [[nodiscard]] virtual InvocationResult Invoke(const nlohmann::json& args) = 0;

    // Diagnostic description for `mcp-host tools`: kind, command, paths.
    [[nodiscard]] virtual nlohmann::json Describe() = 0;

protected:
    IToolInvoker() = default;
};

} // namespace mcp_host
