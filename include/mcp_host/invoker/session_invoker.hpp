#pragma once

#include <mcp_host/invoker/tool_invoker.hpp>
#include <mcp_host/session/tool_server_session.hpp>

#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_host {

// ---------------------------------------------------------------------------
// SessionInvoker - drives one persistent tool server child.
//
// The session is opened lazily on the first Invoke and reused afterwards.
// Any failure that leaves the session terminated (crash, broken pipe,
// timeout, protocol violation) drops it, so the next Invoke starts a fresh
// child. An RPC error reply leaves the session in place.
//
// Calls are serialized by an internal mutex.
//
// Arguments: either the tool's own arguments object, sent to `default_tool`,
// or {"tool": "<name>", "arguments": {...}} to address another tool.
// ---------------------------------------------------------------------------
class SessionInvoker : public IToolInvoker {
public:
    SessionInvoker(std::string name,
                   std::string default_tool,
                   SessionOptions options,
                   double default_timeout_seconds);
    ~SessionInvoker() override;

    [[nodiscard]] InvocationResult Invoke(const nlohmann::json& args) override;
    [[nodiscard]] nlohmann::json Describe() override;

    // tools/list through the (lazily opened) session.
    [[nodiscard]] Result<std::vector<RemoteTool>, Error> ListTools();

    // Stop the child if one is running. The next Invoke restarts it.
    void Shutdown();

    // Pid of the live child, -1 when no session is open.
    [[nodiscard]] pid_t SessionPid() const;

private:
    Result<void, Error> EnsureSession(const Deadline& deadline);
    void DropSessionIfDead();

    std::string name_;
    std::string default_tool_;
    SessionOptions options_;
    double default_timeout_seconds_;

    mutable std::mutex mutex_;
    std::unique_ptr<ToolServerSession> session_;
};

// Map a tools/call result to an InvocationResult: text content joined by
// newlines becomes stdout, `isError: true` becomes a protocol failure.
[[nodiscard]] InvocationResult FromToolCallResult(const nlohmann::json& result,
                                                  std::vector<std::string> command);

} // namespace mcp_host
