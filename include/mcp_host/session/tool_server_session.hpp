#pragma once

#include <mcp_host/core/deadline.hpp>
#include <mcp_host/core/result.hpp>
#include <mcp_host/process/child_process.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_host {

// ---------------------------------------------------------------------------
// SessionState - lifecycle of one tool server child.
//
//   Unstarted -> Handshaking -> Ready -> ShuttingDown -> Terminated
//
// An I/O failure, timeout or protocol violation in Handshaking or Ready goes
// straight to Terminated after the child is killed and its pipes closed.
// Nothing is accepted once Terminated.
// ---------------------------------------------------------------------------
enum class SessionState {
    Unstarted,
    Handshaking,
    Ready,
    ShuttingDown,
    Terminated,
};

[[nodiscard]] const char* SessionStateName(SessionState state);

struct SessionOptions {
    std::vector<std::string> command;
    std::string working_directory;
    std::chrono::milliseconds start_grace{100};
    std::chrono::milliseconds exit_wait{500};
    std::chrono::milliseconds terminate_wait{1000};
    std::size_t stderr_capture_bytes = 2048;
    std::string protocol_version = "2024-11-05";
    std::string client_name = "mcp-host";
};

// One entry of a tools/list reply.
struct RemoteTool {
    std::string name;
    std::string description;
    std::optional<nlohmann::json> input_schema;
};

// ---------------------------------------------------------------------------
// ToolServerSession - JSON-RPC conversation with one persistent child.
//
// Owns the child and all three of its pipes. Requests are strictly
// sequential: one request is written, then one reply line is read and must
// carry the same id. Ids are never reused within a session.
//
// Not thread-safe; the owning invoker serializes access.
// ---------------------------------------------------------------------------
class ToolServerSession {
public:
    explicit ToolServerSession(SessionOptions options);
    ~ToolServerSession();

    ToolServerSession(const ToolServerSession&) = delete;
    ToolServerSession& operator=(const ToolServerSession&) = delete;
    ToolServerSession(ToolServerSession&&) = delete;
    ToolServerSession& operator=(ToolServerSession&&) = delete;

    // Spawn the child and give it start_grace to fail fast. A child that has
    // already exited by then fails with its stderr attached.
    [[nodiscard]] Result<void, Error> Start();

    // initialize request + notifications/initialized. Returns the server's
    // initialize result, which is passed through without validation.
    [[nodiscard]] Result<nlohmann::json, Error> Initialize(const Deadline& deadline);

    // Start() followed by Initialize().
    [[nodiscard]] Result<void, Error> Open(const Deadline& deadline);

    [[nodiscard]] Result<std::vector<RemoteTool>, Error> ListTools(const Deadline& deadline);

    // tools/call {name, arguments}. An RPC error reply is a Protocol error
    // carrying its code; the session stays Ready. The deadline covers writing
    // the request as well as reading the reply; on expiry the child is killed.
    [[nodiscard]] Result<nlohmann::json, Error> CallTool(const std::string& name,
                                                         const nlohmann::json& arguments,
                                                         const Deadline& deadline);

    // Idempotent; safe after a failed Start().
    void Shutdown();

    [[nodiscard]] SessionState State() const noexcept { return state_; }
    [[nodiscard]] bool IsReady() const noexcept { return state_ == SessionState::Ready; }
    [[nodiscard]] const nlohmann::json& ServerInfo() const noexcept { return server_info_; }
    [[nodiscard]] const std::vector<std::string>& Command() const noexcept { return options_.command; }

    // Pid of the most recently spawned child, -1 if none was spawned.
    [[nodiscard]] pid_t LastPid() const noexcept { return last_pid_; }

private:
    Result<nlohmann::json, Error> Request(const std::string& operation,
                                          const std::string& method,
                                          std::optional<nlohmann::json> params,
                                          const Deadline& deadline);
    Result<void, Error> Send(const std::string& operation, const std::string& line,
                             const Deadline& deadline);
    Error Fail(Error error);
    Error ClosedError(const std::string& operation) const;
    std::string Target() const;

    SessionOptions options_;
    SessionState state_ = SessionState::Unstarted;
    std::unique_ptr<ChildProcess> child_;
    nlohmann::json server_info_;
    std::int64_t next_id_ = 0;
    pid_t last_pid_ = -1;
};

} // namespace mcp_host
