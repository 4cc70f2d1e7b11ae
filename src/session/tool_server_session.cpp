#include <mcp_host/session/tool_server_session.hpp>

#include <mcp_host/core/log.hpp>
#include <mcp_host/core/version.hpp>
#include <mcp_host/process/process_runner.hpp>
#include <mcp_host/protocol/wire_protocol.hpp>

#include <thread>
#include <variant>

namespace mcp_host {

namespace {
constexpr const char* kComponent = "session";
constexpr auto kStartupStderrWait = std::chrono::milliseconds{200};
constexpr auto kBrokenPipeStderrWait = std::chrono::milliseconds{100};
constexpr auto kExitNotifyWait = std::chrono::milliseconds{100};
} // anonymous namespace

const char* SessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Unstarted:    return "unstarted";
        case SessionState::Handshaking:  return "handshaking";
        case SessionState::Ready:        return "ready";
        case SessionState::ShuttingDown: return "shutting_down";
        case SessionState::Terminated:   return "terminated";
    }
    return "unknown";
}

ToolServerSession::ToolServerSession(SessionOptions options)
    : options_(std::move(options)) {}

ToolServerSession::~ToolServerSession() {
    Shutdown();
}

std::string ToolServerSession::Target() const {
    return options_.command.empty() ? std::string() : FormatCommand(options_.command);
}

Error ToolServerSession::ClosedError(const std::string& operation) const {
    return Error::Make(operation, Target(),
                       std::string("session closed (state ") +
                           SessionStateName(state_) + ")",
                       ErrorCategory::SessionClosed);
}

// ---------------------------------------------------------------------------
// Start
// ---------------------------------------------------------------------------
Result<void, Error> ToolServerSession::Start() {
    const std::string op = "ToolServerSession::Start";
    if (state_ != SessionState::Unstarted) {
        return Result<void, Error>::Err(ClosedError(op));
    }

    SpawnOptions spawn;
    spawn.argv = options_.command;
    spawn.working_directory = options_.working_directory;
    spawn.pipe_stdin = true;
    spawn.max_stderr_bytes = options_.stderr_capture_bytes;

    auto spawned = ChildProcess::Spawn(spawn);
    if (spawned.IsErr()) {
        state_ = SessionState::Terminated;
        return Result<void, Error>::Err(std::move(spawned).Error());
    }
    child_ = std::make_unique<ChildProcess>(std::move(spawned).Value());
    last_pid_ = child_->Pid();

    std::this_thread::sleep_for(options_.start_grace);
    if (!child_->IsRunning()) {
        auto error = Error::Make(op, Target(),
                                 "server exited during startup (status " +
                                     std::to_string(child_->ExitStatus().value_or(-1)) + ")",
                                 ErrorCategory::Start);
        error.stderr_text = TrimWhitespace(child_->DrainStderr(kStartupStderrWait));
        child_->CloseStreams();
        child_.reset();
        state_ = SessionState::Terminated;
        LogWarn(kComponent, error.ToString());
        return Result<void, Error>::Err(std::move(error));
    }

    state_ = SessionState::Handshaking;
    LogDebug(kComponent, "started pid " + std::to_string(last_pid_) + ": " + Target());
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Handshake
// ---------------------------------------------------------------------------
Result<nlohmann::json, Error> ToolServerSession::Initialize(const Deadline& deadline) {
    const std::string op = "ToolServerSession::Initialize";
    if (state_ != SessionState::Handshaking) {
        return Result<nlohmann::json, Error>::Err(ClosedError(op));
    }

    nlohmann::json params = {
        {"protocolVersion", options_.protocol_version},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", options_.client_name}, {"version", kVersion}}},
    };
    auto result = Request(op, rpc_method::kInitialize, std::move(params), deadline);
    if (result.IsErr()) {
        // An RPC-level refusal of initialize leaves nothing usable either.
        if (state_ != SessionState::Terminated) {
            return Result<nlohmann::json, Error>::Err(Fail(std::move(result).Error()));
        }
        return result;
    }

    auto sent = Send(op, EncodeMessage(MakeNotification(rpc_method::kInitialized)), deadline);
    if (sent.IsErr()) {
        return Result<nlohmann::json, Error>::Err(std::move(sent).Error());
    }

    server_info_ = result.Value();
    state_ = SessionState::Ready;
    if (server_info_.is_object()) {
        if (auto info = server_info_.find("serverInfo"); info != server_info_.end()) {
            LogDebug(kComponent, "ready: " + info->dump());
        }
    }
    return result;
}

Result<void, Error> ToolServerSession::Open(const Deadline& deadline) {
    auto started = Start();
    if (started.IsErr()) {
        return started;
    }
    auto initialized = Initialize(deadline);
    if (initialized.IsErr()) {
        return Result<void, Error>::Err(std::move(initialized).Error());
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Discovery and calls
// ---------------------------------------------------------------------------
Result<std::vector<RemoteTool>, Error> ToolServerSession::ListTools(const Deadline& deadline) {
    const std::string op = "ToolServerSession::ListTools";
    if (state_ != SessionState::Ready) {
        return Result<std::vector<RemoteTool>, Error>::Err(ClosedError(op));
    }
    auto result = Request(op, rpc_method::kToolsList, std::nullopt, deadline);
    if (result.IsErr()) {
        return Result<std::vector<RemoteTool>, Error>::Err(std::move(result).Error());
    }

    std::vector<RemoteTool> tools;
    const auto& listed = result.Value();
    auto entries = listed.find("tools");
    if (entries == listed.end() || !entries->is_array()) {
        return Result<std::vector<RemoteTool>, Error>::Err(Error::Make(
            op, Target(), "tools/list result has no 'tools' array",
            ErrorCategory::Protocol));
    }
    for (const auto& entry : *entries) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
            continue;
        }
        RemoteTool tool;
        tool.name = entry["name"].get<std::string>();
        if (entry.contains("description") && entry["description"].is_string()) {
            tool.description = entry["description"].get<std::string>();
        }
        if (entry.contains("inputSchema")) {
            tool.input_schema = entry["inputSchema"];
        }
        tools.push_back(std::move(tool));
    }
    return Result<std::vector<RemoteTool>, Error>::Ok(std::move(tools));
}

Result<nlohmann::json, Error> ToolServerSession::CallTool(const std::string& name,
                                                          const nlohmann::json& arguments,
                                                          const Deadline& deadline) {
    const std::string op = "ToolServerSession::CallTool";
    if (state_ != SessionState::Ready) {
        return Result<nlohmann::json, Error>::Err(ClosedError(op));
    }
    nlohmann::json params = {{"name", name}, {"arguments", arguments}};
    return Request(op, rpc_method::kToolsCall, std::move(params), deadline);
}

// ---------------------------------------------------------------------------
// Request / response
// ---------------------------------------------------------------------------
Result<void, Error> ToolServerSession::Send(const std::string& operation,
                                            const std::string& line,
                                            const Deadline& deadline) {
    auto written = child_->Write(line, deadline);
    if (written.IsOk()) {
        return written;
    }

    auto error = std::move(written).Error();
    error.operation = operation;
    if (error.category == ErrorCategory::BrokenPipe && !child_->IsRunning()) {
        error.message = "Broken pipe to server (exited with status " +
                        std::to_string(child_->ExitStatus().value_or(-1)) + ")";
        error.stderr_text = TrimWhitespace(child_->DrainStderr(kBrokenPipeStderrWait));
    }
    return Result<void, Error>::Err(Fail(std::move(error)));
}

Result<nlohmann::json, Error> ToolServerSession::Request(const std::string& operation,
                                                         const std::string& method,
                                                         std::optional<nlohmann::json> params,
                                                         const Deadline& deadline) {
    const nlohmann::json id = ++next_id_;

    auto sent = Send(operation, EncodeMessage(MakeRequest(id, method, std::move(params))),
                     deadline);
    if (sent.IsErr()) {
        return Result<nlohmann::json, Error>::Err(std::move(sent).Error());
    }

    while (true) {
        auto line = child_->ReadLine(deadline);
        if (line.IsErr()) {
            auto error = std::move(line).Error();
            error.operation = operation;
            if (error.category == ErrorCategory::Protocol) {
                error.message = "No response from server: " + error.message;
            }
            return Result<nlohmann::json, Error>::Err(Fail(std::move(error)));
        }
        if (line.Value().empty()) {
            continue;
        }

        auto decoded = DecodeMessage(line.Value());
        if (decoded.IsErr()) {
            auto error = Error::FromRpcError(operation, Target(), decoded.Error().code,
                                             "malformed reply: " + decoded.Error().message);
            return Result<nlohmann::json, Error>::Err(Fail(std::move(error)));
        }

        auto& message = decoded.Value();
        if (auto* notification = std::get_if<RpcNotification>(&message)) {
            LogDebug(kComponent, "skipping server notification " + notification->method);
            continue;
        }
        if (std::holds_alternative<RpcRequest>(message)) {
            return Result<nlohmann::json, Error>::Err(Fail(Error::Make(
                operation, Target(), "server sent an unsolicited request",
                ErrorCategory::Protocol)));
        }

        if (auto* response = std::get_if<RpcResponse>(&message)) {
            if (response->id != id) {
                return Result<nlohmann::json, Error>::Err(Fail(Error::Make(
                    operation, Target(),
                    "response id " + response->id.dump() + " does not match request id " +
                        id.dump(),
                    ErrorCategory::Protocol)));
            }
            return Result<nlohmann::json, Error>::Ok(std::move(response->result));
        }

        const auto& failure = std::get<RpcErrorResponse>(message);
        if (failure.id != id && !failure.id.is_null()) {
            return Result<nlohmann::json, Error>::Err(Fail(Error::Make(
                operation, Target(),
                "error id " + failure.id.dump() + " does not match request id " + id.dump(),
                ErrorCategory::Protocol)));
        }
        return Result<nlohmann::json, Error>::Err(
            Error::FromRpcError(operation, Target(), failure.code, failure.message));
    }
}

// ---------------------------------------------------------------------------
// Teardown
// ---------------------------------------------------------------------------
Error ToolServerSession::Fail(Error error) {
    if (child_) {
        child_->Kill();
        if (!error.stderr_text.has_value()) {
            auto captured = TrimWhitespace(child_->DrainStderr());
            if (!captured.empty()) {
                error.stderr_text = std::move(captured);
            }
        }
        child_->CloseStreams();
        child_.reset();
    }
    state_ = SessionState::Terminated;
    LogWarn(kComponent, error.ToString());
    return error;
}

void ToolServerSession::Shutdown() {
    if (!child_) {
        state_ = SessionState::Terminated;
        return;
    }
    state_ = SessionState::ShuttingDown;

    if (child_->IsRunning()) {
        auto notified = child_->Write(EncodeMessage(MakeNotification(rpc_method::kServerExit)),
                                      Deadline::After(kExitNotifyWait));
        if (notified.IsErr()) {
            LogDebug(kComponent, "exit notification not delivered: " + notified.Error().message);
        }
        child_->CloseStdin();

        if (!child_->WaitForExit(options_.exit_wait)) {
            child_->Terminate();
            if (!child_->WaitForExit(options_.terminate_wait)) {
                LogWarn(kComponent, "server ignored SIGTERM, killing pid " +
                                    std::to_string(child_->Pid()));
                child_->Kill();
            }
        }
    }

    // Drain what fits in the bounded stderr buffer so the child never blocks on it.
    auto tail = TrimWhitespace(child_->DrainStderr());
    if (!tail.empty()) {
        LogDebug(kComponent, "server stderr: " + tail);
    }
    child_->CloseStreams();
    child_.reset();
    state_ = SessionState::Terminated;
}

} // namespace mcp_host
