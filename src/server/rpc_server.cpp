#include <mcp_host/server/rpc_server.hpp>

#include <mcp_host/core/log.hpp>

#include <exception>
#include <string>
#include <type_traits>

namespace mcp_host {

namespace {
constexpr const char* kComponent = "rpc-server";
} // anonymous namespace

RpcServer::RpcServer(ServerInfo info,
                     ToolCatalog catalog,
                     std::istream& in,
                     std::ostream& out)
    : info_(std::move(info)), catalog_(std::move(catalog)), in_(in), out_(out) {}

void RpcServer::Run() {
    std::string line;
    while (!exit_requested_ && std::getline(in_, line)) {
        if (line.empty() || line == "\r") continue;

        auto reply = HandleLine(line);
        if (reply) {
            out_ << *reply;
            out_.flush();
        }
    }
    LogDebug(kComponent, exit_requested_ ? "exit requested" : "input closed");
}

std::optional<std::string> RpcServer::HandleLine(std::string_view line) {
    auto decoded = DecodeMessage(line);
    if (decoded.IsErr()) {
        const auto& err = decoded.Error();
        LogWarn(kComponent, "rejected line: " + err.message);
        if (err.no_reply) {
            return std::nullopt;
        }
        return EncodeMessage(MakeErrorResponse(err.id, err.code, err.message));
    }

    auto reply = HandleMessage(decoded.Value());
    if (!reply) {
        return std::nullopt;
    }
    return EncodeMessage(*reply);
}

std::optional<RpcMessage> RpcServer::HandleMessage(const RpcMessage& message) {
    if (const auto* notification = std::get_if<RpcNotification>(&message)) {
        HandleNotification(*notification);
        return std::nullopt;
    }

    const auto* request = std::get_if<RpcRequest>(&message);
    if (request == nullptr) {
        // Responses are never sent to a tool server; nothing to answer.
        LogWarn(kComponent, "ignoring unsolicited response");
        return std::nullopt;
    }

    try {
        if (request->method == rpc_method::kInitialize) {
            return HandleInitialize(request->id);
        }
        if (request->method == rpc_method::kToolsList) {
            return HandleToolsList(request->id);
        }
        if (request->method == rpc_method::kToolsCall) {
            return HandleToolsCall(request->id, request->params);
        }
    } catch (const std::exception& e) {
        LogError(kComponent, request->method + " failed: " + e.what());
        return MakeErrorResponse(request->id, rpc_error::kServerError,
                                 std::string("Server error: ") + e.what());
    }

    return MakeErrorResponse(request->id, rpc_error::kMethodNotFound,
                             "Method not found: " + request->method);
}

void RpcServer::HandleNotification(const RpcNotification& notification) {
    if (notification.method == rpc_method::kServerExit ||
        notification.method == "notifications/exit") {
        exit_requested_ = true;
        return;
    }
    if (notification.method == rpc_method::kInitialized) {
        LogDebug(kComponent, "client initialized");
        return;
    }
    LogDebug(kComponent, "ignoring notification " + notification.method);
}

RpcMessage RpcServer::HandleInitialize(const nlohmann::json& id) {
    initialized_ = true;
    nlohmann::json result = {
        {"protocolVersion", info_.protocol_version},
        {"capabilities", {{"tools", nlohmann::json::object()}}},
        {"serverInfo", {{"name", info_.name}, {"version", info_.version}}},
    };
    return MakeResponse(id, std::move(result));
}

RpcMessage RpcServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& schema : catalog_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema},
        });
    }
    return MakeResponse(id, {{"tools", tools}, {"nextCursor", nullptr}});
}

RpcMessage RpcServer::HandleToolsCall(const nlohmann::json& id,
                                      const std::optional<nlohmann::json>& params) {
    if (!params || !params->is_object()) {
        return MakeErrorResponse(id, rpc_error::kInvalidParams,
                                 "Missing params object");
    }
    auto name = params->find("name");
    if (name == params->end() || !name->is_string()) {
        return MakeErrorResponse(id, rpc_error::kInvalidParams,
                                 "Missing 'name' parameter");
    }
    const auto tool_name = name->get<std::string>();

    auto arguments = params->value("arguments", nlohmann::json::object());
    if (!arguments.is_object()) {
        return MakeErrorResponse(id, rpc_error::kInvalidParams,
                                 "'arguments' must be an object");
    }

    const auto* schema = catalog_.FindSchema(tool_name);
    if (schema == nullptr) {
        return MakeErrorResponse(id, rpc_error::kInvalidParams,
                                 "Unknown tool: " + tool_name);
    }
    auto missing = MissingRequiredArguments(*schema, arguments);
    if (!missing.empty()) {
        return MakeErrorResponse(id, rpc_error::kInvalidParams,
                                 "Missing required argument '" + missing.front() +
                                 "' for tool " + tool_name);
    }
    auto mistyped = MistypedArguments(*schema, arguments);
    if (!mistyped.empty()) {
        return MakeErrorResponse(id, rpc_error::kInvalidParams,
                                 "Argument '" + mistyped.front() +
                                 "' has the wrong type for tool " + tool_name);
    }

    auto output = catalog_.Execute(tool_name, arguments);

    nlohmann::json result;
    result["content"] = output.content;
    if (output.is_error) {
        result["isError"] = true;
    }
    return MakeResponse(id, std::move(result));
}

} // namespace mcp_host
