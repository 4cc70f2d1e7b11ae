#include <mcp_host/protocol/wire_protocol.hpp>

#include <type_traits>

namespace mcp_host {

namespace {

constexpr const char* kJsonRpcVersion = "2.0";

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

Result<RpcMessage, RpcDecodeError> DecodeFailure(int code, std::string message,
                                                 nlohmann::json id = nullptr) {
    return Result<RpcMessage, RpcDecodeError>::Err(
        RpcDecodeError{code, std::move(message), std::move(id)});
}

bool IsValidId(const nlohmann::json& id) {
    return id.is_number_integer() || id.is_number_unsigned() || id.is_string() ||
           id.is_null();
}

std::string_view TrimLineEnd(std::string_view line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }
    return line;
}

} // anonymous namespace

nlohmann::json ToJson(const RpcMessage& message) {
    return std::visit(Overloaded{
        [](const RpcRequest& m) {
            nlohmann::json j = {
                {"jsonrpc", kJsonRpcVersion}, {"id", m.id}, {"method", m.method}};
            if (m.params) {
                j["params"] = *m.params;
            }
            return j;
        },
        [](const RpcNotification& m) {
            nlohmann::json j = {{"jsonrpc", kJsonRpcVersion}, {"method", m.method}};
            if (m.params) {
                j["params"] = *m.params;
            }
            return j;
        },
        [](const RpcResponse& m) {
            return nlohmann::json{
                {"jsonrpc", kJsonRpcVersion}, {"id", m.id}, {"result", m.result}};
        },
        [](const RpcErrorResponse& m) {
            nlohmann::json error = {{"code", m.code}, {"message", m.message}};
            if (m.data) {
                error["data"] = *m.data;
            }
            return nlohmann::json{
                {"jsonrpc", kJsonRpcVersion}, {"id", m.id}, {"error", error}};
        },
    }, message);
}

std::string EncodeMessage(const RpcMessage& message) {
    // dump() with no indent never emits raw newlines; string contents are escaped.
    auto line = ToJson(message).dump(-1, ' ', false,
                                     nlohmann::json::error_handler_t::replace);
    line.push_back('\n');
    return line;
}

void WriteMessage(std::ostream& out, const RpcMessage& message) {
    out << EncodeMessage(message);
    out.flush();
}

namespace {

Result<RpcMessage, RpcDecodeError> DecodeObject(nlohmann::json& j) {
    if (!j.is_object()) {
        return DecodeFailure(rpc_error::kInvalidRequest,
                             "Invalid Request: message is not an object");
    }

    const bool has_id = j.contains("id");
    nlohmann::json id = has_id ? j["id"] : nlohmann::json(nullptr);

    // A notification-shaped line never gets an answer, even when malformed.
    const bool notification_shaped = !has_id && j.contains("method");
    auto fail = [&](int code, std::string message) {
        RpcDecodeError error{code, std::move(message), id};
        error.no_reply = notification_shaped;
        return Result<RpcMessage, RpcDecodeError>::Err(std::move(error));
    };

    if (has_id && !IsValidId(id)) {
        return DecodeFailure(rpc_error::kInvalidRequest,
                             "Invalid Request: id must be a string or integer");
    }

    auto version = j.find("jsonrpc");
    if (version == j.end() || *version != kJsonRpcVersion) {
        return fail(rpc_error::kInvalidRequest, "Invalid JSON-RPC version");
    }

    std::optional<nlohmann::json> params;
    if (auto p = j.find("params"); p != j.end()) {
        params = *p;
    }

    if (auto method = j.find("method"); method != j.end()) {
        if (!method->is_string()) {
            return fail(rpc_error::kInvalidRequest,
                        "Invalid Request: method must be a string");
        }
        if (!has_id) {
            return Result<RpcMessage, RpcDecodeError>::Ok(
                RpcNotification{method->get<std::string>(), std::move(params)});
        }
        return Result<RpcMessage, RpcDecodeError>::Ok(
            RpcRequest{std::move(id), method->get<std::string>(), std::move(params)});
    }

    if (!has_id) {
        return DecodeFailure(rpc_error::kInvalidRequest,
                             "Invalid Request: response without id");
    }

    if (auto error = j.find("error"); error != j.end()) {
        if (!error->is_object() || !error->contains("code") ||
            !(*error)["code"].is_number_integer()) {
            return DecodeFailure(rpc_error::kInvalidRequest,
                                 "Invalid Request: malformed error object", id);
        }
        RpcErrorResponse response;
        response.id = std::move(id);
        response.code = (*error)["code"].get<int>();
        if (auto message = error->find("message"); message != error->end()) {
            response.message = message->is_string()
                                   ? message->get<std::string>()
                                   : message->dump(-1, ' ', false,
                                                   nlohmann::json::error_handler_t::replace);
        }
        if (auto data = error->find("data"); data != error->end()) {
            response.data = *data;
        }
        return Result<RpcMessage, RpcDecodeError>::Ok(std::move(response));
    }

    if (auto result = j.find("result"); result != j.end()) {
        return Result<RpcMessage, RpcDecodeError>::Ok(
            RpcResponse{std::move(id), *result});
    }

    return DecodeFailure(rpc_error::kInvalidRequest,
                         "Invalid Request: no method, result or error", id);
}

} // anonymous namespace

Result<RpcMessage, RpcDecodeError> DecodeMessage(std::string_view line) {
    line = TrimLineEnd(line);

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception& e) {
        return DecodeFailure(rpc_error::kParseError,
                             std::string("Parse error: ") + e.what());
    }

    // Peer-controlled values must never escape as json exceptions.
    try {
        return DecodeObject(j);
    } catch (const nlohmann::json::exception& e) {
        return DecodeFailure(rpc_error::kInvalidRequest,
                             std::string("Invalid Request: ") + e.what());
    }
}

bool IsNotificationMethod(std::string_view method) {
    constexpr std::string_view kPrefix = "notifications/";
    return method.substr(0, kPrefix.size()) == kPrefix;
}

RpcMessage MakeRequest(nlohmann::json id, std::string method,
                       std::optional<nlohmann::json> params) {
    return RpcRequest{std::move(id), std::move(method), std::move(params)};
}

RpcMessage MakeNotification(std::string method,
                            std::optional<nlohmann::json> params) {
    return RpcNotification{std::move(method), std::move(params)};
}

RpcMessage MakeResponse(nlohmann::json id, nlohmann::json result) {
    return RpcResponse{std::move(id), std::move(result)};
}

RpcMessage MakeErrorResponse(nlohmann::json id, int code, std::string message) {
    RpcErrorResponse response;
    response.id = std::move(id);
    response.code = code;
    response.message = std::move(message);
    return response;
}

} // namespace mcp_host
