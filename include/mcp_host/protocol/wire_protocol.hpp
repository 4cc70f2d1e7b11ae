#pragma once

#include <mcp_host/core/result.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace mcp_host {

// ---------------------------------------------------------------------------
// JSON-RPC 2.0 error codes used on the host <-> tool server pipe.
// ---------------------------------------------------------------------------
namespace rpc_error {
constexpr int kParseError     = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams  = -32602;
constexpr int kServerError    = -32000;
} // namespace rpc_error

// Method names recognised by both ends.
namespace rpc_method {
constexpr const char* kInitialize = "initialize";
constexpr const char* kToolsList  = "tools/list";
constexpr const char* kToolsCall  = "tools/call";
constexpr const char* kInitialized = "notifications/initialized";
constexpr const char* kServerExit = "server/exit";
} // namespace rpc_method

// ---------------------------------------------------------------------------
// RpcMessage - one line on the wire.
//
// `id` is whatever the requester chose (number or string) and is echoed
// verbatim in the matching response.
// ---------------------------------------------------------------------------
struct RpcRequest {
    nlohmann::json id;
    std::string method;
    std::optional<nlohmann::json> params;
};

struct RpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;
};

struct RpcResponse {
    nlohmann::json id;
    nlohmann::json result;
};

struct RpcErrorResponse {
    nlohmann::json id;  // null when the failing line had no readable id
    int code = rpc_error::kServerError;
    std::string message;
    std::optional<nlohmann::json> data;
};

using RpcMessage =
    std::variant<RpcRequest, RpcNotification, RpcResponse, RpcErrorResponse>;

// ---------------------------------------------------------------------------
// RpcDecodeError - why a line could not be turned into an RpcMessage.
// `id` is recovered when the line was valid JSON, so a server can still
// answer with the right correlation.
// ---------------------------------------------------------------------------
struct RpcDecodeError {
    int code = rpc_error::kParseError;
    std::string message;
    nlohmann::json id;
    bool no_reply = false;  // line had a method and no id

    bool operator==(const RpcDecodeError& other) const {
        return code == other.code && message == other.message && id == other.id;
    }
};

/// Compact single-line JSON terminated by exactly one '\n'.
[[nodiscard]] std::string EncodeMessage(const RpcMessage& message);

/// Parse one line (with or without its trailing newline).
[[nodiscard]] Result<RpcMessage, RpcDecodeError> DecodeMessage(std::string_view line);

/// Encode and write one line, then flush.
void WriteMessage(std::ostream& out, const RpcMessage& message);

/// Structured form of a message (no trailing newline).
[[nodiscard]] nlohmann::json ToJson(const RpcMessage& message);

/// "notifications/..." methods never receive a reply.
[[nodiscard]] bool IsNotificationMethod(std::string_view method);

// Convenience constructors.
[[nodiscard]] RpcMessage MakeRequest(nlohmann::json id, std::string method,
                                     std::optional<nlohmann::json> params = std::nullopt);
[[nodiscard]] RpcMessage MakeNotification(std::string method,
                                          std::optional<nlohmann::json> params = std::nullopt);
[[nodiscard]] RpcMessage MakeResponse(nlohmann::json id, nlohmann::json result);
[[nodiscard]] RpcMessage MakeErrorResponse(nlohmann::json id, int code,
                                           std::string message);

} // namespace mcp_host
