#pragma once

#include <mcp_host/protocol/wire_protocol.hpp>
#include <mcp_host/server/tool_catalog.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mcp_host {

struct ServerInfo {
    std::string name;
    std::string version;
    std::string protocol_version = "2024-11-05";
};

// ---------------------------------------------------------------------------
// RpcServer - line-delimited JSON-RPC tool server over a pair of streams.
//
// Methods:
//   - initialize
//   - tools/list
//   - tools/call
//   - notifications/* and server/exit (notifications, never answered)
//
// Requests for any other method get -32601. server/exit ends Run().
// ---------------------------------------------------------------------------
class RpcServer {
public:
    RpcServer(ServerInfo info,
              ToolCatalog catalog,
              std::istream& in = std::cin,
              std::ostream& out = std::cout);

    // Serve until EOF on the input stream or a server/exit notification.
    void Run();

    // Handle one raw line; returns the encoded reply line, if any.
    [[nodiscard]] std::optional<std::string> HandleLine(std::string_view line);

    // Handle one decoded message; returns the reply, if any.
    [[nodiscard]] std::optional<RpcMessage> HandleMessage(const RpcMessage& message);

    [[nodiscard]] bool Initialized() const noexcept { return initialized_; }
    [[nodiscard]] bool ExitRequested() const noexcept { return exit_requested_; }

private:
    RpcMessage HandleInitialize(const nlohmann::json& id);
    RpcMessage HandleToolsList(const nlohmann::json& id);
    RpcMessage HandleToolsCall(const nlohmann::json& id,
                               const std::optional<nlohmann::json>& params);
    void HandleNotification(const RpcNotification& notification);

    ServerInfo info_;
    ToolCatalog catalog_;
    std::istream& in_;
    std::ostream& out_;
    bool initialized_ = false;
    bool exit_requested_ = false;
};

} // namespace mcp_host
