#pragma once

#include <mcp_host/server/tool_catalog.hpp>

#include <functional>
#include <string>

namespace mcp_host {

using TimestampFn = std::function<std::string()>;

/// Local time as "YYYY-mm-dd HH:MM:SS".
[[nodiscard]] std::string LocalTimestamp();

/// "hello: <message> @ <timestamp>"
[[nodiscard]] std::string FormatHello(const std::string& message,
                                      const std::string& timestamp);

// Tools served by mcp-hello-server:
//   hello(message)   -> "hello: <message> @ <timestamp>"
//   greeting(name)   -> "Hello, <name>!"
[[nodiscard]] ToolCatalog MakeHelloCatalog(TimestampFn clock = LocalTimestamp);

} // namespace mcp_host
