#pragma once

#include <mcp_host/config/app_config.hpp>
#include <mcp_host/dispatch/target.hpp>
#include <mcp_host/invoker/tool_invoker.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcp_host {

struct ToolDescriptor {
    std::string name;
    Target target;
    std::unique_ptr<IToolInvoker> invoker;
};

// ---------------------------------------------------------------------------
// ToolRegistry - Target -> invoker, populated once before dispatching.
//
// Filesystem layout scanned by Discover, relative to the tools root:
//   hello/hello_server[.py]   persistent tool server (session invoker)
//   git/git_client.py         multi-verb git client (git invoker)
//   cve/client/client{.py,,.sh}  one-shot CVE checker (executable invoker)
// A missing directory is skipped silently.
//
// Registration is a single-threaded initialization phase; lookups afterwards
// may come from any thread.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    // Replaces any previous entry for `target`.
    void Register(Target target, std::unique_ptr<IToolInvoker> invoker);

    // Scan `config.tools.root`. A no-op returning 0 when the registry already
    // has entries; otherwise returns the number of tools registered.
    std::size_t Discover(const AppConfig& config);

    [[nodiscard]] IToolInvoker* Find(Target target) const;
    [[nodiscard]] bool Has(Target target) const { return Find(target) != nullptr; }
    [[nodiscard]] bool Empty() const { return tools_.empty(); }
    [[nodiscard]] std::size_t Size() const { return tools_.size(); }

    // Registered descriptors in Target order.
    [[nodiscard]] std::vector<const ToolDescriptor*> Tools() const;

private:
    std::map<Target, ToolDescriptor> tools_;
};

} // namespace mcp_host
