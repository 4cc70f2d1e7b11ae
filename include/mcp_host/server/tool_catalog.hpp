#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_host {

// ---------------------------------------------------------------------------
// ToolSchema - what a tool server advertises in tools/list.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ToolOutput - content blocks returned by a tools/call handler.
// ---------------------------------------------------------------------------
struct ToolOutput {
    bool is_error = false;
    nlohmann::json content = nlohmann::json::array();

    static ToolOutput Text(const std::string& text, bool is_error = false);
};

// Handlers may throw; the server turns exceptions into -32000 errors.
using ToolHandler = std::function<ToolOutput(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolCatalog - the tools one RPC tool server exposes, in registration order.
// ---------------------------------------------------------------------------
class ToolCatalog {
public:
    // Re-registering a name replaces the handler and schema in place.
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;
    [[nodiscard]] const ToolSchema* FindSchema(const std::string& name) const;

    // Precondition: HasTool(name).
    [[nodiscard]] ToolOutput Execute(const std::string& name,
                                     const nlohmann::json& arguments) const;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

/// Names listed in schema["required"] that are missing from `arguments`.
[[nodiscard]] std::vector<std::string> MissingRequiredArguments(
    const ToolSchema& schema, const nlohmann::json& arguments);

/// Names in `arguments` whose value does not match the JSON type declared
/// for them in schema["properties"]. Undeclared names are not checked.
[[nodiscard]] std::vector<std::string> MistypedArguments(
    const ToolSchema& schema, const nlohmann::json& arguments);

} // namespace mcp_host
