#include <mcp_host/server/tool_catalog.hpp>

#include <algorithm>
#include <stdexcept>

namespace mcp_host {

ToolOutput ToolOutput::Text(const std::string& text, bool is_error) {
    ToolOutput output;
    output.is_error = is_error;
    output.content = nlohmann::json::array({{{"type", "text"}, {"text", text}}});
    return output;
}

void ToolCatalog::Register(const std::string& name,
                           const std::string& description,
                           const nlohmann::json& input_schema,
                           ToolHandler handler) {
    auto existing = std::find_if(schemas_.begin(), schemas_.end(),
        [&](const ToolSchema& s) { return s.name == name; });
    if (existing != schemas_.end()) {
        *existing = ToolSchema{name, description, input_schema};
    } else {
        schemas_.push_back({name, description, input_schema});
    }
    handlers_[name] = std::move(handler);
}

bool ToolCatalog::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

const ToolSchema* ToolCatalog::FindSchema(const std::string& name) const {
    for (const auto& schema : schemas_) {
        if (schema.name == name) {
            return &schema;
        }
    }
    return nullptr;
}

ToolOutput ToolCatalog::Execute(const std::string& name,
                                const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        throw std::logic_error("ToolCatalog::Execute: unknown tool " + name);
    }
    return it->second(arguments);
}

std::vector<std::string> MissingRequiredArguments(
    const ToolSchema& schema, const nlohmann::json& arguments) {
    std::vector<std::string> missing;
    auto required = schema.input_schema.find("required");
    if (required == schema.input_schema.end() || !required->is_array()) {
        return missing;
    }
    for (const auto& field : *required) {
        if (!field.is_string()) continue;
        const auto key = field.get<std::string>();
        if (!arguments.is_object() || !arguments.contains(key)) {
            missing.push_back(key);
        }
    }
    return missing;
}

namespace {

bool MatchesJsonType(const nlohmann::json& value, const std::string& type) {
    if (type == "string") return value.is_string();
    if (type == "integer") return value.is_number_integer();
    if (type == "number") return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "null") return value.is_null();
    return true;  // unknown or unsupported keyword: accept
}

} // anonymous namespace

std::vector<std::string> MistypedArguments(
    const ToolSchema& schema, const nlohmann::json& arguments) {
    std::vector<std::string> mistyped;
    auto properties = schema.input_schema.find("properties");
    if (properties == schema.input_schema.end() || !properties->is_object() ||
        !arguments.is_object()) {
        return mistyped;
    }
    for (const auto& [key, value] : arguments.items()) {
        auto property = properties->find(key);
        if (property == properties->end() || !property->is_object()) continue;
        auto type = property->find("type");
        if (type == property->end() || !type->is_string()) continue;
        if (!MatchesJsonType(value, type->get<std::string>())) {
            mistyped.push_back(key);
        }
    }
    return mistyped;
}

} // namespace mcp_host
