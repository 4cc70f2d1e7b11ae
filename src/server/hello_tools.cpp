#include <mcp_host/server/hello_tools.hpp>

#include <ctime>
#include <stdexcept>

namespace mcp_host {

namespace {

nlohmann::json StringParamSchema(const char* param, const char* description) {
    return {
        {"type", "object"},
        {"properties", {{param, {{"type", "string"}, {"description", description}}}}},
        {"required", nlohmann::json::array({param})},
    };
}

std::string RequireStringArgument(const nlohmann::json& arguments, const char* name) {
    auto it = arguments.find(name);
    if (it == arguments.end() || !it->is_string()) {
        throw std::invalid_argument(std::string("'") + name + "' must be a string");
    }
    return it->get<std::string>();
}

} // anonymous namespace

std::string LocalTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return buf;
}

std::string FormatHello(const std::string& message, const std::string& timestamp) {
    return "hello: " + message + " @ " + timestamp;
}

ToolCatalog MakeHelloCatalog(TimestampFn clock) {
    ToolCatalog catalog;

    catalog.Register(
        "hello",
        "Return a greeting containing the provided message and the current local date-time.",
        StringParamSchema("message", "Text to echo back"),
        [clock](const nlohmann::json& arguments) {
            return ToolOutput::Text(FormatHello(RequireStringArgument(arguments, "message"),
                                                clock()));
        });

    catalog.Register(
        "greeting",
        "Get a personalized greeting.",
        StringParamSchema("name", "Who to greet"),
        [](const nlohmann::json& arguments) {
            return ToolOutput::Text("Hello, " + RequireStringArgument(arguments, "name") + "!");
        });

    return catalog;
}

} // namespace mcp_host
