#pragma once

#include <mcp_host/config/app_config.hpp>
#include <mcp_host/core/result.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace mcp_host {

constexpr const char* kToolsRootEnv   = "MCP_HOST_TOOLS_ROOT";
constexpr const char* kToolTimeoutEnv = "MCP_HOST_TOOL_TIMEOUT";
constexpr const char* kOllamaModelEnv = "OLLAMA_MODEL";
constexpr const char* kOllamaHostEnv  = "OLLAMA_HOST";

// Environment access; tests substitute a map.
using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

[[nodiscard]] EnvLookup ProcessEnvironment();

enum class CliCommand {
    None,
    Plan,
    Dispatch,
    Tools,
};

// ---------------------------------------------------------------------------
// CliOptions - what the command line said, before merging. Unset optionals
// leave lower-precedence sources in charge.
// ---------------------------------------------------------------------------
struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> tools_root;
    std::optional<double> timeout_seconds;
    std::optional<std::string> planner;
    std::optional<std::string> model;
    bool verbose = false;
    bool json_log = false;
    bool no_color = false;
    bool version = false;

    CliCommand command = CliCommand::None;
    std::string plan_text;           // plan
    std::string target;              // dispatch
    std::string intent;              // dispatch
    std::string args_json = "{}";    // dispatch
};

// Parse `mcp-host [global options] <plan|dispatch|tools> ...`.
Result<CliOptions, Error> ParseCommandLine(int argc, const char* const* argv);

// Parse a YAML config file on top of `base`; keys absent from the file keep
// their value from `base`.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path, AppConfig base = {});

// MCP_HOST_TOOLS_ROOT, OLLAMA_MODEL, OLLAMA_HOST.
AppConfig ApplyEnvironment(AppConfig config, const EnvLookup& env);

AppConfig ApplyCli(AppConfig config, const CliOptions& cli);

// defaults < YAML (-c) < environment < CLI, then validated.
Result<AppConfig, Error> ResolveConfig(const CliOptions& cli, const EnvLookup& env);

Result<void, Error> ValidateConfig(const AppConfig& config);

// Per-call tool timeout: MCP_HOST_TOOL_TIMEOUT when it holds a positive
// number of seconds, otherwise `configured`. Read on every call.
[[nodiscard]] double ResolveToolTimeout(double configured,
                                        const EnvLookup& env = ProcessEnvironment());

} // namespace mcp_host
