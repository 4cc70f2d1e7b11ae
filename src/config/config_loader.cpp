#include <mcp_host/config/config_loader.hpp>

#include <mcp_host/core/deadline.hpp>
#include <mcp_host/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <vector>

namespace mcp_host {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error::Make("ConfigLoader", "", message, ErrorCategory::Config);
}

// Strict seconds parse: the whole string must be a positive number no larger
// than the longest budget a Deadline can represent.
std::optional<double> ParsePositiveSeconds(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        return std::nullopt;
    }
    if (!std::isfinite(value) || value <= 0.0 || value > Deadline::kMaxBudgetSeconds) {
        return std::nullopt;
    }
    return value;
}

template <typename T>
void ReadIfPresent(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

} // anonymous namespace

EnvLookup ProcessEnvironment() {
    return [](const char* name) -> std::optional<std::string> {
        const char* value = std::getenv(name);
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

// ---------------------------------------------------------------------------
// ParseCommandLine
// ---------------------------------------------------------------------------
Result<CliOptions, Error> ParseCommandLine(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcp-host", kVersion,
                                     argparse::default_arguments::help);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--tools-root")
        .help("Directory holding the tool subdirectories");
    program.add_argument("--timeout")
        .help("Per-call tool timeout in seconds")
        .scan<'g', double>();
    program.add_argument("--planner")
        .help("Planner backend: heuristic or ollama");
    program.add_argument("--model")
        .help("Ollama model name");
    program.add_argument("-v", "--verbose")
        .help("Debug logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--json-log")
        .help("Log as JSON lines on stderr")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    argparse::ArgumentParser plan_cmd("plan");
    plan_cmd.add_description("Plan free text, then dispatch the plan");
    plan_cmd.add_argument("text")
        .help("Request text")
        .nargs(argparse::nargs_pattern::at_least_one);

    argparse::ArgumentParser dispatch_cmd("dispatch");
    dispatch_cmd.add_description("Dispatch a literal plan");
    dispatch_cmd.add_argument("--target")
        .help("Target name")
        .required();
    dispatch_cmd.add_argument("--intent")
        .help("Intent label")
        .default_value(std::string("manual"));
    dispatch_cmd.add_argument("--args")
        .help("Arguments as a JSON object")
        .default_value(std::string("{}"));

    argparse::ArgumentParser tools_cmd("tools");
    tools_cmd.add_description("List discovered tools");

    program.add_subparser(plan_cmd);
    program.add_subparser(dispatch_cmd);
    program.add_subparser(tools_cmd);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions cli;
    if (auto val = program.present("--config")) {
        cli.config_path = *val;
    }
    if (auto val = program.present("--tools-root")) {
        cli.tools_root = *val;
    }
    if (auto val = program.present<double>("--timeout")) {
        cli.timeout_seconds = *val;
    }
    if (auto val = program.present("--planner")) {
        cli.planner = *val;
    }
    if (auto val = program.present("--model")) {
        cli.model = *val;
    }
    cli.verbose = program.get<bool>("--verbose");
    cli.json_log = program.get<bool>("--json-log");
    cli.no_color = program.get<bool>("--no-color");

    if (program.get<bool>("--version")) {
        cli.version = true;
        return Result<CliOptions, Error>::Ok(std::move(cli));
    }

    if (program.is_subcommand_used(plan_cmd)) {
        cli.command = CliCommand::Plan;
        const auto words = plan_cmd.get<std::vector<std::string>>("text");
        for (const auto& word : words) {
            if (!cli.plan_text.empty()) {
                cli.plan_text += ' ';
            }
            cli.plan_text += word;
        }
    } else if (program.is_subcommand_used(dispatch_cmd)) {
        cli.command = CliCommand::Dispatch;
        cli.target = dispatch_cmd.get<std::string>("--target");
        cli.intent = dispatch_cmd.get<std::string>("--intent");
        cli.args_json = dispatch_cmd.get<std::string>("--args");
    } else if (program.is_subcommand_used(tools_cmd)) {
        cli.command = CliCommand::Tools;
    } else {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("Missing command: expected plan, dispatch or tools"));
    }

    return Result<CliOptions, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path, AppConfig base) {
    AppConfig config = std::move(base);
    try {
        YAML::Node root = YAML::LoadFile(std::string(file_path));

        if (const auto tools = root["tools"]) {
            ReadIfPresent(tools, "root", config.tools.root);
            ReadIfPresent(tools, "interpreter", config.tools.interpreter);
            ReadIfPresent(tools, "git_repository", config.tools.git_repository);
            if (tools["hello_server"]) {
                config.tools.hello_server = tools["hello_server"].as<std::string>();
            }
        }

        if (const auto timeouts = root["timeouts"]) {
            ReadIfPresent(timeouts, "tool", config.timeouts.tool_seconds);
            ReadIfPresent(timeouts, "planner", config.timeouts.planner_seconds);
            ReadIfPresent(timeouts, "start_grace_ms", config.timeouts.start_grace_ms);
            ReadIfPresent(timeouts, "exit_wait_ms", config.timeouts.exit_wait_ms);
            ReadIfPresent(timeouts, "terminate_wait_ms", config.timeouts.terminate_wait_ms);
        }

        if (const auto planner = root["planner"]) {
            ReadIfPresent(planner, "kind", config.planner.kind);
            ReadIfPresent(planner, "model", config.planner.model);
            ReadIfPresent(planner, "endpoint", config.planner.endpoint);
        }

        if (const auto log = root["log"]) {
            if (log["level"]) {
                auto text = log["level"].as<std::string>();
                auto level = ParseLogLevel(text);
                if (!level.has_value()) {
                    return Result<AppConfig, Error>::Err(
                        MakeConfigError("Unknown log level: " + text));
                }
                config.log.level = *level;
            }
            ReadIfPresent(log, "json", config.log.json);
            ReadIfPresent(log, "color", config.log.color);
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ApplyEnvironment / ApplyCli
// ---------------------------------------------------------------------------
AppConfig ApplyEnvironment(AppConfig config, const EnvLookup& env) {
    if (auto val = env(kToolsRootEnv); val.has_value() && !val->empty()) {
        config.tools.root = *val;
    }
    if (auto val = env(kOllamaModelEnv); val.has_value() && !val->empty()) {
        config.planner.model = *val;
    }
    if (auto val = env(kOllamaHostEnv); val.has_value() && !val->empty()) {
        config.planner.endpoint = *val;
    }
    return config;
}

AppConfig ApplyCli(AppConfig config, const CliOptions& cli) {
    if (cli.tools_root.has_value()) {
        config.tools.root = *cli.tools_root;
    }
    if (cli.timeout_seconds.has_value()) {
        config.timeouts.tool_seconds = *cli.timeout_seconds;
    }
    if (cli.planner.has_value()) {
        config.planner.kind = *cli.planner;
    }
    if (cli.model.has_value()) {
        config.planner.model = *cli.model;
    }
    if (cli.verbose) {
        config.log.level = LogLevel::Debug;
    }
    if (cli.json_log) {
        config.log.json = true;
    }
    if (cli.no_color) {
        config.log.color = false;
    }
    return config;
}

Result<AppConfig, Error> ResolveConfig(const CliOptions& cli, const EnvLookup& env) {
    AppConfig config;
    if (cli.config_path.has_value()) {
        auto loaded = LoadFromYaml(*cli.config_path, std::move(config));
        if (loaded.IsErr()) {
            return loaded;
        }
        config = std::move(loaded).Value();
    }
    config = ApplyCli(ApplyEnvironment(std::move(config), env), cli);

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(valid.Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.tools.root.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: tools root"));
    }
    if (config.tools.interpreter.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: interpreter"));
    }
    if (!(config.timeouts.tool_seconds > 0.0) ||
        config.timeouts.tool_seconds > Deadline::kMaxBudgetSeconds) {
        return Result<void, Error>::Err(
            MakeConfigError("Tool timeout must be positive and at most one year, got " +
                            std::to_string(config.timeouts.tool_seconds)));
    }
    if (!(config.timeouts.planner_seconds > 0.0) ||
        config.timeouts.planner_seconds > Deadline::kMaxBudgetSeconds) {
        return Result<void, Error>::Err(
            MakeConfigError("Planner timeout must be positive and at most one year, got " +
                            std::to_string(config.timeouts.planner_seconds)));
    }
    if (config.timeouts.start_grace_ms < 0 || config.timeouts.exit_wait_ms < 0 ||
        config.timeouts.terminate_wait_ms < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Session waits must not be negative"));
    }
    if (config.planner.kind != "heuristic" && config.planner.kind != "ollama") {
        return Result<void, Error>::Err(
            MakeConfigError("Unknown planner '" + config.planner.kind +
                            "' (expected heuristic or ollama)"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ResolveToolTimeout
// ---------------------------------------------------------------------------
double ResolveToolTimeout(double configured, const EnvLookup& env) {
    auto raw = env(kToolTimeoutEnv);
    if (!raw.has_value() || raw->empty()) {
        return configured;
    }
    auto parsed = ParsePositiveSeconds(*raw);
    if (!parsed.has_value()) {
        LogWarn("config", std::string("ignoring ") + kToolTimeoutEnv + "='" + *raw +
                "': expected a positive number of seconds, at most one year");
        return configured;
    }
    return *parsed;
}

} // namespace mcp_host
