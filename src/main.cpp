#include <mcp_host/config/config_loader.hpp>
#include <mcp_host/core/log.hpp>
#include <mcp_host/core/version.hpp>
#include <mcp_host/dispatch/dispatcher.hpp>
#include <mcp_host/dispatch/tool_registry.hpp>
#include <mcp_host/planner/heuristic_planner.hpp>
#include <mcp_host/planner/ollama_planner.hpp>
#include <mcp_host/planner/planner.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <iostream>
#include <memory>
#include <string>

namespace {

using namespace mcp_host;

constexpr int kExitSuccess = 0;

void PrintError(const Error& error, bool json) {
    if (json) {
        std::cerr << error.ToJson() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
}

void InstallLogger(const LogConfig& log) {
    if (log.json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), log.level);
    } else if (log.color && StderrSupportsColor()) {
        InitGlobalLogger(std::make_unique<ColorConsoleSink>(std::cerr), log.level);
    } else {
        InitGlobalLogger(std::make_unique<ConsoleSink>(std::cerr), log.level);
    }
}

std::shared_ptr<IPlanner> MakePlanner(const AppConfig& config) {
    if (config.planner.kind == "ollama") {
        OllamaOptions options;
        options.endpoint = config.planner.endpoint;
        options.model = config.planner.model;
        options.read_timeout = std::chrono::seconds(
            static_cast<long long>(std::ceil(config.timeouts.planner_seconds)));
        return std::make_shared<OllamaPlanner>(std::move(options));
    }
    return std::make_shared<HeuristicPlanner>();
}

int ExitCodeFor(const DispatchOutcome& outcome) {
    if (outcome.ok) {
        return kExitSuccess;
    }
    if (outcome.unsupported) {
        return ErrorCategoryExitCode(ErrorCategory::NotFound);
    }
    return ErrorCategoryExitCode(outcome.failure.value_or(ErrorCategory::Internal));
}

int RunDispatch(const ToolRegistry& registry, const Plan& plan) {
    Dispatcher dispatcher(registry);
    auto outcome = dispatcher.Dispatch(plan);
    std::cout << outcome.Envelope().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return ExitCodeFor(outcome);
}

int HandlePlan(const AppConfig& config, const ToolRegistry& registry, const CliOptions& cli) {
    const auto budget = std::chrono::milliseconds(
        static_cast<long long>(config.timeouts.planner_seconds * 1000.0));
    auto plan = PlanWithBudget(MakePlanner(config), cli.plan_text, budget);
    return RunDispatch(registry, plan);
}

int HandleDispatch(const ToolRegistry& registry, const CliOptions& cli, bool json_errors) {
    auto args = nlohmann::json::parse(cli.args_json, nullptr, /*allow_exceptions=*/false);
    if (args.is_discarded() || !args.is_object()) {
        auto error = Error::Make("dispatch", cli.target,
                                 "--args must be a JSON object", ErrorCategory::Validation);
        PrintError(error, json_errors);
        return error.ExitCode();
    }

    Plan plan;
    plan.intent = cli.intent;
    plan.target = cli.target;
    plan.args = std::move(args);
    return RunDispatch(registry, plan);
}

int HandleTools(const ToolRegistry& registry) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto* descriptor : registry.Tools()) {
        tools.push_back(descriptor->invoker->Describe());
    }
    nlohmann::json builtins = nlohmann::json::array();
    for (auto target : kAllTargets) {
        if (!registry.Has(target) && HasBuiltinHandler(target)) {
            builtins.push_back(TargetName(target));
        }
    }
    std::cout << nlohmann::json{{"tools", tools}, {"builtin", builtins}}
                     .dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto cli_result = ParseCommandLine(argc, argv);
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error(), false);
        return cli_result.Error().ExitCode();
    }
    const auto cli = std::move(cli_result).Value();

    if (cli.version) {
        std::cout << "mcp-host " << kVersion << std::endl;
        return kExitSuccess;
    }

    auto config_result = ResolveConfig(cli, ProcessEnvironment());
    if (config_result.IsErr()) {
        PrintError(config_result.Error(), cli.json_log);
        return config_result.Error().ExitCode();
    }
    const auto config = std::move(config_result).Value();

    InstallLogger(config.log);
    LogDebug("config", "tools root: " + config.tools.root);

    ToolRegistry registry;
    registry.Discover(config);

    switch (cli.command) {
        case CliCommand::Plan:
            return HandlePlan(config, registry, cli);
        case CliCommand::Dispatch:
            return HandleDispatch(registry, cli, config.log.json);
        case CliCommand::Tools:
            return HandleTools(registry);
        case CliCommand::None:
            break;
    }
    return ErrorCategoryExitCode(ErrorCategory::Config);
}
