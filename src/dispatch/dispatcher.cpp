#include <mcp_host/dispatch/dispatcher.hpp>

#include <mcp_host/core/log.hpp>

#include <cstdlib>

namespace mcp_host {

namespace {

constexpr const char* kComponent = "dispatch";

DispatchOutcome Unsupported(const Plan& plan) {
    DispatchOutcome outcome;
    outcome.plan = plan;
    outcome.ok = false;
    outcome.unsupported = true;
    outcome.result = {
        {"status", "unsupported_target"},
        {"target", plan.target.has_value() ? nlohmann::json(*plan.target)
                                           : nlohmann::json(nullptr)},
    };
    return outcome;
}

} // anonymous namespace

std::optional<nlohmann::json> BuiltinResult(Target target, const nlohmann::json& args) {
    switch (target) {
        case Target::Hello:
        case Target::Git:
            return std::nullopt;
        case Target::Cve:
            return nlohmann::json{{"affected", false}, {"checked", args}};
        case Target::Pfcm:
            return nlohmann::json{{"status", "ok"},
                                  {"changes", nlohmann::json::array({"PCD:X=1"})}};
        case Target::ProductOptions:
            return nlohmann::json{{"status", "ok"},
                                  {"message", "product options queried"},
                                  {"args", args}};
        case Target::Inspector:
            return nlohmann::json{{"status", "ok"},
                                  {"checks", nlohmann::json::array({"env", "network", "permissions"})}};
    }
    return std::nullopt;
}

Dispatcher::Dispatcher(const ToolRegistry& registry)
    : registry_(registry) {}

DispatchOutcome Dispatcher::Dispatch(const Plan& plan) const {
    const auto target = plan.target.has_value() ? ParseTarget(*plan.target) : std::nullopt;
    if (!target.has_value()) {
        LogInfo(kComponent, "unsupported target '" + plan.target.value_or("") + "'");
        return Unsupported(plan);
    }

    if (auto* invoker = registry_.Find(*target)) {
        LogInfo(kComponent, std::string("dispatching to ") + TargetName(*target));
        auto result = invoker->Invoke(plan.args);
        if (!result.IsWellFormed()) {
            LogError(kComponent, std::string("invoker for ") + TargetName(*target) +
                     " returned a malformed result: " + result.ToJson().dump());
            std::abort();
        }

        DispatchOutcome outcome;
        outcome.plan = plan;
        outcome.ok = result.ok;
        outcome.failure = result.failure;
        outcome.result = result.ToJson();
        return outcome;
    }

    if (auto builtin = BuiltinResult(*target, plan.args)) {
        LogDebug(kComponent, std::string("built-in handler for ") + TargetName(*target));
        DispatchOutcome outcome;
        outcome.plan = plan;
        outcome.ok = true;
        outcome.result = std::move(*builtin);
        return outcome;
    }

    LogInfo(kComponent, std::string("no tool registered for ") + TargetName(*target));
    return Unsupported(plan);
}

} // namespace mcp_host
