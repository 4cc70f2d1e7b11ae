#include <mcp_host/planner/planner.hpp>

#include <mcp_host/core/log.hpp>

#include <future>
#include <thread>

namespace mcp_host {

namespace {
constexpr const char* kComponent = "planner";
} // anonymous namespace

Plan DefaultPlan() {
    Plan plan;
    plan.intent = "run_diagnostics";
    plan.target = "inspector";
    plan.args = nlohmann::json::object();
    return plan;
}

Result<Plan, Error> ParsePlanText(std::string_view text) {
    auto parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        const auto start = text.find('{');
        const auto end = text.rfind('}');
        if (start == std::string_view::npos || end == std::string_view::npos || end <= start) {
            return Result<Plan, Error>::Err(Error::Make(
                "ParsePlanText", "", "planner reply contains no JSON object",
                ErrorCategory::Planner));
        }
        parsed = nlohmann::json::parse(text.substr(start, end - start + 1), nullptr, false);
        if (parsed.is_discarded()) {
            return Result<Plan, Error>::Err(Error::Make(
                "ParsePlanText", "", "planner reply is not valid JSON",
                ErrorCategory::Planner));
        }
    }

    auto plan = Plan::FromJson(parsed);
    if (plan.IsErr()) {
        auto error = std::move(plan).Error();
        error.category = ErrorCategory::Planner;
        return Result<Plan, Error>::Err(std::move(error));
    }
    return plan;
}

Plan PlanWithBudget(std::shared_ptr<IPlanner> planner,
                    const std::string& text,
                    std::chrono::milliseconds budget) {
    auto promise = std::make_shared<std::promise<Result<Plan, Error>>>();
    auto future = promise->get_future();
    const std::string name = planner->Name();

    std::thread worker([planner = std::move(planner), promise, text]() {
        try {
            promise->set_value(planner->MakePlan(text));
        } catch (const std::exception& e) {
            promise->set_value(Result<Plan, Error>::Err(Error::Make(
                "IPlanner::MakePlan", "", e.what(), ErrorCategory::Planner)));
        }
    });
    worker.detach();

    if (future.wait_for(budget) != std::future_status::ready) {
        LogWarn(kComponent, name + " planner exceeded its " +
                std::to_string(budget.count()) + "ms budget; using default plan");
        return DefaultPlan();
    }

    auto result = future.get();
    if (result.IsErr()) {
        LogWarn(kComponent, name + " planner failed: " + result.Error().message +
                "; using default plan");
        return DefaultPlan();
    }
    LogDebug(kComponent, "plan: " + result.Value().ToJson().dump());
    return std::move(result).Value();
}

} // namespace mcp_host
