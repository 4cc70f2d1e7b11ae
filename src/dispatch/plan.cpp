#include <mcp_host/dispatch/plan.hpp>

namespace mcp_host {

namespace {

Error PlanError(const std::string& message) {
    return Error::Make("Plan::FromJson", "", message, ErrorCategory::Validation);
}

} // anonymous namespace

Result<Plan, Error> Plan::FromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Result<Plan, Error>::Err(PlanError("plan must be a JSON object"));
    }

    Plan plan;
    if (auto it = j.find("intent"); it != j.end() && !it->is_null()) {
        if (!it->is_string()) {
            return Result<Plan, Error>::Err(PlanError("'intent' must be a string"));
        }
        plan.intent = it->get<std::string>();
    }
    if (auto it = j.find("target"); it != j.end() && !it->is_null()) {
        if (!it->is_string()) {
            return Result<Plan, Error>::Err(PlanError("'target' must be a string"));
        }
        plan.target = it->get<std::string>();
    }
    if (auto it = j.find("args"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) {
            return Result<Plan, Error>::Err(PlanError("'args' must be a JSON object"));
        }
        plan.args = *it;
    }
    return Result<Plan, Error>::Ok(std::move(plan));
}

nlohmann::json Plan::ToJson() const {
    return {
        {"intent", intent},
        {"target", target.has_value() ? nlohmann::json(*target) : nlohmann::json(nullptr)},
        {"args", args},
    };
}

} // namespace mcp_host
