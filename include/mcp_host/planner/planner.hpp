#pragma once

#include <mcp_host/core/result.hpp>
#include <mcp_host/dispatch/plan.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace mcp_host {

// ---------------------------------------------------------------------------
// IPlanner - turns free text into a Plan. Allowed to be slow or to fail;
// callers go through PlanWithBudget.
// ---------------------------------------------------------------------------
class IPlanner {
public:
    virtual ~IPlanner() = default;

    IPlanner(const IPlanner&) = delete;
    IPlanner& operator=(const IPlanner&) = delete;
    IPlanner(IPlanner&&) = delete;
    IPlanner& operator=(IPlanner&&) = delete;

    [[nodiscard]] virtual Result<Plan, Error> MakePlan(const std::string& text) = 0;
    [[nodiscard]] virtual std::string Name() const = 0;

protected:
    IPlanner() = default;
};

// {intent: "run_diagnostics", target: "inspector", args: {}}
[[nodiscard]] Plan DefaultPlan();

// Strict JSON first; otherwise the span from the first '{' to the last '}'.
[[nodiscard]] Result<Plan, Error> ParsePlanText(std::string_view text);

// ---------------------------------------------------------------------------
// PlanWithBudget - run the planner on a worker thread and wait at most
// `budget`. A failure or an overrun yields DefaultPlan() and a warning. An
// overrunning worker is detached and keeps the planner alive until it ends.
// It may outlive main(); the global logger is never destroyed for that
// reason, and planners must not log through anything with static lifetime
// of their own.
// ---------------------------------------------------------------------------
[[nodiscard]] Plan PlanWithBudget(std::shared_ptr<IPlanner> planner,
                                  const std::string& text,
                                  std::chrono::milliseconds budget);

} // namespace mcp_host
