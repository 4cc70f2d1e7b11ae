#pragma once

#include <mcp_host/planner/planner.hpp>

namespace mcp_host {

// Keyword routing without any model:
//   cve / CVE-YYYY-N    -> cve {cve}
//   pfcm                -> pfcm
//   "product option"    -> product_options
//   hello / greet       -> hello {message}
//   git, commit, branch, checkout -> git {cmd[, message]}
//   anything else       -> inspector
class HeuristicPlanner : public IPlanner {
public:
    HeuristicPlanner() = default;

    [[nodiscard]] Result<Plan, Error> MakePlan(const std::string& text) override;
    [[nodiscard]] std::string Name() const override { return "heuristic"; }
};

} // namespace mcp_host
