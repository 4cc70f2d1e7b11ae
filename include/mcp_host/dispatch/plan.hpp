#pragma once

#include <mcp_host/core/result.hpp>

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_host {

// ---------------------------------------------------------------------------
// Plan - {intent, target, args} as produced by a planner. Immutable once
// handed to the dispatcher. `target` is kept verbatim: an absent or unknown
// target is routed to "unsupported_target", not rejected here.
// ---------------------------------------------------------------------------
struct Plan {
    std::string intent;
    std::optional<std::string> target;
    nlohmann::json args = nlohmann::json::object();

    // Fails only when `j` is not an object, or intent/target/args have the
    // wrong JSON type.
    static Result<Plan, Error> FromJson(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json ToJson() const;

    bool operator==(const Plan& other) const {
        return intent == other.intent && target == other.target && args == other.args;
    }
    bool operator!=(const Plan& other) const { return !(*this == other); }
};

} // namespace mcp_host
