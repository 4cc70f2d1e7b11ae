#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace mcp_host {

// Every routable target. Unknown names never become a Target; they are
// reported as unsupported by the dispatcher.
enum class Target {
    Hello,
    Git,
    Cve,
    Pfcm,
    ProductOptions,
    Inspector,
};

constexpr std::array<Target, 6> kAllTargets = {
    Target::Hello, Target::Git, Target::Cve,
    Target::Pfcm, Target::ProductOptions, Target::Inspector,
};

/// Wire name: "hello", "git", "cve", "pfcm", "product_options", "inspector".
[[nodiscard]] const char* TargetName(Target target);

/// Exact, case-sensitive inverse of TargetName.
[[nodiscard]] std::optional<Target> ParseTarget(std::string_view name);

/// True for targets the host can answer without any tool process.
[[nodiscard]] bool HasBuiltinHandler(Target target);

} // namespace mcp_host
