#include <mcp_host/dispatch/target.hpp>

namespace mcp_host {

const char* TargetName(Target target) {
    switch (target) {
        case Target::Hello:          return "hello";
        case Target::Git:            return "git";
        case Target::Cve:            return "cve";
        case Target::Pfcm:           return "pfcm";
        case Target::ProductOptions: return "product_options";
        case Target::Inspector:      return "inspector";
    }
    return "unknown";
}

std::optional<Target> ParseTarget(std::string_view name) {
    for (auto target : kAllTargets) {
        if (name == TargetName(target)) {
            return target;
        }
    }
    return std::nullopt;
}

bool HasBuiltinHandler(Target target) {
    switch (target) {
        case Target::Hello:
        case Target::Git:
            return false;
        case Target::Cve:
        case Target::Pfcm:
        case Target::ProductOptions:
        case Target::Inspector:
            return true;
    }
    return false;
}

} // namespace mcp_host
