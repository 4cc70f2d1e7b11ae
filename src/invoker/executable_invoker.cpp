#include <mcp_host/invoker/executable_invoker.hpp>

#include <mcp_host/config/config_loader.hpp>
#include <mcp_host/core/log.hpp>

#include <filesystem>

#include <unistd.h>

namespace fs = std::filesystem;

namespace mcp_host {

namespace {

std::string ScalarToArg(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

std::string FlagName(const std::string& key) {
    std::string flag = "--";
    for (char c : key) {
        flag += (c == '_') ? '-' : c;
    }
    return flag;
}

bool IsRegularFile(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool IsExecutableFile(const fs::path& path) {
    return IsRegularFile(path) && ::access(path.c_str(), X_OK) == 0;
}

} // anonymous namespace

std::vector<std::string> ArgsToArgv(const nlohmann::json& args) {
    std::vector<std::string> argv;
    if (!args.is_object()) {
        return argv;
    }
    for (auto it = args.begin(); it != args.end(); ++it) {
        const auto& value = it.value();
        const auto flag = FlagName(it.key());
        if (value.is_null()) {
            continue;
        }
        if (value.is_boolean()) {
            if (value.get<bool>()) {
                argv.push_back(flag);
            }
            continue;
        }
        if (value.is_array()) {
            if (value.empty()) {
                continue;
            }
            argv.push_back(flag);
            for (const auto& element : value) {
                argv.push_back(ScalarToArg(element));
            }
            continue;
        }
        argv.push_back(flag);
        argv.push_back(ScalarToArg(value));
    }
    return argv;
}

ExecutableInvoker::ExecutableInvoker(ExecutableToolSpec spec,
                                     double default_timeout_seconds,
                                     ProcessRunnerFn runner)
    : spec_(std::move(spec)),
      default_timeout_seconds_(default_timeout_seconds),
      runner_(std::move(runner)) {}

std::vector<CommandLine> ExecutableInvoker::BuildCandidates(
    const nlohmann::json& args,
    std::vector<std::string>* searched) const {
    const auto tail = ArgsToArgv(args);
    const fs::path dir(spec_.directory);
    std::vector<CommandLine> candidates;

    auto add = [&](CommandLine prefix) {
        prefix.insert(prefix.end(), tail.begin(), tail.end());
        candidates.push_back(std::move(prefix));
    };

    if (!spec_.script_name.empty()) {
        const auto path = dir / spec_.script_name;
        if (searched != nullptr) searched->push_back(path.string());
        if (IsRegularFile(path)) {
            add({spec_.interpreter, path.string()});
        }
    }
    if (!spec_.binary_name.empty()) {
        const auto path = dir / spec_.binary_name;
        if (searched != nullptr) searched->push_back(path.string());
        if (IsExecutableFile(path)) {
            add({path.string()});
        }
    }
    if (!spec_.shell_name.empty()) {
        const auto path = dir / spec_.shell_name;
        if (searched != nullptr) searched->push_back(path.string());
        if (IsRegularFile(path)) {
            add({"sh", path.string()});
        }
    }
    return candidates;
}

bool ExecutableInvoker::Available() const {
    return !BuildCandidates(nlohmann::json::object()).empty();
}

InvocationResult ExecutableInvoker::Invoke(const nlohmann::json& args) {
    if (!args.is_null() && !args.is_object()) {
        return InvocationResult::Rejected(spec_.name + ": arguments must be a JSON object");
    }

    std::vector<std::string> searched;
    auto candidates = BuildCandidates(args, &searched);
    if (candidates.empty()) {
        LogWarn("invoker", spec_.name + ": no executable found in " + spec_.directory);
        return InvocationResult::NotFound(spec_.name, std::move(searched));
    }

    const double timeout = ResolveToolTimeout(default_timeout_seconds_);
    auto result = RunCandidates(candidates, timeout, runner_);
    if (!result.ok) {
        LogInfo("invoker", spec_.name + " failed (" + result.Status() + "): " +
                result.error.value_or(""));
    }
    return result;
}

nlohmann::json ExecutableInvoker::Describe() {
    nlohmann::json commands = nlohmann::json::array();
    for (const auto& candidate : BuildCandidates(nlohmann::json::object())) {
        commands.push_back(candidate);
    }
    return {
        {"name", spec_.name},
        {"kind", "executable"},
        {"directory", spec_.directory},
        {"candidates", commands},
    };
}

} // namespace mcp_host
