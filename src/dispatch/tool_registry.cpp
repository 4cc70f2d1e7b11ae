#include <mcp_host/dispatch/tool_registry.hpp>

#include <mcp_host/core/log.hpp>
#include <mcp_host/invoker/executable_invoker.hpp>
#include <mcp_host/invoker/git_invoker.hpp>
#include <mcp_host/invoker/session_invoker.hpp>

#include <filesystem>
#include <optional>

#include <unistd.h>

namespace fs = std::filesystem;

namespace mcp_host {

namespace {

constexpr const char* kComponent = "registry";

bool IsDirectory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool IsRegularFile(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool IsExecutableFile(const fs::path& path) {
    return IsRegularFile(path) && ::access(path.c_str(), X_OK) == 0;
}

SessionOptions MakeSessionOptions(const AppConfig& config, std::vector<std::string> command) {
    SessionOptions options;
    options.command = std::move(command);
    options.start_grace = std::chrono::milliseconds(config.timeouts.start_grace_ms);
    options.exit_wait = std::chrono::milliseconds(config.timeouts.exit_wait_ms);
    options.terminate_wait = std::chrono::milliseconds(config.timeouts.terminate_wait_ms);
    return options;
}

// Configured binary first, then <root>/hello/hello_server, then the script.
std::optional<std::vector<std::string>> FindHelloServer(const AppConfig& config) {
    if (config.tools.hello_server.has_value()) {
        if (IsExecutableFile(*config.tools.hello_server)) {
            return std::vector<std::string>{*config.tools.hello_server};
        }
        LogWarn(kComponent, "configured hello server is not executable: " +
                *config.tools.hello_server);
    }
    const fs::path dir = fs::path(config.tools.root) / "hello";
    if (!IsDirectory(dir)) {
        return std::nullopt;
    }
    if (IsExecutableFile(dir / "hello_server")) {
        return std::vector<std::string>{(dir / "hello_server").string()};
    }
    if (IsRegularFile(dir / "hello_server.py")) {
        return std::vector<std::string>{config.tools.interpreter,
                                        (dir / "hello_server.py").string()};
    }
    LogDebug(kComponent, "no hello server in " + dir.string());
    return std::nullopt;
}

} // anonymous namespace

void ToolRegistry::Register(Target target, std::unique_ptr<IToolInvoker> invoker) {
    LogDebug(kComponent, std::string("registered ") + TargetName(target));
    tools_.insert_or_assign(target, ToolDescriptor{TargetName(target), target, std::move(invoker)});
}

std::size_t ToolRegistry::Discover(const AppConfig& config) {
    if (!tools_.empty()) {
        LogDebug(kComponent, "discovery skipped: registry already populated");
        return 0;
    }

    const fs::path root(config.tools.root);
    const double timeout = config.timeouts.tool_seconds;

    if (auto command = FindHelloServer(config)) {
        Register(Target::Hello,
                 std::make_unique<SessionInvoker>(
                     "hello", "hello", MakeSessionOptions(config, std::move(*command)),
                     timeout));
    }

    const fs::path git_dir = root / "git";
    if (IsDirectory(git_dir)) {
        GitToolSpec spec;
        spec.script = (git_dir / "git_client.py").string();
        spec.interpreter = config.tools.interpreter;
        spec.default_repository = config.tools.git_repository;
        Register(Target::Git, std::make_unique<GitInvoker>(std::move(spec), timeout));
    }

    const fs::path cve_dir = root / "cve" / "client";
    if (IsDirectory(cve_dir)) {
        ExecutableToolSpec spec;
        spec.name = "cve";
        spec.directory = cve_dir.string();
        spec.script_name = "client.py";
        spec.binary_name = "client";
        spec.shell_name = "client.sh";
        spec.interpreter = config.tools.interpreter;
        auto invoker = std::make_unique<ExecutableInvoker>(std::move(spec), timeout);
        // A directory with no runnable client keeps the built-in handler.
        if (invoker->Available()) {
            Register(Target::Cve, std::move(invoker));
        } else {
            LogInfo(kComponent, "no runnable client under " + cve_dir.string() +
                    ", keeping the built-in cve handler");
        }
    }

    LogInfo(kComponent, "discovered " + std::to_string(tools_.size()) +
            " tool(s) under " + root.string());
    return tools_.size();
}

IToolInvoker* ToolRegistry::Find(Target target) const {
    auto it = tools_.find(target);
    if (it == tools_.end()) {
        return nullptr;
    }
    return it->second.invoker.get();
}

std::vector<const ToolDescriptor*> ToolRegistry::Tools() const {
    std::vector<const ToolDescriptor*> out;
    out.reserve(tools_.size());
    for (const auto& [target, descriptor] : tools_) {
        out.push_back(&descriptor);
    }
    return out;
}

} // namespace mcp_host
