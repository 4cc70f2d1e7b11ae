#include <mcp_host/invoker/git_invoker.hpp>

#include <mcp_host/config/config_loader.hpp>
#include <mcp_host/core/log.hpp>

#include <array>
#include <filesystem>
#include <utility>

namespace mcp_host {

namespace {

constexpr const char* kOperation = "GitInvoker::Invoke";

constexpr std::array<std::pair<GitCommand, const char*>, 15> kVerbs = {{
    {GitCommand::Status, "status"},
    {GitCommand::Diff, "diff"},
    {GitCommand::DiffStaged, "diff-staged"},
    {GitCommand::DiffUnstaged, "diff-unstaged"},
    {GitCommand::Add, "add"},
    {GitCommand::Reset, "reset"},
    {GitCommand::Commit, "commit"},
    {GitCommand::Log, "log"},
    {GitCommand::CreateBranch, "create-branch"},
    {GitCommand::Checkout, "checkout"},
    {GitCommand::Show, "show"},
    {GitCommand::Init, "init"},
    {GitCommand::Branch, "branch"},
    {GitCommand::Tools, "tools"},
    {GitCommand::Call, "call"},
}};

Error Invalid(const std::string& message) {
    return Error::Make(kOperation, "git", message, ErrorCategory::Validation);
}

using Argv = std::vector<std::string>;
using ArgvResult = Result<Argv, Error>;

// Required non-empty string field.
Result<std::string, Error> RequireString(const nlohmann::json& args,
                                         const char* key,
                                         GitCommand command) {
    auto it = args.find(key);
    if (it == args.end() || !it->is_string() || it->get<std::string>().empty()) {
        return Result<std::string, Error>::Err(
            Invalid(std::string(GitCommandName(command)) + " requires '" + key + "'"));
    }
    return Result<std::string, Error>::Ok(it->get<std::string>());
}

std::optional<std::string> OptionalString(const nlohmann::json& args, const char* key) {
    auto it = args.find(key);
    if (it == args.end() || !it->is_string() || it->get<std::string>().empty()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// Integer field with a default; a present non-integer is a validation error.
Result<long long, Error> IntegerOr(const nlohmann::json& args, const char* key,
                                   long long fallback) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) {
        return Result<long long, Error>::Ok(fallback);
    }
    if (!it->is_number_integer()) {
        return Result<long long, Error>::Err(
            Invalid(std::string("'") + key + "' must be an integer"));
    }
    const auto value = it->get<long long>();
    if (value < 0) {
        return Result<long long, Error>::Err(
            Invalid(std::string("'") + key + "' must not be negative"));
    }
    return Result<long long, Error>::Ok(value);
}

ArgvResult ContextLinesVerb(const char* verb, const nlohmann::json& args) {
    auto lines = IntegerOr(args, "context_lines", 3);
    if (lines.IsErr()) return ArgvResult::Err(lines.Error());
    return ArgvResult::Ok(Argv{verb, "--context-lines", std::to_string(lines.Value())});
}

} // anonymous namespace

std::optional<GitCommand> ParseGitCommand(std::string_view verb) {
    for (const auto& [command, name] : kVerbs) {
        if (verb == name) {
            return command;
        }
    }
    return std::nullopt;
}

const char* GitCommandName(GitCommand command) {
    for (const auto& [candidate, name] : kVerbs) {
        if (candidate == command) {
            return name;
        }
    }
    return "unknown";
}

Result<std::vector<std::string>, Error> BuildGitVerbArgs(GitCommand command,
                                                         const nlohmann::json& args) {
    switch (command) {
    case GitCommand::Status:
    case GitCommand::Reset:
    case GitCommand::Init:
    case GitCommand::Tools:
        return ArgvResult::Ok(Argv{GitCommandName(command)});

    case GitCommand::DiffStaged:
    case GitCommand::DiffUnstaged:
        return ContextLinesVerb(GitCommandName(command), args);

    case GitCommand::Diff: {
        auto target = RequireString(args, "target", command);
        if (target.IsErr()) return ArgvResult::Err(target.Error());
        auto lines = IntegerOr(args, "context_lines", 3);
        if (lines.IsErr()) return ArgvResult::Err(lines.Error());
        return ArgvResult::Ok(Argv{"diff", "--target", target.Value(),
                               "--context-lines", std::to_string(lines.Value())});
    }

    case GitCommand::Add: {
        auto it = args.find("files");
        Argv argv{"add", "--files"};
        if (it != args.end() && it->is_string() && !it->get<std::string>().empty()) {
            argv.push_back(it->get<std::string>());
        } else if (it != args.end() && it->is_array()) {
            for (const auto& file : *it) {
                if (!file.is_string() || file.get<std::string>().empty()) {
                    return ArgvResult::Err(Invalid("add: 'files' must contain only file names"));
                }
                argv.push_back(file.get<std::string>());
            }
        }
        if (argv.size() == 2) {
            return ArgvResult::Err(Invalid("add requires a non-empty 'files' list"));
        }
        return ArgvResult::Ok(std::move(argv));
    }

    case GitCommand::Commit: {
        auto message = RequireString(args, "message", command);
        if (message.IsErr()) return ArgvResult::Err(message.Error());
        return ArgvResult::Ok(Argv{"commit", "--message", message.Value()});
    }

    case GitCommand::Log: {
        auto count = IntegerOr(args, "max_count", 10);
        if (count.IsErr()) return ArgvResult::Err(count.Error());
        return ArgvResult::Ok(Argv{"log", "--max-count", std::to_string(count.Value())});
    }

    case GitCommand::CreateBranch: {
        auto name = RequireString(args, "name", command);
        if (name.IsErr()) return ArgvResult::Err(name.Error());
        Argv argv{"create-branch", "--name", name.Value()};
        if (auto start = OptionalString(args, "start_point")) {
            argv.push_back("--start-point");
            argv.push_back(*start);
        }
        return ArgvResult::Ok(std::move(argv));
    }

    case GitCommand::Checkout: {
        auto name = RequireString(args, "name", command);
        if (name.IsErr()) return ArgvResult::Err(name.Error());
        return ArgvResult::Ok(Argv{"checkout", "--name", name.Value()});
    }

    case GitCommand::Show: {
        auto revision = RequireString(args, "revision", command);
        if (revision.IsErr()) return ArgvResult::Err(revision.Error());
        return ArgvResult::Ok(Argv{"show", "--revision", revision.Value()});
    }

    case GitCommand::Branch: {
        std::string type = OptionalString(args, "type").value_or("local");
        if (type != "local" && type != "remote" && type != "all") {
            return ArgvResult::Err(
                Invalid("branch: 'type' must be local, remote or all, got '" + type + "'"));
        }
        Argv argv{"branch", "--type", type};
        if (auto contains = OptionalString(args, "contains")) {
            argv.push_back("--contains");
            argv.push_back(*contains);
        }
        if (auto not_contains = OptionalString(args, "not_contains")) {
            argv.push_back("--not-contains");
            argv.push_back(*not_contains);
        }
        return ArgvResult::Ok(std::move(argv));
    }

    case GitCommand::Call: {
        auto tool = RequireString(args, "tool", command);
        if (tool.IsErr()) return ArgvResult::Err(tool.Error());
        nlohmann::json payload = nlohmann::json::object();
        if (auto it = args.find("arguments"); it != args.end() && !it->is_null()) {
            if (!it->is_object()) {
                return ArgvResult::Err(Invalid("call: 'arguments' must be a JSON object"));
            }
            payload = *it;
        }
        return ArgvResult::Ok(Argv{"call", "--tool", tool.Value(), "--json", payload.dump()});
    }
    }
    return ArgvResult::Err(Invalid("unhandled git command"));
}

GitInvoker::GitInvoker(GitToolSpec spec,
                       double default_timeout_seconds,
                       ProcessRunnerFn runner)
    : spec_(std::move(spec)),
      default_timeout_seconds_(default_timeout_seconds),
      runner_(std::move(runner)) {}

Result<CommandLine, Error> GitInvoker::BuildCommand(const nlohmann::json& args) const {
    using CommandResult = Result<CommandLine, Error>;
    if (!args.is_object()) {
        return CommandResult::Err(Invalid("arguments must be a JSON object"));
    }
    auto cmd = args.find("cmd");
    if (cmd == args.end() || !cmd->is_string()) {
        return CommandResult::Err(Invalid("missing 'cmd' (e.g. status, diff, commit)"));
    }
    auto command = ParseGitCommand(cmd->get<std::string>());
    if (!command.has_value()) {
        return CommandResult::Err(
            Invalid("unknown git command '" + cmd->get<std::string>() + "'"));
    }
    auto verb = BuildGitVerbArgs(*command, args);
    if (verb.IsErr()) {
        return CommandResult::Err(verb.Error());
    }

    std::string repo = OptionalString(args, "repo").value_or(spec_.default_repository);
    CommandLine argv{spec_.interpreter, spec_.script, "--repo", repo};
    for (auto& part : verb.Value()) {
        argv.push_back(std::move(part));
    }
    return CommandResult::Ok(std::move(argv));
}

InvocationResult GitInvoker::Invoke(const nlohmann::json& args) {
    auto command = BuildCommand(args.is_null() ? nlohmann::json::object() : args);
    if (command.IsErr()) {
        LogInfo("invoker", "git: " + command.Error().message);
        return InvocationResult::Rejected(command.Error().message);
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(spec_.script, ec)) {
        return InvocationResult::NotFound("git", {spec_.script});
    }

    const double timeout = ResolveToolTimeout(default_timeout_seconds_);
    return RunCandidates({command.Value()}, timeout, runner_);
}

nlohmann::json GitInvoker::Describe() {
    nlohmann::json verbs = nlohmann::json::array();
    for (const auto& entry : kVerbs) {
        verbs.push_back(entry.second);
    }
    return {
        {"name", "git"},
        {"kind", "executable"},
        {"script", spec_.script},
        {"repository", spec_.default_repository},
        {"verbs", verbs},
    };
}

} // namespace mcp_host
