#pragma once

#include <mcp_host/core/result.hpp>
#include <mcp_host/invoker/candidate_runner.hpp>
#include <mcp_host/invoker/tool_invoker.hpp>
#include <mcp_host/process/process_runner.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_host {

// Verbs understood by the git client script.
enum class GitCommand {
    Status,
    Diff,
    DiffStaged,
    DiffUnstaged,
    Add,
    Reset,
    Commit,
    Log,
    CreateBranch,
    Checkout,
    Show,
    Init,
    Branch,
    Tools,
    Call,
};

[[nodiscard]] std::optional<GitCommand> ParseGitCommand(std::string_view verb);
[[nodiscard]] const char* GitCommandName(GitCommand command);

// ---------------------------------------------------------------------------
// BuildGitVerbArgs - verb-specific argv tail, e.g. commit ->
// ["commit", "--message", "fix"]. Missing or mistyped required fields are a
// Validation error; nothing is spawned for them.
//
// Argument keys: target, context_lines, files, message, max_count, name,
// start_point, revision, type, contains, not_contains, tool, arguments.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<std::vector<std::string>, Error> BuildGitVerbArgs(
    GitCommand command, const nlohmann::json& args);

struct GitToolSpec {
    std::string script;             // <root>/git/git_client.py
    std::string interpreter = "python3";
    std::string default_repository = ".";
};

// ---------------------------------------------------------------------------
// GitInvoker - one fresh git client process per call:
//   <interpreter> <script> --repo <repo> <verb> <flags...>
// `cmd` selects the verb; `repo` overrides the default repository.
// ---------------------------------------------------------------------------
class GitInvoker : public IToolInvoker {
public:
    GitInvoker(GitToolSpec spec,
               double default_timeout_seconds,
               ProcessRunnerFn runner = DefaultProcessRunner());

    [[nodiscard]] InvocationResult Invoke(const nlohmann::json& args) override;
    [[nodiscard]] nlohmann::json Describe() override;

    // The full command for `args`, or the validation error.
    [[nodiscard]] Result<CommandLine, Error> BuildCommand(const nlohmann::json& args) const;

private:
    GitToolSpec spec_;
    double default_timeout_seconds_;
    ProcessRunnerFn runner_;
};

} // namespace mcp_host
