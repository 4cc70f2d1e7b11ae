#include <mcp_host/invoker/invocation_result.hpp>

#include <mcp_host/core/deadline.hpp>

namespace mcp_host {

namespace {

// Child output is arbitrary bytes; the envelope must always serialise.
// Invalid UTF-8 sequences become U+FFFD.
std::string ValidUtf8(const std::string& text) {
    const auto quoted = nlohmann::json(text).dump(-1, ' ', false,
                                                  nlohmann::json::error_handler_t::replace);
    return nlohmann::json::parse(quoted).get<std::string>();
}

} // anonymous namespace

std::optional<nlohmann::json> ParseJsonOutput(const std::string& text) {
    if (text.empty() || (text.front() != '{' && text.front() != '[')) {
        return std::nullopt;
    }
    auto parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }
    return parsed;
}

std::string InvocationResult::Status() const {
    if (ok) {
        return "ok";
    }
    return ErrorCategoryName(failure.value_or(ErrorCategory::Internal));
}

bool InvocationResult::IsWellFormed() const {
    if (timed_out && ok) return false;
    if (ok && failure.has_value()) return false;
    if (!ok && !failure.has_value()) return false;
    return true;
}

nlohmann::json InvocationResult::ToJson() const {
    nlohmann::json j = {
        {"ok", ok},
        {"status", Status()},
        {"returncode", returncode.has_value() ? nlohmann::json(*returncode) : nlohmann::json(nullptr)},
        {"stdout", ValidUtf8(stdout_text)},
        {"stderr", ValidUtf8(stderr_text)},
        {"timedOut", timed_out},
        {"timeoutSeconds", timeout_seconds},
    };
    if (!command.empty()) {
        nlohmann::json argv = nlohmann::json::array();
        for (const auto& arg : command) {
            argv.push_back(ValidUtf8(arg));
        }
        j["command"] = std::move(argv);
    }
    if (error.has_value()) {
        j["error"] = ValidUtf8(*error);
    }
    if (json.has_value()) {
        j["json"] = *json;
    }
    if (!searched.empty()) {
        nlohmann::json paths = nlohmann::json::array();
        for (const auto& path : searched) {
            paths.push_back(ValidUtf8(path));
        }
        j["searched"] = std::move(paths);
    }
    return j;
}

InvocationResult InvocationResult::FromProcessOutput(const ProcessOutput& output) {
    InvocationResult result;
    result.command = output.command;
    result.returncode = output.returncode;
    result.stdout_text = output.stdout_text;
    result.stderr_text = output.stderr_text;
    result.timed_out = output.timed_out;
    result.timeout_seconds = output.timeout_seconds;
    result.ok = output.Succeeded();
    result.json = ParseJsonOutput(output.stdout_text);

    if (output.timed_out) {
        result.failure = ErrorCategory::Timeout;
        result.error = "timed out after " + FormatSeconds(output.timeout_seconds);
    } else if (!result.ok) {
        result.failure = ErrorCategory::NonZeroExit;
        result.error = "exited with status " + std::to_string(output.returncode.value_or(-1));
    }
    return result;
}

InvocationResult InvocationResult::FromError(const Error& error,
                                             std::vector<std::string> command) {
    InvocationResult result;
    result.ok = false;
    result.command = std::move(command);
    result.failure = error.category;
    result.error = error.rpc_code.has_value()
        ? error.message + " (code " + std::to_string(*error.rpc_code) + ")"
        : error.message;
    if (error.stderr_text.has_value()) {
        result.stderr_text = *error.stderr_text;
    }
    if (error.category == ErrorCategory::Timeout) {
        result.timed_out = true;
    }
    return result;
}

InvocationResult InvocationResult::Rejected(const std::string& message) {
    InvocationResult result;
    result.ok = false;
    result.failure = ErrorCategory::Validation;
    result.error = message;
    return result;
}

InvocationResult InvocationResult::NotFound(const std::string& tool,
                                            std::vector<std::string> searched) {
    InvocationResult result;
    result.ok = false;
    result.failure = ErrorCategory::NotFound;
    result.error = "no executable found for " + tool;
    result.searched = std::move(searched);
    return result;
}

} // namespace mcp_host
