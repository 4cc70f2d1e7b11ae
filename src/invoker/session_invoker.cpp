#include <mcp_host/invoker/session_invoker.hpp>

#include <mcp_host/config/config_loader.hpp>
#include <mcp_host/core/deadline.hpp>
#include <mcp_host/core/log.hpp>

namespace mcp_host {

namespace {
constexpr const char* kComponent = "invoker";
} // anonymous namespace

InvocationResult FromToolCallResult(const nlohmann::json& result,
                                    std::vector<std::string> command) {
    InvocationResult out;
    out.command = std::move(command);
    out.json = result;

    std::string text;
    if (result.is_object()) {
        auto content = result.find("content");
        if (content != result.end() && content->is_array()) {
            for (const auto& item : *content) {
                if (!item.is_object()) {
                    continue;
                }
                auto type = item.find("type");
                auto body = item.find("text");
                if (type != item.end() && type->is_string() && *type == "text" &&
                    body != item.end() && body->is_string()) {
                    if (!text.empty()) {
                        text += '\n';
                    }
                    text += body->get<std::string>();
                }
            }
        }
    }
    out.stdout_text = text;

    // Anything but a literal true is not an error flag.
    bool is_error = false;
    if (result.is_object()) {
        auto flag = result.find("isError");
        is_error = flag != result.end() && flag->is_boolean() && flag->get<bool>();
    }
    out.ok = !is_error;
    if (is_error) {
        out.failure = ErrorCategory::Protocol;
        out.error = text.empty() ? std::string("tool reported an error") : text;
    }
    return out;
}

SessionInvoker::SessionInvoker(std::string name,
                               std::string default_tool,
                               SessionOptions options,
                               double default_timeout_seconds)
    : name_(std::move(name)),
      default_tool_(std::move(default_tool)),
      options_(std::move(options)),
      default_timeout_seconds_(default_timeout_seconds) {}

SessionInvoker::~SessionInvoker() {
    Shutdown();
}

Result<void, Error> SessionInvoker::EnsureSession(const Deadline& deadline) {
    DropSessionIfDead();
    if (session_ != nullptr) {
        return Result<void, Error>::Ok();
    }

    LogInfo(kComponent, name_ + ": starting tool server " + FormatCommand(options_.command));
    auto session = std::make_unique<ToolServerSession>(options_);
    auto opened = session->Open(deadline);
    if (opened.IsErr()) {
        session->Shutdown();
        return opened;
    }
    session_ = std::move(session);
    return Result<void, Error>::Ok();
}

void SessionInvoker::DropSessionIfDead() {
    if (session_ != nullptr && !session_->IsReady()) {
        LogInfo(kComponent, name_ + ": dropping session in state " +
                std::string(SessionStateName(session_->State())));
        session_->Shutdown();
        session_.reset();
    }
}

InvocationResult SessionInvoker::Invoke(const nlohmann::json& args) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string tool = default_tool_;
    nlohmann::json arguments = args.is_null() ? nlohmann::json::object() : args;
    if (!arguments.is_object()) {
        return InvocationResult::Rejected(name_ + ": arguments must be a JSON object");
    }
    if (auto it = arguments.find("tool"); it != arguments.end() && it->is_string()) {
        tool = it->get<std::string>();
        auto inner = arguments.find("arguments");
        if (inner != arguments.end() && !inner->is_object()) {
            return InvocationResult::Rejected(name_ + ": 'arguments' must be a JSON object");
        }
        arguments = inner != arguments.end() ? *inner : nlohmann::json::object();
    }

    const double timeout = ResolveToolTimeout(default_timeout_seconds_);
    const auto deadline = Deadline::AfterSeconds(timeout);

    auto ready = EnsureSession(deadline);
    if (ready.IsErr()) {
        auto result = InvocationResult::FromError(ready.Error(), options_.command);
        result.timeout_seconds = timeout;
        LogWarn(kComponent, name_ + ": " + ready.Error().ToString());
        return result;
    }

    auto called = session_->CallTool(tool, arguments, deadline);
    if (called.IsErr()) {
        auto result = InvocationResult::FromError(called.Error(), options_.command);
        result.timeout_seconds = timeout;
        if (!session_->IsReady()) {
            LogWarn(kComponent, name_ + ": session lost: " + called.Error().ToString());
            DropSessionIfDead();
        }
        return result;
    }

    auto result = FromToolCallResult(called.Value(), options_.command);
    result.timeout_seconds = timeout;
    return result;
}

Result<std::vector<RemoteTool>, Error> SessionInvoker::ListTools() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto deadline = Deadline::AfterSeconds(ResolveToolTimeout(default_timeout_seconds_));
    auto ready = EnsureSession(deadline);
    if (ready.IsErr()) {
        return Result<std::vector<RemoteTool>, Error>::Err(ready.Error());
    }
    auto tools = session_->ListTools(deadline);
    DropSessionIfDead();
    return tools;
}

nlohmann::json SessionInvoker::Describe() {
    nlohmann::json description = {
        {"name", name_},
        {"kind", "session"},
        {"command", options_.command},
        {"default_tool", default_tool_},
    };

    auto tools = ListTools();
    if (tools.IsErr()) {
        description["error"] = tools.Error().ToString();
        return description;
    }
    nlohmann::json listed = nlohmann::json::array();
    for (const auto& tool : tools.Value()) {
        nlohmann::json entry = {{"name", tool.name}, {"description", tool.description}};
        if (tool.input_schema.has_value()) {
            entry["inputSchema"] = *tool.input_schema;
        }
        listed.push_back(std::move(entry));
    }
    description["tools"] = std::move(listed);
    return description;
}

void SessionInvoker::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_ != nullptr) {
        session_->Shutdown();
        session_.reset();
    }
}

pid_t SessionInvoker::SessionPid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ != nullptr ? session_->LastPid() : -1;
}

} // namespace mcp_host
