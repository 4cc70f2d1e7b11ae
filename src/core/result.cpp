#include <mcp_host/core/result.hpp>

#include <nlohmann/json.hpp>

#include <ostream>
#include <sstream>

namespace mcp_host {

const char* ErrorCategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Validation:    return "validation_error";
        case ErrorCategory::NotFound:      return "not_found";
        case ErrorCategory::Start:         return "start_error";
        case ErrorCategory::Protocol:      return "protocol_error";
        case ErrorCategory::Timeout:       return "timeout";
        case ErrorCategory::NonZeroExit:   return "nonzero_exit";
        case ErrorCategory::BrokenPipe:    return "broken_pipe";
        case ErrorCategory::SessionClosed: return "session_closed";
        case ErrorCategory::Config:        return "config_error";
        case ErrorCategory::Planner:       return "planner_error";
        case ErrorCategory::Internal:      return "internal";
    }
    return "internal";
}

Error Error::Make(std::string operation, std::string target,
                  std::string message, ErrorCategory category) {
    Error error;
    error.operation = std::move(operation);
    error.target = std::move(target);
    error.message = std::move(message);
    error.category = category;
    return error;
}

Error Error::FromRpcError(const std::string& operation,
                          const std::string& target,
                          int code,
                          const std::string& message) {
    auto error = Make(operation, target, message, ErrorCategory::Protocol);
    error.rpc_code = code;
    return error;
}

int ErrorCategoryExitCode(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Validation:    return 2;
        case ErrorCategory::NotFound:      return 3;
        case ErrorCategory::Start:         return 4;
        case ErrorCategory::Protocol:      return 5;
        case ErrorCategory::Timeout:       return 6;
        case ErrorCategory::NonZeroExit:   return 7;
        case ErrorCategory::BrokenPipe:    return 8;
        case ErrorCategory::SessionClosed: return 8;
        case ErrorCategory::Config:        return 9;
        case ErrorCategory::Planner:       return 10;
        case ErrorCategory::Internal:      return 99;
    }
    return 99;
}

int Error::ExitCode() const {
    return ErrorCategoryExitCode(category);
}

std::string Error::CategoryName() const {
    return ErrorCategoryName(category);
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!target.empty()) {
        oss << " [" << target << "]";
    }
    if (rpc_code.has_value()) {
        oss << " (RPC " << *rpc_code << ")";
    }
    oss << ": " << message;
    if (stderr_text.has_value() && !stderr_text->empty()) {
        oss << " | stderr: " << *stderr_text;
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
        {"exit_code", ExitCode()},
    };
    if (!target.empty()) {
        body["target"] = target;
    }
    if (rpc_code.has_value()) {
        body["rpc_code"] = *rpc_code;
    }
    if (stderr_text.has_value() && !stderr_text->empty()) {
        body["stderr"] = *stderr_text;
    }
    return nlohmann::json{{"error", body}}.dump(-1, ' ', false,
                                                 nlohmann::json::error_handler_t::replace);
}

std::ostream& operator<<(std::ostream& os, const Error& e) {
    return os << e.ToString();
}

} // namespace mcp_host
