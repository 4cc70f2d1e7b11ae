#include <mcp_host/planner/ollama_planner.hpp>

#include <mcp_host/core/log.hpp>

#include <httplib.h>

namespace mcp_host {

namespace {

constexpr const char* kComponent = "planner";
constexpr const char* kChatPath = "/api/chat";

Error PlannerError(const std::string& message) {
    return Error::Make("OllamaPlanner::MakePlan", kChatPath, message, ErrorCategory::Planner);
}

ChatTransport HttpTransport(const OllamaOptions& options) {
    return [options](const std::string& body) -> Result<std::string, Error> {
        httplib::Client client(NormalizeEndpoint(options.endpoint));
        client.set_connection_timeout(options.connect_timeout);
        client.set_read_timeout(options.read_timeout);

        LogDebug(kComponent, "POST " + NormalizeEndpoint(options.endpoint) + kChatPath);
        auto res = client.Post(kChatPath, body, "application/json");
        if (!res) {
            return Result<std::string, Error>::Err(
                PlannerError("HTTP request failed: " + httplib::to_string(res.error())));
        }
        if (res->status != 200) {
            return Result<std::string, Error>::Err(
                PlannerError("HTTP " + std::to_string(res->status) + ": " + res->body));
        }
        return Result<std::string, Error>::Ok(res->body);
    };
}

} // anonymous namespace

const char* PlannerSystemPrompt() {
    return "You are the MCP Host planner. Given a user prompt, extract a strict JSON plan:\n"
           "{\n"
           "  \"intent\": \"verb_noun\",\n"
           "  \"target\": \"one of: hello, git, cve, pfcm, product_options, inspector\",\n"
           "  \"args\": {\"k\": \"v\"}\n"
           "}\n"
           "For git, args.cmd is one of: status, diff, add, commit, log, create-branch, "
           "checkout, show, init, branch.\n"
           "Only output the JSON object. No extra text.";
}

std::string NormalizeEndpoint(const std::string& endpoint) {
    std::string out = endpoint;
    if (out.find("://") == std::string::npos) {
        out = "http://" + out;
    }
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

OllamaPlanner::OllamaPlanner(OllamaOptions options)
    : options_(std::move(options)),
      transport_(HttpTransport(options_)) {}

OllamaPlanner::OllamaPlanner(OllamaOptions options, ChatTransport transport)
    : options_(std::move(options)),
      transport_(std::move(transport)) {}

nlohmann::json OllamaPlanner::BuildRequest(const std::string& text) const {
    return {
        {"model", options_.model},
        {"stream", false},
        {"messages", nlohmann::json::array({
            {{"role", "system"}, {"content", PlannerSystemPrompt()}},
            {{"role", "user"}, {"content", text}},
        })},
        {"options", {{"temperature", 0}}},
    };
}

Result<Plan, Error> OllamaPlanner::MakePlan(const std::string& text) {
    auto reply = transport_(BuildRequest(text).dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace));
    if (reply.IsErr()) {
        return Result<Plan, Error>::Err(reply.Error());
    }

    auto body = nlohmann::json::parse(reply.Value(), nullptr, /*allow_exceptions=*/false);
    if (body.is_discarded() || !body.is_object()) {
        return Result<Plan, Error>::Err(PlannerError("reply is not a JSON object"));
    }
    const auto message = body.find("message");
    if (message == body.end() || !message->is_object() ||
        !message->contains("content") || !(*message)["content"].is_string()) {
        return Result<Plan, Error>::Err(PlannerError("reply has no message.content"));
    }

    const auto content = (*message)["content"].get<std::string>();
    LogDebug(kComponent, "model reply: " + content);
    return ParsePlanText(content);
}

} // namespace mcp_host
