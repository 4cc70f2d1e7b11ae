#pragma once

#include <mcp_host/planner/planner.hpp>

#include <chrono>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_host {

struct OllamaOptions {
    std::string endpoint = "http://127.0.0.1:11434";  // scheme optional
    std::string model = "llama3.1";
    std::chrono::seconds connect_timeout{5};
    std::chrono::seconds read_timeout{60};
};

// POST body -> reply body. The default goes over HTTP with cpp-httplib.
using ChatTransport = std::function<Result<std::string, Error>(const std::string& body)>;

// ---------------------------------------------------------------------------
// OllamaPlanner - asks a local Ollama server (/api/chat, temperature 0,
// non-streaming) for a plan and parses the reply with ParsePlanText.
// ---------------------------------------------------------------------------
class OllamaPlanner : public IPlanner {
public:
    explicit OllamaPlanner(OllamaOptions options);
    OllamaPlanner(OllamaOptions options, ChatTransport transport);

    [[nodiscard]] Result<Plan, Error> MakePlan(const std::string& text) override;
    [[nodiscard]] std::string Name() const override { return "ollama"; }

    [[nodiscard]] nlohmann::json BuildRequest(const std::string& text) const;

private:
    OllamaOptions options_;
    ChatTransport transport_;
};

// "localhost:11434" -> "http://localhost:11434"; trailing '/' removed.
[[nodiscard]] std::string NormalizeEndpoint(const std::string& endpoint);

[[nodiscard]] const char* PlannerSystemPrompt();

} // namespace mcp_host
