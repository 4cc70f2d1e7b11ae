#include <catch2/catch_test_macros.hpp>

#include <mcp_host/planner/heuristic_planner.hpp>
#include <mcp_host/planner/ollama_planner.hpp>
#include <mcp_host/core/log.hpp>
#include <mcp_host/planner/planner.hpp>

#include "mocks/mock_planner.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

using namespace mcp_host;
using namespace std::chrono_literals;
using mcp_host::testing::MockPlanner;

namespace {

Plan Heuristic(const std::string& text) {
    HeuristicPlanner planner;
    auto plan = planner.MakePlan(text);
    REQUIRE(plan.IsOk());
    return plan.Value();
}

class LockedCaptureSink : public ILogSink {
public:
    LockedCaptureSink(std::mutex& mutex, std::vector<std::string>& out)
        : mutex_(mutex), out_(out) {}
    void Write(LogLevel, std::string_view, std::string_view message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        out_.emplace_back(message);
    }
private:
    std::mutex& mutex_;
    std::vector<std::string>& out_;
};

// Logs once it is done, long after a short budget has expired.
class LateLoggingPlanner : public IPlanner {
public:
    Result<Plan, Error> MakePlan(const std::string& /*text*/) override {
        std::this_thread::sleep_for(200ms);
        LogWarn("late-planner", "finished after the caller gave up");
        finished.store(true);
        return Result<Plan, Error>::Ok(DefaultPlan());
    }
    std::string Name() const override { return "late"; }

    std::atomic<bool> finished{false};
};

} // anonymous namespace

// ===========================================================================
// ParsePlanText
// ===========================================================================

TEST_CASE("ParsePlanText: strict JSON", "[planner]") {
    auto plan = ParsePlanText(R"({"intent":"check_cve","target":"cve","args":{"cve":"CVE-2024-1"}})");
    REQUIRE(plan.IsOk());
    CHECK(plan.Value().target == "cve");
    CHECK(plan.Value().args["cve"] == "CVE-2024-1");
}

TEST_CASE("ParsePlanText: object embedded in prose", "[planner]") {
    auto plan = ParsePlanText("Here is the plan:\n```json\n"
                              R"({"intent":"update_pfcm","target":"pfcm","args":{}})"
                              "\n```\nLet me know!");
    REQUIRE(plan.IsOk());
    CHECK(plan.Value().intent == "update_pfcm");
}

TEST_CASE("ParsePlanText: failures are planner errors", "[planner]") {
    auto none = ParsePlanText("I cannot help with that.");
    REQUIRE(none.IsErr());
    CHECK(none.Error().category == ErrorCategory::Planner);

    auto broken = ParsePlanText("{intent: check}");
    REQUIRE(broken.IsErr());
    CHECK(broken.Error().category == ErrorCategory::Planner);

    auto wrong_type = ParsePlanText(R"({"intent":"x","args":[1]})");
    REQUIRE(wrong_type.IsErr());
    CHECK(wrong_type.Error().category == ErrorCategory::Planner);
}

TEST_CASE("DefaultPlan: diagnostics on the inspector", "[planner]") {
    auto plan = DefaultPlan();
    CHECK(plan.intent == "run_diagnostics");
    CHECK(plan.target == "inspector");
    CHECK(plan.args == nlohmann::json::object());
}

// ===========================================================================
// HeuristicPlanner
// ===========================================================================

TEST_CASE("HeuristicPlanner: CVE ids", "[planner]") {
    auto plan = Heuristic("Am I affected by cve-2024-3094?");
    CHECK(plan.target == "cve");
    CHECK(plan.intent == "check_cve");
    CHECK(plan.args["cve"] == "CVE-2024-3094");

    auto bare = Heuristic("run a CVE scan");
    CHECK(bare.target == "cve");
    CHECK_FALSE(bare.args.contains("cve"));
}

TEST_CASE("HeuristicPlanner: fixed targets", "[planner]") {
    CHECK(Heuristic("apply the PFCM change").target == "pfcm");
    CHECK(Heuristic("list product options for this box").target == "product_options");
}

TEST_CASE("HeuristicPlanner: hello messages", "[planner]") {
    auto quoted = Heuristic(R"(say hello with "good morning")");
    CHECK(quoted.target == "hello");
    CHECK(quoted.args["message"] == "good morning");

    auto trailing = Heuristic("hello, world");
    CHECK(trailing.args["message"] == "world");
}

TEST_CASE("HeuristicPlanner: git verbs", "[planner]") {
    auto commit = Heuristic(R"(git commit "fix the build")");
    CHECK(commit.target == "git");
    CHECK(commit.intent == "git_commit");
    CHECK(commit.args["cmd"] == "commit");
    CHECK(commit.args["message"] == "fix the build");

    auto status = Heuristic("what does git say");
    CHECK(status.args["cmd"] == "status");

    CHECK(Heuristic("checkout the release branch").args["cmd"] == "checkout");
}

TEST_CASE("HeuristicPlanner: anything else is diagnostics", "[planner]") {
    CHECK(Heuristic("why is the fan loud") == DefaultPlan());
}

// ===========================================================================
// PlanWithBudget
// ===========================================================================

TEST_CASE("PlanWithBudget: returns the planner's plan in time", "[planner]") {
    Plan expected;
    expected.intent = "update_pfcm";
    expected.target = "pfcm";
    auto planner = std::make_shared<MockPlanner>(Result<Plan, Error>::Ok(expected));

    CHECK(PlanWithBudget(planner, "pfcm please", 2000ms) == expected);
    CHECK(planner->CallCount() == 1);
}

TEST_CASE("PlanWithBudget: failure falls back to the default plan", "[planner]") {
    auto planner = std::make_shared<MockPlanner>(Result<Plan, Error>::Err(
        Error::Make("MockPlanner", "", "model offline", ErrorCategory::Planner)));
    CHECK(PlanWithBudget(planner, "anything", 2000ms) == DefaultPlan());
}

TEST_CASE("PlanWithBudget: overrun falls back without waiting", "[planner]") {
    Plan slow_plan;
    slow_plan.target = "cve";
    auto planner = std::make_shared<MockPlanner>(Result<Plan, Error>::Ok(slow_plan), 500ms);

    const auto started = std::chrono::steady_clock::now();
    auto plan = PlanWithBudget(planner, "slow", 50ms);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    CHECK(plan == DefaultPlan());
    CHECK(elapsed < 400ms);
}

TEST_CASE("PlanWithBudget: abandoned worker can still log", "[planner]") {
    std::mutex mutex;
    std::vector<std::string> captured;
    InitGlobalLogger(std::make_unique<LockedCaptureSink>(mutex, captured), LogLevel::Warn);

    auto planner = std::make_shared<LateLoggingPlanner>();
    CHECK(PlanWithBudget(planner, "slow", 20ms) == DefaultPlan());

    const auto give_up = std::chrono::steady_clock::now() + 5s;
    while (!planner->finished.load() && std::chrono::steady_clock::now() < give_up) {
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE(planner->finished.load());
    // The worker drops its planner reference right after MakePlan returns.
    std::this_thread::sleep_for(50ms);

    {
        std::lock_guard<std::mutex> lock(mutex);
        bool seen = false;
        for (const auto& message : captured) {
            if (message == "finished after the caller gave up") seen = true;
        }
        CHECK(seen);
    }
    InitGlobalLogger(std::make_unique<ConsoleSink>(std::cerr), LogLevel::Error);
}

// ===========================================================================
// OllamaPlanner
// ===========================================================================

TEST_CASE("OllamaPlanner: request shape", "[planner]") {
    OllamaOptions options;
    options.model = "mistral";
    OllamaPlanner planner(options, [](const std::string&) {
        return Result<std::string, Error>::Ok("{}");
    });

    auto request = planner.BuildRequest("check CVE-2024-1");
    CHECK(request["model"] == "mistral");
    CHECK(request["stream"] == false);
    CHECK(request["options"]["temperature"] == 0);
    REQUIRE(request["messages"].size() == 2);
    CHECK(request["messages"][0]["role"] == "system");
    CHECK(request["messages"][1]["content"] == "check CVE-2024-1");
}

TEST_CASE("OllamaPlanner: parses the model reply", "[planner]") {
    std::string sent;
    OllamaPlanner planner(OllamaOptions{}, [&sent](const std::string& body) {
        sent = body;
        nlohmann::json reply = {
            {"message", {{"role", "assistant"},
                         {"content", R"(Sure! {"intent":"check_cve","target":"cve","args":{"cve":"CVE-2024-1"}})"}}},
            {"done", true},
        };
        return Result<std::string, Error>::Ok(reply.dump());
    });

    auto plan = planner.MakePlan("check CVE-2024-1");
    REQUIRE(plan.IsOk());
    CHECK(plan.Value().target == "cve");
    CHECK(plan.Value().args["cve"] == "CVE-2024-1");
    CHECK(nlohmann::json::parse(sent)["model"] == "llama3.1");
}

TEST_CASE("OllamaPlanner: malformed replies are planner errors", "[planner]") {
    auto reply_with = [](std::string body) {
        return [body](const std::string&) { return Result<std::string, Error>::Ok(body); };
    };

    OllamaPlanner not_json(OllamaOptions{}, reply_with("<html>"));
    auto a = not_json.MakePlan("x");
    REQUIRE(a.IsErr());
    CHECK(a.Error().category == ErrorCategory::Planner);

    OllamaPlanner no_content(OllamaOptions{}, reply_with(R"({"message":{}})"));
    auto b = no_content.MakePlan("x");
    REQUIRE(b.IsErr());
    CHECK(b.Error().category == ErrorCategory::Planner);

    OllamaPlanner transport_down(OllamaOptions{}, [](const std::string&) {
        return Result<std::string, Error>::Err(
            Error::Make("http", "/api/chat", "connection refused", ErrorCategory::Planner));
    });
    CHECK(transport_down.MakePlan("x").IsErr());
}

TEST_CASE("NormalizeEndpoint: scheme and trailing slash", "[planner]") {
    CHECK(NormalizeEndpoint("localhost:11434") == "http://localhost:11434");
    CHECK(NormalizeEndpoint("http://gpu-box:11434/") == "http://gpu-box:11434");
    CHECK(NormalizeEndpoint("https://ollama.example") == "https://ollama.example");
}
