#include <catch2/catch_test_macros.hpp>

#include <mcp_host/dispatch/dispatcher.hpp>

#include "mocks/mock_tool_invoker.hpp"

using namespace mcp_host;
using mcp_host::testing::MockToolInvoker;
using mcp_host::testing::OkResult;

namespace {

Plan MakePlan(std::optional<std::string> target, nlohmann::json args = nlohmann::json::object()) {
    Plan plan;
    plan.intent = "test";
    plan.target = std::move(target);
    plan.args = std::move(args);
    return plan;
}

} // anonymous namespace

// ===========================================================================
// Unsupported targets
// ===========================================================================

TEST_CASE("Dispatcher: unknown target is unsupported and invokes nothing", "[dispatch]") {
    ToolRegistry registry;
    auto mock = std::make_unique<MockToolInvoker>();
    auto* raw = mock.get();
    registry.Register(Target::Cve, std::move(mock));
    Dispatcher dispatcher(registry);

    auto outcome = dispatcher.Dispatch(MakePlan("teleport"));
    CHECK_FALSE(outcome.ok);
    CHECK(outcome.unsupported);
    CHECK(outcome.result == nlohmann::json{{"status", "unsupported_target"},
                                           {"target", "teleport"}});
    CHECK(raw->CallCount() == 0);
}

TEST_CASE("Dispatcher: absent target is unsupported with a null target", "[dispatch]") {
    ToolRegistry registry;
    Dispatcher dispatcher(registry);
    auto outcome = dispatcher.Dispatch(MakePlan(std::nullopt));
    CHECK(outcome.unsupported);
    CHECK(outcome.result["target"].is_null());
}

TEST_CASE("Dispatcher: hello and git without a tool are unsupported", "[dispatch]") {
    ToolRegistry registry;
    Dispatcher dispatcher(registry);
    CHECK(dispatcher.Dispatch(MakePlan("hello")).unsupported);
    CHECK(dispatcher.Dispatch(MakePlan("git")).unsupported);
}

// ===========================================================================
// Built-in handlers
// ===========================================================================

TEST_CASE("Dispatcher: built-in answers", "[dispatch]") {
    ToolRegistry registry;
    Dispatcher dispatcher(registry);

    auto cve = dispatcher.Dispatch(MakePlan("cve", {{"cve", "CVE-2024-1"}}));
    CHECK(cve.ok);
    CHECK_FALSE(cve.unsupported);
    CHECK(cve.result["affected"] == false);
    CHECK(cve.result["checked"]["cve"] == "CVE-2024-1");

    auto pfcm = dispatcher.Dispatch(MakePlan("pfcm"));
    CHECK(pfcm.result == nlohmann::json{{"status", "ok"},
                                        {"changes", nlohmann::json::array({"PCD:X=1"})}});

    auto options = dispatcher.Dispatch(MakePlan("product_options", {{"sku", "A1"}}));
    CHECK(options.result["message"] == "product options queried");
    CHECK(options.result["args"]["sku"] == "A1");

    auto inspector = dispatcher.Dispatch(MakePlan("inspector"));
    CHECK(inspector.result["checks"] ==
          nlohmann::json::array({"env", "network", "permissions"}));
}

TEST_CASE("BuiltinResult: none for tool-only targets", "[dispatch]") {
    CHECK_FALSE(BuiltinResult(Target::Hello, {}).has_value());
    CHECK_FALSE(BuiltinResult(Target::Git, {}).has_value());
}

// ===========================================================================
// Registered invokers
// ===========================================================================

TEST_CASE("Dispatcher: registered invoker takes precedence over the built-in", "[dispatch]") {
    ToolRegistry registry;
    auto mock = std::make_unique<MockToolInvoker>("cve");
    mock->EnqueueResult(OkResult(R"({"affected": true})"));
    auto* raw = mock.get();
    registry.Register(Target::Cve, std::move(mock));
    Dispatcher dispatcher(registry);

    auto outcome = dispatcher.Dispatch(MakePlan("cve", {{"cve", "CVE-2024-9"}}));
    CHECK(outcome.ok);
    CHECK(outcome.result["status"] == "ok");
    CHECK(outcome.result["json"]["affected"] == true);
    REQUIRE(raw->CallCount() == 1);
    CHECK(raw->Calls()[0]["cve"] == "CVE-2024-9");
}

TEST_CASE("Dispatcher: invoker failure is reported, not thrown", "[dispatch]") {
    ToolRegistry registry;
    auto mock = std::make_unique<MockToolInvoker>("git");
    mock->EnqueueResult(InvocationResult::Rejected("commit requires 'message'"));
    registry.Register(Target::Git, std::move(mock));
    Dispatcher dispatcher(registry);

    auto outcome = dispatcher.Dispatch(MakePlan("git", {{"cmd", "commit"}}));
    CHECK_FALSE(outcome.ok);
    CHECK_FALSE(outcome.unsupported);
    CHECK(outcome.failure == ErrorCategory::Validation);
    CHECK(outcome.result["status"] == "validation_error");
    CHECK(outcome.result["error"] == "commit requires 'message'");
}

TEST_CASE("DispatchOutcome: envelope carries the plan", "[dispatch]") {
    ToolRegistry registry;
    Dispatcher dispatcher(registry);
    auto outcome = dispatcher.Dispatch(MakePlan("inspector"));
    auto envelope = outcome.Envelope();
    CHECK(envelope["plan"]["target"] == "inspector");
    CHECK(envelope["plan"]["intent"] == "test");
    CHECK(envelope["result"]["status"] == "ok");
}
