#include <catch2/catch_test_macros.hpp>

#include <mcp_host/dispatch/plan.hpp>
#include <mcp_host/dispatch/target.hpp>

using namespace mcp_host;

TEST_CASE("Plan::FromJson: full plan", "[dispatch]") {
    auto parsed = Plan::FromJson(nlohmann::json::parse(
        R"({"intent":"check_cve","target":"cve","args":{"cve":"CVE-2024-1"}})"));
    REQUIRE(parsed.IsOk());
    const auto& plan = parsed.Value();
    CHECK(plan.intent == "check_cve");
    CHECK(plan.target == "cve");
    CHECK(plan.args["cve"] == "CVE-2024-1");
}

TEST_CASE("Plan::FromJson: missing and null fields take defaults", "[dispatch]") {
    auto parsed = Plan::FromJson(nlohmann::json::parse(R"({"target":null,"args":null})"));
    REQUIRE(parsed.IsOk());
    CHECK(parsed.Value().intent.empty());
    CHECK_FALSE(parsed.Value().target.has_value());
    CHECK(parsed.Value().args == nlohmann::json::object());
}

TEST_CASE("Plan::FromJson: unknown target is kept verbatim", "[dispatch]") {
    auto parsed = Plan::FromJson({{"intent", "x"}, {"target", "Teleporter"}});
    REQUIRE(parsed.IsOk());
    CHECK(parsed.Value().target == "Teleporter");
}

TEST_CASE("Plan::FromJson: type errors", "[dispatch]") {
    CHECK(Plan::FromJson(nlohmann::json::array()).IsErr());
    CHECK(Plan::FromJson({{"intent", 3}}).IsErr());
    CHECK(Plan::FromJson({{"target", true}}).IsErr());
    auto bad_args = Plan::FromJson({{"args", "cve=1"}});
    REQUIRE(bad_args.IsErr());
    CHECK(bad_args.Error().category == ErrorCategory::Validation);
}

TEST_CASE("Plan::ToJson: null target and round trip", "[dispatch]") {
    Plan plan;
    plan.intent = "noop";
    auto j = plan.ToJson();
    CHECK(j["target"].is_null());
    CHECK(j["args"] == nlohmann::json::object());

    plan.target = "git";
    plan.args = {{"cmd", "status"}};
    auto again = Plan::FromJson(plan.ToJson());
    REQUIRE(again.IsOk());
    CHECK(again.Value() == plan);
}

TEST_CASE("Target: names are exact", "[dispatch]") {
    for (auto target : kAllTargets) {
        auto parsed = ParseTarget(TargetName(target));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == target);
    }
    CHECK(ParseTarget("product_options") == Target::ProductOptions);
    CHECK_FALSE(ParseTarget("CVE").has_value());
    CHECK_FALSE(ParseTarget("product-options").has_value());
    CHECK_FALSE(ParseTarget("").has_value());
}

TEST_CASE("Target: built-in handlers", "[dispatch]") {
    CHECK_FALSE(HasBuiltinHandler(Target::Hello));
    CHECK_FALSE(HasBuiltinHandler(Target::Git));
    CHECK(HasBuiltinHandler(Target::Cve));
    CHECK(HasBuiltinHandler(Target::Pfcm));
    CHECK(HasBuiltinHandler(Target::ProductOptions));
    CHECK(HasBuiltinHandler(Target::Inspector));
}
