#include <catch2/catch_test_macros.hpp>

#include <mcp_host/dispatch/tool_registry.hpp>

#include "mocks/mock_tool_invoker.hpp"
#include "support/test_fixtures.hpp"

using namespace mcp_host;
using mcp_host::testing::MockToolInvoker;
using mcp_host::testing::TempDir;

namespace {

AppConfig ConfigFor(const TempDir& dir) {
    AppConfig config;
    config.tools.root = dir.Path().string();
    return config;
}

} // anonymous namespace

TEST_CASE("ToolRegistry: register and find", "[dispatch][registry]") {
    ToolRegistry registry;
    CHECK(registry.Empty());
    CHECK(registry.Find(Target::Cve) == nullptr);

    auto mock = std::make_unique<MockToolInvoker>("cve");
    auto* raw = mock.get();
    registry.Register(Target::Cve, std::move(mock));
    CHECK(registry.Find(Target::Cve) == raw);
    CHECK(registry.Has(Target::Cve));
    CHECK_FALSE(registry.Has(Target::Git));
    CHECK(registry.Size() == 1);
}

TEST_CASE("ToolRegistry: re-registering replaces the invoker", "[dispatch][registry]") {
    ToolRegistry registry;
    registry.Register(Target::Pfcm, std::make_unique<MockToolInvoker>("first"));
    auto second = std::make_unique<MockToolInvoker>("second");
    auto* raw = second.get();
    registry.Register(Target::Pfcm, std::move(second));
    CHECK(registry.Size() == 1);
    CHECK(registry.Find(Target::Pfcm) == raw);
}

TEST_CASE("ToolRegistry: Tools() is in target order", "[dispatch][registry]") {
    ToolRegistry registry;
    registry.Register(Target::Inspector, std::make_unique<MockToolInvoker>());
    registry.Register(Target::Hello, std::make_unique<MockToolInvoker>());
    auto tools = registry.Tools();
    REQUIRE(tools.size() == 2);
    CHECK(tools[0]->name == "hello");
    CHECK(tools[1]->name == "inspector");
}

TEST_CASE("ToolRegistry: discovers the tool layout", "[dispatch][registry]") {
    TempDir dir;
    dir.WriteFile("hello/hello_server.py", "");
    dir.WriteFile("git/git_client.py", "");
    dir.WriteFile("cve/client/client.sh", "echo '{}'\n");

    ToolRegistry registry;
    CHECK(registry.Discover(ConfigFor(dir)) == 3);
    CHECK(registry.Has(Target::Hello));
    CHECK(registry.Has(Target::Git));
    CHECK(registry.Has(Target::Cve));
    CHECK_FALSE(registry.Has(Target::Pfcm));
}

TEST_CASE("ToolRegistry: missing directories are skipped", "[dispatch][registry]") {
    TempDir dir;
    dir.MakeDir("git");

    ToolRegistry registry;
    CHECK(registry.Discover(ConfigFor(dir)) == 1);
    CHECK(registry.Has(Target::Git));
    CHECK_FALSE(registry.Has(Target::Hello));
    CHECK_FALSE(registry.Has(Target::Cve));
}

TEST_CASE("ToolRegistry: cve directory without a runnable client is skipped",
          "[dispatch][registry]") {
    TempDir dir;
    dir.WriteFile("cve/client/Program.cs", "class Program {}\n");

    ToolRegistry registry;
    CHECK(registry.Discover(ConfigFor(dir)) == 0);
    CHECK_FALSE(registry.Has(Target::Cve));
    CHECK(HasBuiltinHandler(Target::Cve));
}

TEST_CASE("ToolRegistry: empty root discovers nothing", "[dispatch][registry]") {
    AppConfig config;
    config.tools.root = "/nonexistent/mcp_tools";
    ToolRegistry registry;
    CHECK(registry.Discover(config) == 0);
    CHECK(registry.Empty());
}

TEST_CASE("ToolRegistry: Discover runs only once", "[dispatch][registry]") {
    TempDir dir;
    dir.MakeDir("git");
    ToolRegistry registry;
    REQUIRE(registry.Discover(ConfigFor(dir)) == 1);

    dir.WriteFile("cve/client/client.sh", "echo '{}'\n");
    CHECK(registry.Discover(ConfigFor(dir)) == 0);
    CHECK(registry.Size() == 1);
}

TEST_CASE("ToolRegistry: configured hello server wins", "[dispatch][registry]") {
    TempDir dir;
    auto server = dir.WriteFile("bin/my_hello", "#!/bin/sh\n", /*executable=*/true);
    auto config = ConfigFor(dir);
    config.tools.hello_server = server.string();

    ToolRegistry registry;
    CHECK(registry.Discover(config) == 1);
    REQUIRE(registry.Has(Target::Hello));
}
