#include <catch2/catch_test_macros.hpp>

#include <mcp_host/server/rpc_server.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace mcp_host;

namespace {

ToolCatalog MakeTestCatalog() {
    ToolCatalog catalog;
    catalog.Register("echo", "Echo the input",
        {{"type", "object"},
         {"properties", {{"message", {{"type", "string"}}}}},
         {"required", nlohmann::json::array({"message"})}},
        [](const nlohmann::json& args) {
            return ToolOutput::Text(args.value("message", ""));
        });
    catalog.Register("explode", "Always throws",
        {{"type", "object"}},
        [](const nlohmann::json&) -> ToolOutput {
            throw std::runtime_error("kaboom");
        });
    return catalog;
}

ServerInfo TestInfo() {
    ServerInfo info;
    info.name = "test-server";
    info.version = "1.2.3";
    return info;
}

nlohmann::json Reply(RpcServer& server, const std::string& line) {
    auto reply = server.HandleLine(line);
    REQUIRE(reply.has_value());
    return nlohmann::json::parse(*reply);
}

std::vector<nlohmann::json> OutputLines(const std::string& text) {
    std::vector<nlohmann::json> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            lines.push_back(nlohmann::json::parse(line));
        }
    }
    return lines;
}

} // anonymous namespace

// ===========================================================================
// Methods
// ===========================================================================

TEST_CASE("RpcServer: initialize reports server info and tools capability", "[server][rpc]") {
    std::istringstream in;
    std::ostringstream out;
    RpcServer server(TestInfo(), MakeTestCatalog(), in, out);

    auto r = Reply(server, R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
    CHECK(r["id"] == 1);
    CHECK(r["result"]["protocolVersion"] == "2024-11-05");
    CHECK(r["result"]["serverInfo"]["name"] == "test-server");
    CHECK(r["result"]["serverInfo"]["version"] == "1.2.3");
    CHECK(r["result"]["capabilities"].contains("tools"));
    CHECK(server.Initialized());
}

TEST_CASE("RpcServer: tools/list returns every tool and a null cursor", "[server][rpc]") {
    std::istringstream in;
    std::ostringstream out;
    RpcServer server(TestInfo(), MakeTestCatalog(), in, out);

    auto r = Reply(server, R"({"jsonrpc":"2.0","id":"l","method":"tools/list"})");
    CHECK(r["id"] == "l");
    REQUIRE(r["result"]["tools"].size() == 2);
    CHECK(r["result"]["tools"][0]["name"] == "echo");
    CHECK(r["result"]["tools"][0].contains("inputSchema"));
    CHECK(r["result"]["nextCursor"].is_null());
}

TEST_CASE("RpcServer: tools/call runs the handler", "[server][rpc]") {
    std::istringstream in;
    std::ostringstream out;
    RpcServer server(TestInfo(), MakeTestCatalog(), in, out);

    auto r = Reply(server,
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hi"}}})");
    CHECK(r["id"] == 3);
    CHECK(r["result"]["content"][0]["text"] == "hi");
    CHECK_FALSE(r["result"].contains("isError"));
}

TEST_CASE("RpcServer: tools/call unknown tool is -32602 with same id", "[server][rpc]") {
    std::istringstream in;
    std::ostringstream out;
    RpcServer server(TestInfo(), MakeTestCatalog(), in, out);

    auto r = Reply(server,
        R"({"jsonrpc":"2.0","id":44,"method":"tools/call","params":{"name":"nope","arguments":{}}})");
    CHECK(r["id"] == 44);
    CHECK(r["error"]["code"] == -32602);
}

TEST_CASE("RpcServer: tools/call invalid params", "[server][rpc]") {
    std::istringstream in;
    std::ostringstream out;
    RpcServer server(TestInfo(), MakeTestCatalog(), in, out);

    SECTION("missing params") {
        auto r = Reply(server, R"({"jsonrpc":"2.0","id":1,"method":"tools/call"})");
        CHECK(r["error"]["code"] == -32602);
    }
    SECTION("name is not a string") {
        auto r = Reply(server, R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":7}})");
        CHECK(r["error"]["code"] == -32602);
    }
    SECTION("arguments is not an object") {
        auto r = Reply(server,
            R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo","arguments":[1]}})");
        CHECK(r["error"]["code"] == -32602);
    }
    SECTION("required argument missing") {
        auto r = Reply(server,
            R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo","arguments":{}}})");
        CHECK(r["error"]["code"] == -32602);
        CHECK(r["error"]["message"].get<std::string>().find("message") != std::string::npos);
    }
    SECTION("argument of the wrong type") {
        auto r = Reply(server,
            R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"echo","arguments":{"message":123}}})");
        CHECK(r["id"] == 7);
        CHECK(r["error"]["code"] == -32602);
        CHECK(r["error"]["message"].get<std::string>().find("message") != std::string::npos);
    }
}

TEST_CASE("RpcServer: handler exception is -32000", "[server][rpc]") {
    std::istringstream in;
    std::ostringstream out;
    RpcServer server(TestInfo(), MakeTestCatalog(), in, out);

    auto r = Reply(server,
        R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"name":"explode","arguments":{}}})");
    CHECK(r["id"] == 9);
    CHECK(r["error"]["code"] == -32000);
    CHECK(r["error"]["message"].get<std::string>().find("kaboom") != std::string::npos);
}

TEST_CASE("RpcServer: unknown method is -32601", "[server][rpc]") {
    std::istringstream in;
    std::ostringstream out;
    RpcServer server(TestInfo(), MakeTestCatalog(), in, out);

    auto r = Reply(server, R"({"jsonrpc":"2.0","id":2,"method":"resources/list"})");
    CHECK(r["id"] == 2);
    CHECK(r["error"]["code"] == -32601);
}

TEST_CASE("RpcServer: parse error answers with null id", "[server][rpc]") {
    std::istringstream in;
    std::ostringstream out;
    RpcServer server(TestInfo(), MakeTestCatalog(), in, out);

    auto r = Reply(server, "this is not json");
    CHECK(r["id"].is_null());
    CHECK(r["error"]["code"] == -32700);
}

// ===========================================================================
// Notifications
// ===========================================================================

TEST_CASE("RpcServer: notifications never get a reply", "[server][rpc]") {
    std::istringstream in;
    std::ostringstream out;
    RpcServer server(TestInfo(), MakeTestCatalog(), in, out);

    CHECK_FALSE(server.HandleLine(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").has_value());
    CHECK_FALSE(server.HandleLine(R"({"jsonrpc":"2.0","method":"notifications/whatever"})").has_value());
    CHECK_FALSE(server.HandleLine(R"({"jsonrpc":"2.0","method":"tools/list"})").has_value());
    CHECK_FALSE(server.HandleLine(R"({"method":"no/version"})").has_value());
    CHECK_FALSE(server.ExitRequested());
}

// ===========================================================================
// Run loop
// ===========================================================================

TEST_CASE("RpcServer: Run answers requests in order and stops on server/exit", "[server][rpc]") {
    std::istringstream in(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\"}\n"
        "\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"server/exit\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"tools/list\"}\n");
    std::ostringstream out;
    RpcServer server(TestInfo(), MakeTestCatalog(), in, out);

    server.Run();

    auto lines = OutputLines(out.str());
    REQUIRE(lines.size() == 2);
    CHECK(lines[0]["id"] == 1);
    CHECK(lines[1]["id"] == 2);
    CHECK(server.ExitRequested());
}

TEST_CASE("RpcServer: Run returns at end of input", "[server][rpc]") {
    std::istringstream in("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/list\"}\n");
    std::ostringstream out;
    RpcServer server(TestInfo(), MakeTestCatalog(), in, out);

    server.Run();
    CHECK(OutputLines(out.str()).size() == 1);
    CHECK_FALSE(server.ExitRequested());
}
