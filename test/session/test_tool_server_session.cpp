#include <catch2/catch_test_macros.hpp>

#include <mcp_host/session/tool_server_session.hpp>

#include "support/test_fixtures.hpp"

#include <chrono>
#include <string>

using namespace mcp_host;
using namespace std::chrono_literals;

namespace {

SessionOptions HelloOptions() {
    SessionOptions options;
    options.command = {testing::HelloServerPath()};
    return options;
}

SessionOptions ShellOptions(const std::string& script) {
    SessionOptions options;
    options.command = {"sh", "-c", script};
    options.start_grace = 50ms;
    options.exit_wait = 200ms;
    options.terminate_wait = 200ms;
    return options;
}

std::string FirstText(const nlohmann::json& call_result) {
    const auto& content = call_result.at("content");
    REQUIRE(content.is_array());
    REQUIRE_FALSE(content.empty());
    return content[0].at("text").get<std::string>();
}

} // anonymous namespace

// ===========================================================================
// Against the real hello server
// ===========================================================================

TEST_CASE("ToolServerSession: hello round trip", "[session]") {
    ToolServerSession session(HelloOptions());
    REQUIRE(session.Open(Deadline::After(5000ms)).IsOk());
    CHECK(session.IsReady());
    CHECK(session.ServerInfo()["serverInfo"]["name"] == "Hello Server");

    auto result = session.CallTool("hello", {{"message", "hi"}}, Deadline::After(5000ms));
    REQUIRE(result.IsOk());
    const auto text = FirstText(result.Value());
    CHECK(text.rfind("hello: hi @ ", 0) == 0);

    session.Shutdown();
    CHECK(session.State() == SessionState::Terminated);
}

TEST_CASE("ToolServerSession: tools/list describes the hello tools", "[session]") {
    ToolServerSession session(HelloOptions());
    REQUIRE(session.Open(Deadline::After(5000ms)).IsOk());

    auto tools = session.ListTools(Deadline::After(5000ms));
    REQUIRE(tools.IsOk());
    REQUIRE(tools.Value().size() == 2);
    bool saw_hello = false;
    for (const auto& tool : tools.Value()) {
        if (tool.name == "hello") {
            saw_hello = true;
            REQUIRE(tool.input_schema.has_value());
            CHECK((*tool.input_schema)["required"][0] == "message");
        }
    }
    CHECK(saw_hello);
}

TEST_CASE("ToolServerSession: RPC error keeps the session ready", "[session]") {
    ToolServerSession session(HelloOptions());
    REQUIRE(session.Open(Deadline::After(5000ms)).IsOk());

    auto unknown = session.CallTool("nope", nlohmann::json::object(), Deadline::After(5000ms));
    REQUIRE(unknown.IsErr());
    CHECK(unknown.Error().category == ErrorCategory::Protocol);
    CHECK(unknown.Error().rpc_code == -32602);
    CHECK(session.IsReady());

    auto hello = session.CallTool("hello", {{"message", "again"}}, Deadline::After(5000ms));
    REQUIRE(hello.IsOk());
    CHECK(FirstText(hello.Value()).find("again") != std::string::npos);
}

TEST_CASE("ToolServerSession: Shutdown is idempotent and reaps the child", "[session]") {
    ToolServerSession session(HelloOptions());
    REQUIRE(session.Open(Deadline::After(5000ms)).IsOk());
    const auto pid = session.LastPid();

    session.Shutdown();
    session.Shutdown();
    CHECK(session.State() == SessionState::Terminated);
    CHECK(testing::ProcessGone(pid));

    auto after = session.CallTool("hello", {{"message", "x"}}, Deadline::After(1000ms));
    REQUIRE(after.IsErr());
    CHECK(after.Error().category == ErrorCategory::SessionClosed);
}

TEST_CASE("ToolServerSession: Shutdown before Start is harmless", "[session]") {
    ToolServerSession session(HelloOptions());
    session.Shutdown();
    CHECK(session.State() == SessionState::Terminated);
    CHECK(session.LastPid() == -1);
    CHECK(session.Start().IsErr());
}

// ===========================================================================
// Misbehaving servers
// ===========================================================================

TEST_CASE("ToolServerSession: silent server times out the handshake", "[session]") {
    ToolServerSession session(ShellOptions("cat >/dev/null"));
    const auto started = std::chrono::steady_clock::now();
    auto opened = session.Open(Deadline::After(300ms));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(opened.IsErr());
    CHECK(opened.Error().category == ErrorCategory::Timeout);
    CHECK(elapsed < 3s);
    CHECK(session.State() == SessionState::Terminated);
    CHECK(testing::ProcessGone(session.LastPid()));
}

TEST_CASE("ToolServerSession: early exit is a start error with stderr", "[session]") {
    auto options = ShellOptions("echo oops >&2; exit 3");
    options.start_grace = 300ms;
    ToolServerSession session(options);

    auto opened = session.Open(Deadline::After(2000ms));
    REQUIRE(opened.IsErr());
    CHECK(opened.Error().category == ErrorCategory::Start);
    REQUIRE(opened.Error().stderr_text.has_value());
    CHECK(opened.Error().stderr_text->find("oops") != std::string::npos);
    CHECK(session.State() == SessionState::Terminated);
}

TEST_CASE("ToolServerSession: missing executable is a start error", "[session]") {
    SessionOptions options;
    options.command = {"/nonexistent/mcp-host-server"};
    ToolServerSession session(options);
    auto opened = session.Open(Deadline::After(1000ms));
    REQUIRE(opened.IsErr());
    CHECK(opened.Error().category == ErrorCategory::Start);
}

TEST_CASE("ToolServerSession: mismatched response id is a protocol error", "[session]") {
    ToolServerSession session(ShellOptions(
        R"(read line; echo '{"jsonrpc":"2.0","id":99,"result":{}}'; cat >/dev/null)"));
    auto opened = session.Open(Deadline::After(2000ms));
    REQUIRE(opened.IsErr());
    CHECK(opened.Error().category == ErrorCategory::Protocol);
    CHECK(session.State() == SessionState::Terminated);
}

TEST_CASE("ToolServerSession: non-JSON reply is a protocol error", "[session]") {
    ToolServerSession session(ShellOptions("read line; echo garbage; cat >/dev/null"));
    auto opened = session.Open(Deadline::After(2000ms));
    REQUIRE(opened.IsErr());
    CHECK(opened.Error().category == ErrorCategory::Protocol);
    CHECK(testing::ProcessGone(session.LastPid()));
}

TEST_CASE("ToolServerSession: server closing stdout is a protocol error", "[session]") {
    ToolServerSession session(ShellOptions("read line; echo bye >&2; exit 0"));
    auto opened = session.Open(Deadline::After(2000ms));
    REQUIRE(opened.IsErr());
    CHECK(opened.Error().category == ErrorCategory::Protocol);
    CHECK(opened.Error().message.find("No response from server") != std::string::npos);
}

TEST_CASE("ToolServerSession: server notifications before the reply are skipped", "[session]") {
    ToolServerSession session(ShellOptions(
        R"(read line; )"
        R"(echo '{"jsonrpc":"2.0","method":"notifications/message","params":{}}'; )"
        R"(echo '{"jsonrpc":"2.0","id":1,"result":{"serverInfo":{"name":"fake"}}}'; )"
        R"(cat >/dev/null)"));
    REQUIRE(session.Open(Deadline::After(2000ms)).IsOk());
    CHECK(session.IsReady());
    CHECK(session.ServerInfo()["serverInfo"]["name"] == "fake");
    session.Shutdown();
    CHECK(testing::ProcessGone(session.LastPid()));
}

TEST_CASE("ToolServerSession: SIGTERM escalation for a server that ignores stdin EOF",
          "[session]") {
    ToolServerSession session(ShellOptions(
        R"(read line; echo '{"jsonrpc":"2.0","id":1,"result":{}}'; exec sleep 30)"));
    REQUIRE(session.Open(Deadline::After(2000ms)).IsOk());
    const auto pid = session.LastPid();

    const auto started = std::chrono::steady_clock::now();
    session.Shutdown();
    CHECK(std::chrono::steady_clock::now() - started < 3s);
    CHECK(testing::ProcessGone(pid));
}

TEST_CASE("ToolServerSession: server that stops reading is abandoned at the deadline",
          "[session]") {
    ToolServerSession session(ShellOptions(
        R"(read line; echo '{"jsonrpc":"2.0","id":1,"result":{}}'; read line; exec sleep 30)"));
    REQUIRE(session.Open(Deadline::After(2000ms)).IsOk());
    const auto pid = session.LastPid();

    const auto started = std::chrono::steady_clock::now();
    auto result = session.CallTool("hello", {{"message", std::string(1024 * 1024, 'x')}},
                                   Deadline::After(500ms));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Timeout);
    CHECK(elapsed < 3s);
    CHECK(session.State() == SessionState::Terminated);
    CHECK(testing::ProcessGone(pid));
}

TEST_CASE("ToolServerSession: error reply with a non-string message keeps its text",
          "[session]") {
    ToolServerSession session(ShellOptions(
        R"(read line; echo '{"jsonrpc":"2.0","id":1,"result":{}}'; read line; read line; )"
        R"(echo '{"jsonrpc":"2.0","id":2,"error":{"code":-32000,"message":{"detail":"x"}}}'; )"
        R"(cat >/dev/null)"));
    REQUIRE(session.Open(Deadline::After(2000ms)).IsOk());

    auto result = session.CallTool("hello", {{"message", "hi"}}, Deadline::After(2000ms));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Protocol);
    CHECK(result.Error().rpc_code == -32000);
    CHECK(result.Error().message.find("detail") != std::string::npos);
    CHECK(session.IsReady());
    session.Shutdown();
}

TEST_CASE("ToolServerSession: mistyped reply members are a protocol error", "[session]") {
    ToolServerSession session(ShellOptions(
        R"(read line; echo '{"jsonrpc":"2.0","id":1,"result":{}}'; read line; read line; )"
        R"(echo '{"jsonrpc":2,"id":2,"result":{}}'; cat >/dev/null)"));
    REQUIRE(session.Open(Deadline::After(2000ms)).IsOk());

    auto result = session.CallTool("hello", {{"message", "hi"}}, Deadline::After(2000ms));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Protocol);
    CHECK(session.State() == SessionState::Terminated);
}

TEST_CASE("ToolServerSession: non-object initialize result is accepted", "[session]") {
    ToolServerSession session(ShellOptions(
        R"(read line; echo '{"jsonrpc":"2.0","id":1,"result":"ok"}'; cat >/dev/null)"));
    REQUIRE(session.Open(Deadline::After(2000ms)).IsOk());
    CHECK(session.ServerInfo() == "ok");
    session.Shutdown();
}
