#include <mcp_host/core/log.hpp>
#include <mcp_host/core/version.hpp>
#include <mcp_host/server/hello_tools.hpp>
#include <mcp_host/server/rpc_server.hpp>

#include <argparse/argparse.hpp>

#include <iostream>
#include <memory>

// mcp-hello-server: JSON-RPC tool server on stdin/stdout, logs on stderr.
int main(int argc, char* argv[]) {
    using namespace mcp_host;

    argparse::ArgumentParser program("mcp-hello-server", kVersion);
    program.add_description("Line-delimited JSON-RPC server exposing the hello tool");
    program.add_argument("--verbose")
        .help("Debug logging on stderr")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--json-log")
        .help("Log as JSON lines")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << program;
        return 2;
    }

    const auto level = program.get<bool>("--verbose") ? LogLevel::Debug : LogLevel::Info;
    if (program.get<bool>("--json-log")) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), level);
    } else {
        InitGlobalLogger(std::make_unique<ConsoleSink>(std::cerr), level);
    }

    // stdout carries protocol lines only.
    std::ios::sync_with_stdio(false);

    ServerInfo info;
    info.name = "Hello Server";
    info.version = kVersion;

    RpcServer server(std::move(info), MakeHelloCatalog(), std::cin, std::cout);
    LogInfo("rpc-server", "serving on stdio");
    server.Run();
    LogInfo("rpc-server", "stopped");
    return 0;
}
