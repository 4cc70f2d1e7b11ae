#pragma once

#include <mcp_host/core/log.hpp>

#include <optional>
#include <string>

namespace mcp_host {

struct ToolsConfig {
    std::string root = "mcp_tools";
    std::string interpreter = "python3";
    std::string git_repository = ".";
    std::optional<std::string> hello_server;  // explicit hello server binary
};

struct TimeoutConfig {
    double tool_seconds = 30.0;
    double planner_seconds = 20.0;
    int start_grace_ms = 100;
    int exit_wait_ms = 500;
    int terminate_wait_ms = 1000;
};

struct PlannerConfig {
    std::string kind = "heuristic";  // heuristic | ollama
    std::string model = "llama3.1";
    std::string endpoint = "http://127.0.0.1:11434";
};

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    bool json = false;
    bool color = true;
};

struct AppConfig {
    ToolsConfig tools;
    TimeoutConfig timeouts;
    PlannerConfig planner;
    LogConfig log;
};

} // namespace mcp_host
