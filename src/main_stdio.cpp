#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/GreetingTool.hpp"
#include "tools/CalculatorTool.hpp"
#include "tools/WeatherTool.hpp"
#include "resources/ConfigResource.hpp"
#include "resources/FileResource.hpp"
#include "prompts/CodeReviewPrompt.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <memory>
#include <atomic>

namespace {
    std::atomic<bool> shutdown_requested{false};
    stdio_mcp::MCPServer* global_server = nullptr;

    void signal_handler(int signal) {
        spdlog::info("Received signal {}, shutting down gracefully", signal);
        shutdown_requested = true;
        if (global_server) {
            global_server->stop();
        }
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }
}

int main(int argc, char** argv) {
    // Parse command-line arguments
    CLI::App app{"MCP Stdio Server - tools, resources and prompts over JSON-RPC"};

    std::string log_level = "info";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical, off)")
        ->default_val("info");

    stdio_mcp::ServerConfig config;
    app.add_option("-n,--name", config.name, "Server name reported by initialize")
        ->default_val(config.name);
    app.add_option("--server-version", config.version, "Server version reported by initialize")
        ->default_val(config.version);

    std::string data_dir = "./data";
    app.add_option("-d,--data-dir", data_dir, "Base directory served as file:///data/")
        ->default_val("./data");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "stdio-mcp-server version " << config.version << std::endl;
        return 0;
    }

    // stdout carries the protocol, diagnostics go to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("stdio-mcp"));

    auto level = spdlog::level::from_str(log_level);
    if (level == spdlog::level::off && log_level != "off") {
        std::cerr << "Invalid log level: " << log_level << std::endl;
        return 1;
    }
    spdlog::set_level(level);

    spdlog::info("Starting MCP Stdio Server");
    spdlog::info("Log level: {}", log_level);

    try {
        // Setup signal handlers for graceful shutdown
        setup_signal_handlers();

        auto transport = std::make_unique<stdio_mcp::StdioTransport>();
        auto server = std::make_unique<stdio_mcp::MCPServer>(std::move(transport), config);

        // Store global reference for signal handler
        global_server = server.get();

        server->register_tool(stdio_mcp::GreetingTool::get_info(),
            std::make_shared<stdio_mcp::GreetingTool>());
        server->register_tool(stdio_mcp::CalculatorTool::get_info(),
            std::make_shared<stdio_mcp::CalculatorTool>());
        server->register_tool(stdio_mcp::WeatherTool::get_info(),
            std::make_shared<stdio_mcp::WeatherTool>());

        server->register_resource(stdio_mcp::ConfigResource::get_info(),
            std::make_shared<stdio_mcp::ConfigResource>());
        server->register_resource(stdio_mcp::FileResource::get_info(),
            std::make_shared<stdio_mcp::FileResource>(data_dir));

        server->register_prompt(stdio_mcp::CodeReviewPrompt::get_info(),
            std::make_shared<stdio_mcp::CodeReviewPrompt>());

        spdlog::info("All handlers registered, starting server");

        // Run server (blocks until stopped)
        server->run();

        global_server = nullptr;
        spdlog::info("Server stopped cleanly");
        return 0;

    } catch (const std::exception& e) {
        global_server = nullptr;
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
