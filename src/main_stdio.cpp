#include "core/Dispatcher.hpp"
#include "core/ServerConfig.hpp"
#include "core/ToolRegistry.hpp"
#include "mcp/Session.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/CalculatorTool.hpp"
#include "tools/CounterTool.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <csignal>
#include <iostream>
#include <memory>

namespace {
    toolrpc::Session* global_session = nullptr;

    void signal_handler(int signal) {
        spdlog::info("Received signal {}, shutting down gracefully", signal);
        if (global_session) {
            global_session->stop();
        }
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }

    std::string build_instructions(const toolrpc::ServerConfig& config) {
        std::string instructions = "This server exposes tools through tools/list and tools/call.";
        if (config.enables_calculator()) {
            instructions += " Use the 'calculator' tool to perform basic arithmetic operations.";
        }
        if (config.enables_counter()) {
            instructions += " Use 'increment', 'decrement' and 'get_value' to work with a shared counter.";
        }
        return instructions;
    }
}

int main(int argc, char** argv) {
    // Parse command-line arguments
    CLI::App app{"toolrpc - JSON-RPC 2.0 tool server over stdio"};

    toolrpc::ServerConfig config;

    app.add_option("-l,--log-level", config.log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("info");
    app.add_option("--log-file", config.log_file, "Also write logs to this file");
    app.add_option("-w,--workers", config.workers, "Number of requests handled concurrently")
        ->default_val(1)
        ->check(CLI::PositiveNumber);
    app.add_option("--tools", config.tools, "Tool set to expose")
        ->default_val("all")
        ->check(CLI::IsMember({"all", "calculator", "counter"}));
    app.add_option("--name", config.name, "Server name reported by initialize")
        ->default_val("toolrpc");
    app.add_flag("--wrap-content", config.wrap_content, "Return tool results as MCP content blocks");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "toolrpc version " << TOOLRPC_VERSION << std::endl;
        return 0;
    }

    try {
        config.validate();
        toolrpc::configure_logging(config);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    spdlog::info("Starting toolrpc stdio server");
    spdlog::info("Log level: {}", config.log_level);

    try {
        // Setup signal handlers for graceful shutdown
        setup_signal_handlers();

        // Registry is complete before the session starts and read-only afterwards
        auto registry = std::make_shared<toolrpc::ToolRegistry>();

        if (config.enables_calculator()) {
            registry->register_tool(toolrpc::CalculatorTool::descriptor());
        }
        if (config.enables_counter()) {
            auto counter = std::make_shared<toolrpc::Counter>();
            for (auto& descriptor : toolrpc::CounterTool::descriptors(counter)) {
                registry->register_tool(std::move(descriptor));
            }
        }

        toolrpc::DispatcherOptions options;
        options.server_name = config.name;
        options.server_version = TOOLRPC_VERSION;
        options.instructions = build_instructions(config);
        options.wrap_content = config.wrap_content;

        auto dispatcher = std::make_shared<const toolrpc::Dispatcher>(registry, options);
        auto transport = std::make_unique<toolrpc::StdioTransport>();
        auto session = std::make_unique<toolrpc::Session>(
            std::move(transport), dispatcher, toolrpc::SessionOptions{config.workers});

        // Store global reference for signal handler
        global_session = session.get();

        spdlog::info("All tools registered, starting session");

        // Run session (blocks until stopped)
        session->run();

        global_session = nullptr;
        spdlog::info("Server stopped cleanly");
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
