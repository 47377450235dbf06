#include "core/ProcessExecutor.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "prompts/PromptCatalog.hpp"
#include "tools/RequestDispatcher.hpp"
#include "tools/ToolRegistry.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <signal.h>

namespace {
    constexpr const char* kServerName = "gemini-mcp";
    constexpr const char* kServerVersion = "0.1.0";

    std::atomic<bool> shutdown_requested{false};
    gemini_mcp::MCPServer* global_server = nullptr;

    // Only atomic stores here; MCPServer::stop() does nothing else
    void signal_handler(int signal) {
        shutdown_requested = true;
        if (global_server) {
            global_server->stop();
        }
        static_cast<void>(signal);
    }

    void setup_signal_handlers() {
        struct sigaction action {};
        action.sa_handler = signal_handler;
        sigemptyset(&action.sa_mask);
        // No SA_RESTART: a blocked read on stdin fails with EINTR and the loop exits
        action.sa_flags = 0;
        sigaction(SIGINT, &action, nullptr);
        sigaction(SIGTERM, &action, nullptr);

        // A client closing its end must not kill the server mid-write
        std::signal(SIGPIPE, SIG_IGN);
    }
}

int main(int argc, char** argv) {
    CLI::App app{"Gemini MCP Server - large-context codebase analysis via the Gemini CLI"};

    std::string log_level = "info";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical"}))
        ->default_val("info");

    std::string program = "gemini";
    app.add_option("--gemini-binary", program, "Name or path of the Gemini CLI executable")
        ->default_val("gemini");

    std::string model;
    app.add_option("-m,--model", model, "Gemini model passed to the CLI with -m (default: CLI's own)");

    long timeout_seconds = 600;
    app.add_option("-t,--timeout", timeout_seconds, "Seconds before a Gemini run is killed (0 = no limit)")
        ->check(CLI::NonNegativeNumber)
        ->default_val(600);

    std::size_t max_concurrency = 4;
    app.add_option("-j,--max-concurrency", max_concurrency,
                   "Tool calls run in parallel (0 = one at a time on the reader thread)")
        ->default_val(4);

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << kServerName << " version " << kServerVersion << std::endl;
        return 0;
    }

    // stdout carries the protocol, so every log line goes to stderr
    auto logger = spdlog::stderr_color_mt(kServerName);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(log_level));

    spdlog::info("Starting {} {}", kServerName, kServerVersion);
    spdlog::info("Log level: {}", log_level);

    try {
        setup_signal_handlers();

        gemini_mcp::ExecutorOptions executor_options;
        executor_options.program = program;
        executor_options.timeout = std::chrono::seconds(timeout_seconds);

        gemini_mcp::DispatcherOptions dispatcher_options;
        dispatcher_options.program = program;
        if (!model.empty()) {
            dispatcher_options.model = model;
        }

        gemini_mcp::ServerOptions server_options;
        server_options.name = kServerName;
        server_options.version = kServerVersion;
        server_options.max_concurrent_calls = max_concurrency;

        const gemini_mcp::ToolRegistry registry;
        gemini_mcp::PromptCatalog prompts;
        gemini_mcp::ProcessExecutor executor(executor_options);
        gemini_mcp::RequestDispatcher dispatcher(registry, executor, dispatcher_options);

        auto transport = std::make_unique<gemini_mcp::StdioTransport>();
        auto server = std::make_unique<gemini_mcp::MCPServer>(
            std::move(transport), dispatcher, prompts, server_options);

        // Store global reference for signal handler
        global_server = server.get();

        spdlog::info("{} tools and {} prompts registered, timeout {}s, concurrency {}",
                     registry.list_tools().size(), prompts.definitions().size(),
                     timeout_seconds, max_concurrency);

        // Run server (blocks until stopped)
        server->run();

        global_server = nullptr;
        spdlog::info("Server stopped cleanly{}", shutdown_requested ? " after signal" : "");
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
