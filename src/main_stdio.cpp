#include "core/UpNoteClient.hpp"
#include "core/UrlLauncher.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/NoteTool.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <iostream>
#include <memory>

namespace {
    upnote_mcp::MCPServer* global_server = nullptr;

    void signal_handler(int signal) {
        if (global_server) {
            global_server->stop();
        }
        // Default action unblocks the pending read on stdin
        std::signal(signal, SIG_DFL);
        std::raise(signal);
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGPIPE, SIG_IGN);
    }
}

int main(int argc, char** argv) {
    // Parse command-line arguments
    CLI::App app{"UpNote MCP Server - stdio transport (NDJSON and Content-Length framing)"};

    std::string log_level = "info";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("info")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical"}));

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << upnote_mcp::MCPServer::kServerName << " version "
                  << upnote_mcp::MCPServer::kServerVersion << std::endl;
        return 0;
    }

    // stdout carries protocol messages only
    spdlog::set_default_logger(spdlog::stderr_color_mt("upnote-mcp"));
    spdlog::set_level(spdlog::level::from_str(log_level));

    spdlog::info("Starting UpNote MCP Server (stdio, dual framing)");
    spdlog::info("Log level: {}", log_level);

    try {
        setup_signal_handlers();

        auto launcher = std::make_shared<upnote_mcp::SystemUrlLauncher>();
        auto client = std::make_shared<upnote_mcp::UpNoteClient>(launcher);
        auto transport = std::make_unique<upnote_mcp::StdioTransport>();
        auto server = std::make_unique<upnote_mcp::MCPServer>(std::move(transport));

        global_server = server.get();

        upnote_mcp::register_note_tools(*server, client);
        spdlog::info("All tools registered, starting server");

        // Run server (blocks until shutdown or end of input)
        server->run();

        global_server = nullptr;
        spdlog::info("Server stopped cleanly");
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
