#include "debug/DebugLog.hpp"
#include "debug/ProxySession.hpp"
#include "debug/TripwireInspector.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
    std::atomic<bool> interrupted{false};

    void signal_handler(int) {
        interrupted = true;
    }

    void setup_signal_handlers() {
        struct sigaction action{};
        action.sa_handler = signal_handler;
        sigemptyset(&action.sa_mask);
        sigaction(SIGINT, &action, nullptr);
        sigaction(SIGTERM, &action, nullptr);
        std::signal(SIGPIPE, SIG_IGN);
    }

    std::string env_or(const char* name, const std::string& fallback) {
        const char* value = std::getenv(name);
        return (value && *value) ? value : fallback;
    }

    // Server binary installed beside this wrapper
    fs::path default_server_path(const char* argv0) {
        std::error_code ec;
        fs::path self = fs::read_symlink("/proc/self/exe", ec);
        if (ec) {
            self = fs::absolute(argv0, ec);
        }
        return self.parent_path() / "upnote-mcp";
    }
}

int main(int argc, char** argv) {
    CLI::App app{"UpNote MCP debug wrapper (proxy + tripwire)"};

    std::string mode = "proxy";
    app.add_option("--mode", mode, "proxy: spawn the server and tee both directions; "
                                   "tripwire: log the first client message and exit")
        ->envname("MCP_WRAPPER_MODE")
        ->check(CLI::IsMember({"proxy", "tripwire"}));

    std::string server = default_server_path(argv[0]).string();
    app.add_option("--server", server, "Path to the real MCP server (proxy mode only)")
        ->envname("MCP_WRAPPER_SERVER");

    std::string log_dir = "logs";
    app.add_option("--log-dir", log_dir, "Directory for the debug log and raw dumps");

    std::string log_level = "warn";
    app.add_option("-l,--log-level", log_level, "Level for internal diagnostics")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical"}));

    std::vector<std::string> server_args;
    app.add_option("server_args", server_args, "Arguments passed to the server (after --)");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_default_logger(spdlog::stderr_color_mt("upnote-mcp-debug"));
    spdlog::set_level(spdlog::level::from_str(log_level));

    try {
        setup_signal_handlers();

        upnote_mcp::DebugLog log(log_dir);
        std::error_code ec;
        log.log("STARTUP", "Debug wrapper started, logging to: " + log.path().string());
        log.log("STARTUP", "Mode: " + mode);
        log.log("STARTUP", "Working dir: " + fs::current_path(ec).string());
        log.log("STARTUP", "PATH: " + env_or("PATH", "<unset>"));

        int exit_code = 0;
        if (mode == "proxy") {
            if (!fs::exists(server)) {
                log.log("ERROR", "Server not found: " + server);
                return 1;
            }
            log.log("STARTUP", "Server found: " + server);

            upnote_mcp::ProxyConfig config;
            config.command.push_back(server);
            config.command.insert(config.command.end(), server_args.begin(), server_args.end());
            config.log_dir = log_dir;

            upnote_mcp::ProxySession session(config, log);
            exit_code = session.run(interrupted);
        } else {
            upnote_mcp::TripwireInspector inspector(log);
            inspector.run();
        }

        std::cerr << "\n" << std::string(60, '=') << "\n"
                  << "Debug session complete.\n"
                  << "Log file: " << log.path().string() << "\n"
                  << "Binary dumps: "
                  << (fs::path(log_dir) / upnote_mcp::ProxySession::kClientToServerFile).string() << ", "
                  << (fs::path(log_dir) / upnote_mcp::ProxySession::kServerToClientFile).string() << "\n"
                  << std::string(60, '=') << std::endl;
        return exit_code;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
