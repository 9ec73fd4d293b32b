#pragma once

#include "DebugLog.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace upnote_mcp {

/**
 * @brief Settings of one proxy run
 */
struct ProxyConfig {
    std::vector<std::string> command;  // server program and arguments
    std::filesystem::path log_dir;     // receives the two tee files
    std::chrono::milliseconds grace{std::chrono::seconds(5)};
    int client_in = STDIN_FILENO;
    int client_out = STDOUT_FILENO;
};

/**
 * @brief Debug proxy between the real client and a spawned server
 *
 * Runs the client->server pump, the server->client pump and the stderr
 * mirror concurrently while the calling thread waits for the server to exit.
 */
class ProxySession {
public:
    static constexpr const char* kClientToServerFile = "proxy_client_to_server.bin";
    static constexpr const char* kServerToClientFile = "proxy_server_to_client.bin";

    ProxySession(ProxyConfig config, DebugLog& log);

    /**
     * @brief Spawn the server and relay until it exits
     * @param interrupted Set asynchronously to terminate the server
     * @return Server exit code, or 1 if it could not be started
     */
    int run(const std::atomic<bool>& interrupted);

    /**
     * @brief Replace invalid UTF-8 sequences with U+FFFD and strip trailing whitespace
     */
    static std::string sanitize_line(std::string_view bytes);

private:
    ProxyConfig config_;
    DebugLog& log_;
};

} // namespace upnote_mcp
