#include "ProxySession.hpp"
#include "ChildProcess.hpp"
#include "FdIo.hpp"
#include "ProxyPump.hpp"
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <thread>

namespace upnote_mcp {

namespace {
    constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

    // Length of the valid UTF-8 sequence starting at bytes[i], or 0
    std::size_t utf8_sequence_length(std::string_view bytes, std::size_t i) {
        auto byte = [&](std::size_t k) { return static_cast<unsigned char>(bytes[k]); };
        unsigned char lead = byte(i);

        std::size_t length;
        unsigned char min_second = 0x80;
        unsigned char max_second = 0xBF;
        if (lead < 0x80) {
            return 1;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) min_second = 0xA0;
            if (lead == 0xED) max_second = 0x9F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) min_second = 0x90;
            if (lead == 0xF4) max_second = 0x8F;
        } else {
            return 0;
        }

        if (i + length > bytes.size()) {
            return 0;
        }
        if (byte(i + 1) < min_second || byte(i + 1) > max_second) {
            return 0;
        }
        for (std::size_t k = 2; k < length; ++k) {
            if (byte(i + k) < 0x80 || byte(i + k) > 0xBF) {
                return 0;
            }
        }
        return length;
    }
}

ProxySession::ProxySession(ProxyConfig config, DebugLog& log)
    : config_(std::move(config)), log_(log) {}

std::string ProxySession::sanitize_line(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());

    std::size_t i = 0;
    while (i < bytes.size()) {
        std::size_t length = utf8_sequence_length(bytes, i);
        if (length == 0) {
            out.append(kReplacement);
            ++i;
        } else {
            out.append(bytes.substr(i, length));
            i += length;
        }
    }

    std::size_t end = out.find_last_not_of(" \t\r\n");
    out.erase(end == std::string::npos ? 0 : end + 1);
    return out;
}

int ProxySession::run(const std::atomic<bool>& interrupted) {
    std::string command_line;
    for (const auto& arg : config_.command) {
        command_line += (command_line.empty() ? "" : " ") + arg;
    }
    log_.log("STARTUP", "Proxy mode: launching server: " + command_line);

    std::unique_ptr<ChildProcess> child;
    try {
        child = std::make_unique<ChildProcess>(config_.command);
    } catch (const std::exception& e) {
        log_.log("ERROR", fmt::format("Failed to start server process: {}", e.what()));
        return 1;
    }
    log_.log("STARTUP", fmt::format("Server PID: {}", child->pid()));

    ProxyPump client_to_server("C->S", config_.client_in, child->stdin_fd(),
                               config_.log_dir / kClientToServerFile, log_);
    ProxyPump server_to_client("S->C", child->stdout_fd(), config_.client_out,
                               config_.log_dir / kServerToClientFile, log_);
    client_to_server.on_source_closed([&child]() { child->close_stdin(); });

    WakePipe mirror_wake;
    std::thread stderr_mirror([this, &child, &mirror_wake]() {
        try {
            FdReader reader(child->stderr_fd(), &mirror_wake);
            while (auto line = reader.read_line()) {
                log_.log("STDERR", sanitize_line(*line));
            }
        } catch (const std::exception& e) {
            log_.log("ERROR", fmt::format("stderr mirror error: {}", e.what()));
        }
    });
    std::thread c2s_thread([&client_to_server]() { client_to_server.run(); });
    std::thread s2c_thread([&server_to_client]() { server_to_client.run(); });

    int exit_code = -1;
    try {
        while (true) {
            if (auto code = child->try_wait()) {
                exit_code = *code;
                log_.log("SHUTDOWN", fmt::format("Server exited with code {}", exit_code));
                break;
            }
            if (interrupted) {
                log_.log("SHUTDOWN", "Interrupted; terminating server");
                exit_code = child->terminate(config_.grace);
                log_.log("SHUTDOWN", fmt::format("Server terminated with code {}", exit_code));
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    } catch (const std::exception& e) {
        log_.log("ERROR", fmt::format("Waiting for server failed: {}", e.what()));
        exit_code = child->terminate(config_.grace);
    }

    // The server is gone: drain what it already wrote, then release the pumps
    client_to_server.stop();
    server_to_client.stop();
    mirror_wake.notify();

    c2s_thread.join();
    s2c_thread.join();
    stderr_mirror.join();

    log_.log("SHUTDOWN", fmt::format("Relayed {} bytes C->S, {} bytes S->C",
        client_to_server.bytes_forwarded(), server_to_client.bytes_forwarded()));
    return exit_code;
}

} // namespace upnote_mcp
