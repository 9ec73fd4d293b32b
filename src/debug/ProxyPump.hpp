#pragma once

#include "DebugLog.hpp"
#include "FdIo.hpp"
#include "MessageSniffer.hpp"
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>

namespace upnote_mcp {

/**
 * @brief One direction of the debug proxy
 *
 * Relays bytes from source to destination one at a time, tees each byte to a
 * file and feeds a MessageSniffer for log summaries. Forwarding never waits
 * on, and is never affected by, summarization.
 */
class ProxyPump {
public:
    /**
     * @brief Construct pump
     * @param label Log category for this direction (e.g. "C->S")
     * @param source_fd Descriptor read from (not owned)
     * @param destination_fd Descriptor written to (not owned)
     * @param tee_path Raw copy of every forwarded byte, truncated on start
     * @param log Shared debug log
     */
    ProxyPump(std::string label, int source_fd, int destination_fd,
              std::filesystem::path tee_path, DebugLog& log);

    /**
     * @brief Callback invoked once when the source reaches end of input
     */
    void on_source_closed(std::function<void()> callback);

    /**
     * @brief Relay until the source closes, a transport fault or stop()
     * @return Number of bytes forwarded
     */
    std::size_t run();

    /**
     * @brief Ask run() to return once no more bytes are immediately available
     *
     * Safe to call from any thread.
     */
    void stop();

    std::size_t bytes_forwarded() const { return bytes_forwarded_; }
    const std::string& label() const { return label_; }

private:
    std::string label_;
    int source_fd_;
    int destination_fd_;
    std::filesystem::path tee_path_;
    DebugLog& log_;
    MessageSniffer sniffer_;
    WakePipe wake_;
    std::function<void()> on_source_closed_;
    std::atomic<std::size_t> bytes_forwarded_{0};
};

} // namespace upnote_mcp
