#pragma once

#include "DebugLog.hpp"
#include "mcp/FrameBuffer.hpp"
#include "mcp/Framing.hpp"
#include "mcp/JsonRpc.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace upnote_mcp {

/**
 * @brief Best-effort message summarizer for one relayed direction
 *
 * Keeps its own copy of the relayed bytes, detects the framing once and logs
 * a one-line summary for every complete message. It never throws and never
 * touches the forwarded stream.
 */
class MessageSniffer {
public:
    static constexpr std::size_t kMaxUndetectedBytes = 64 * 1024;

    MessageSniffer(std::string label, DebugLog& log);

    /**
     * @brief Append relayed bytes and summarize any completed messages
     * @return Number of messages summarized by this call
     */
    std::size_t feed(std::string_view bytes);

    std::optional<Framing> framing() const { return framing_; }
    std::size_t buffered() const { return buffer_.size(); }

    /**
     * @brief Log the summary of one decoded body
     *
     * Objects log their method and id; other JSON values log their length.
     */
    static void summarize(DebugLog& log, std::string_view label, const json& message, std::size_t length);

    /**
     * @brief Printable rendering of raw bytes, at most max_bytes of input
     *
     * Printable ASCII is kept, \r \n \t and backslash are escaped, everything
     * else is shown as \xNN.
     */
    static std::string escape_preview(std::string_view bytes, std::size_t max_bytes);

private:
    std::size_t drain();

    std::string label_;
    DebugLog& log_;
    FrameBuffer buffer_;
    std::optional<Framing> framing_;
};

} // namespace upnote_mcp
