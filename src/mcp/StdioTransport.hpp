#pragma once

#include "FrameBuffer.hpp"
#include "Framing.hpp"
#include "ITransport.hpp"
#include <cstddef>
#include <iostream>
#include <mutex>
#include <optional>

namespace upnote_mcp {

/**
 * @brief Transport using standard input/output streams
 *
 * Detects the peer's framing (NDJSON or LSP-style Content-Length) from the
 * first bytes received and answers in the same framing. Reads never go past
 * the end of a complete message.
 */
class StdioTransport : public ITransport {
public:
    /// Undetected input beyond this size is discarded
    static constexpr std::size_t kMaxUndetectedBytes = 64 * 1024;

    /// Upper bound of a single body read
    static constexpr std::size_t kReadChunkSize = 64 * 1024;

    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    std::optional<json> read_message() override;
    void write_message(const json& message) override;
    bool is_open() const override;

    /**
     * @brief Framing detected on the inbound side, if any yet
     */
    std::optional<Framing> framing() const;

private:
    /// Decode buffered bytes; returns a message or nullopt if more input is needed
    std::optional<json> extract_message();

    /// Read the next line, or the missing lsp body bytes; false on end of input
    bool fill_buffer();

    std::istream& in_;
    std::ostream& out_;
    FrameBuffer buffer_;
    std::optional<Framing> framing_;
    std::size_t pending_frame_size_ = 0;
    bool eof_ = false;
    mutable std::mutex write_mutex_;
};

} // namespace upnote_mcp
