#pragma once

#include "Framing.hpp"
#include "JsonRpc.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace upnote_mcp {

/**
 * @brief Outcome of one decode attempt
 */
enum class DecodeStatus {
    Complete,    // message holds the decoded value
    Incomplete,  // more bytes needed (or an lsp header fault, see error)
    Malformed,   // frame was complete but its body is not valid JSON
    Empty        // ndjson blank line; consumed is set, no message
};

struct DecodeResult {
    DecodeStatus status = DecodeStatus::Incomplete;
    std::optional<json> message;
    std::size_t consumed = 0;     // bytes the caller should drop from its buffer
    std::size_t frame_size = 0;   // total frame length once the lsp header is known
    std::size_t header_size = 0;  // lsp header block length including "\r\n\r\n"
    std::size_t body_size = 0;    // encoded message length without framing
    std::string error;

    /// lsp header block is complete but has no usable Content-Length
    bool header_fault() const {
        return status == DecodeStatus::Incomplete && !error.empty();
    }
};

/**
 * @brief Decodes one message from buffered bytes
 *
 * Never modifies the buffer; the caller drops `consumed` bytes itself.
 */
class MessageReader {
public:
    /// Largest Content-Length accepted; larger values are header faults
    static constexpr std::size_t kMaxContentLength = 64 * 1024 * 1024;

    static DecodeResult decode(std::string_view buffer, Framing framing);

    static DecodeResult decode_ndjson(std::string_view buffer);
    static DecodeResult decode_lsp(std::string_view buffer);

    /**
     * @brief Parse the Content-Length out of an lsp header block
     *
     * @param headers Header lines without the terminating blank line
     * @return Body length in [1, kMaxContentLength], or std::nullopt if missing,
     *         invalid or oversized
     */
    static std::optional<std::size_t> parse_content_length(std::string_view headers);
};

/**
 * @brief Encodes JSON values for a given framing
 */
class MessageWriter {
public:
    /**
     * @brief Encode a message
     * @param message Value to encode (compact, UTF-8)
     * @param framing Framing of the peer
     * @return Bytes ready to be written in one call
     */
    static std::string encode(const json& message, Framing framing);
};

} // namespace upnote_mcp
