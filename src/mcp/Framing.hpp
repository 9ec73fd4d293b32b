#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace upnote_mcp {

/**
 * @brief Wire framing used by a stdio peer
 *
 * Fixed for the lifetime of one stream once detected.
 */
enum class Framing {
    NDJSON,  // One JSON value per line, terminated by '\n'
    LSP      // "Content-Length: N\r\n\r\n" header block followed by N body bytes
};

/**
 * @brief Classifies a fresh stream from its first bytes
 */
class FramingDetector {
public:
    /// Header terminator must appear within this many leading bytes to count
    static constexpr std::size_t kHeaderScanWindow = 128;

    /**
     * @brief Detect framing from the first bytes of a stream
     *
     * LSP wins if the bytes start with "Content-Length:" or contain "\r\n\r\n"
     * within the scan window. Otherwise NDJSON if the first non-whitespace
     * byte opens a JSON object or array.
     *
     * @param bytes Leading bytes of the stream
     * @return Detected framing, or std::nullopt if more bytes are needed
     */
    static std::optional<Framing> detect(std::string_view bytes);

    /**
     * @brief Convert Framing to its log name ("ndjson" or "lsp")
     */
    static std::string_view to_string(Framing framing);
};

} // namespace upnote_mcp
