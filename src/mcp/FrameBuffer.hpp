#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace upnote_mcp {

/**
 * @brief Byte accumulator for one stream direction
 *
 * Bytes are appended at the tail and consumed from the head only.
 * Incomplete frames stay buffered across reads.
 */
class FrameBuffer {
public:
    void append(std::string_view bytes);
    void append(char byte);

    /**
     * @brief Drop bytes from the head of the buffer
     * @param count Number of bytes to drop (clamped to size())
     */
    void consume(std::size_t count);

    void clear();

    std::string_view view() const { return data_; }
    std::size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

private:
    std::string data_;
};

} // namespace upnote_mcp
