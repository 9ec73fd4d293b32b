#include "FrameBuffer.hpp"
#include <algorithm>

namespace upnote_mcp {

void FrameBuffer::append(std::string_view bytes) {
    data_.append(bytes.data(), bytes.size());
}

void FrameBuffer::append(char byte) {
    data_.push_back(byte);
}

void FrameBuffer::consume(std::size_t count) {
    data_.erase(0, std::min(count, data_.size()));
}

void FrameBuffer::clear() {
    data_.clear();
}

} // namespace upnote_mcp
