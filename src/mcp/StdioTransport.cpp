#include "StdioTransport.hpp"
#include "MessageCodec.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace upnote_mcp {

namespace {
    bool is_blank(std::string_view bytes) {
        return bytes.find_first_not_of(" \t\r\n\f\v") == std::string_view::npos;
    }
}

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    spdlog::debug("StdioTransport initialized");
}

std::optional<json> StdioTransport::read_message() {
    while (true) {
        if (auto message = extract_message()) {
            return message;
        }

        if (!fill_buffer()) {
            // A final ndjson line may lack its terminator
            if (framing_ != Framing::LSP && !eof_ && !is_blank(buffer_.view())) {
                eof_ = true;
                buffer_.append('\n');
                if (auto message = extract_message()) {
                    return message;
                }
            }
            eof_ = true;
            if (!buffer_.empty() && !is_blank(buffer_.view())) {
                spdlog::warn("Discarding {} trailing bytes at end of input", buffer_.size());
            }
            spdlog::debug("Reached end of input stream");
            return std::nullopt;
        }
    }
}

std::optional<json> StdioTransport::extract_message() {
    if (!framing_) {
        if (is_blank(buffer_.view())) {
            buffer_.clear();
            return std::nullopt;
        }

        framing_ = FramingDetector::detect(buffer_.view());
        if (!framing_) {
            if (buffer_.size() > kMaxUndetectedBytes) {
                spdlog::warn("No framing detected in {} bytes, discarding", buffer_.size());
                buffer_.clear();
            }
            return std::nullopt;
        }
        spdlog::info("Detected {} framing", FramingDetector::to_string(*framing_));
    }

    while (!buffer_.empty()) {
        DecodeResult result = MessageReader::decode(buffer_.view(), *framing_);

        switch (result.status) {
            case DecodeStatus::Complete:
                buffer_.consume(result.consumed);
                pending_frame_size_ = 0;
                spdlog::debug("Read message: {}", result.message->dump());
                return result.message;

            case DecodeStatus::Malformed:
                spdlog::warn("JSON parse error, skipping {} bytes: {}", result.consumed, result.error);
                buffer_.consume(result.consumed);
                pending_frame_size_ = 0;
                throw RpcError(error_code::kParseError, "Parse error: " + result.error);

            case DecodeStatus::Empty:
                buffer_.consume(result.consumed);
                break;

            case DecodeStatus::Incomplete:
                if (result.header_fault()) {
                    spdlog::warn("Dropping {} byte header block: {}", result.header_size, result.error);
                    buffer_.consume(result.header_size);
                    pending_frame_size_ = 0;
                    break;
                }
                pending_frame_size_ = result.frame_size;
                return std::nullopt;
        }
    }

    return std::nullopt;
}

bool StdioTransport::fill_buffer() {
    if (framing_ == Framing::LSP && pending_frame_size_ > buffer_.size()) {
        std::string body(std::min(pending_frame_size_ - buffer_.size(), kReadChunkSize), '\0');
        in_.read(body.data(), static_cast<std::streamsize>(body.size()));
        std::streamsize got = in_.gcount();
        if (got <= 0) {
            return false;
        }
        buffer_.append(std::string_view(body.data(), static_cast<std::size_t>(got)));
        return true;
    }

    std::string line;
    if (!std::getline(in_, line)) {
        if (in_.bad()) {
            spdlog::error("Error reading from input stream");
        }
        return false;
    }

    buffer_.append(line);
    if (!in_.eof()) {
        buffer_.append('\n');
    }
    return true;
}

void StdioTransport::write_message(const json& message) {
    std::string frame = MessageWriter::encode(message, framing_.value_or(Framing::NDJSON));

    std::lock_guard<std::mutex> lock(write_mutex_);
    out_.write(frame.data(), static_cast<std::streamsize>(frame.size()));
    out_.flush();
    if (!out_) {
        throw std::runtime_error("Failed to write message to output stream");
    }
    spdlog::debug("Wrote {} bytes", frame.size());
}

bool StdioTransport::is_open() const {
    return !eof_ && out_.good();
}

std::optional<Framing> StdioTransport::framing() const {
    return framing_;
}

} // namespace upnote_mcp
