#include "MessageSniffer.hpp"
#include "mcp/MessageCodec.hpp"
#include <spdlog/fmt/fmt.h>

namespace upnote_mcp {

MessageSniffer::MessageSniffer(std::string label, DebugLog& log)
    : label_(std::move(label)), log_(log) {}

std::size_t MessageSniffer::feed(std::string_view bytes) {
    try {
        buffer_.append(bytes);
        return drain();
    } catch (const std::exception& e) {
        log_.log("ERROR", fmt::format("Summarizer error [{}]: {}", label_, e.what()));
        buffer_.clear();
        return 0;
    }
}

std::size_t MessageSniffer::drain() {
    if (!framing_) {
        if (buffer_.view().find_first_not_of(" \t\r\n") == std::string_view::npos) {
            buffer_.clear();
            return 0;
        }
        framing_ = FramingDetector::detect(buffer_.view());
        if (!framing_) {
            if (buffer_.size() > kMaxUndetectedBytes) {
                log_.log(label_, fmt::format("No framing detected, dropping {} bytes", buffer_.size()));
                buffer_.clear();
            }
            return 0;
        }
        log_.log(label_, fmt::format("Framing detected: {}", FramingDetector::to_string(*framing_)));
    }

    std::size_t summarized = 0;
    while (!buffer_.empty()) {
        DecodeResult result = MessageReader::decode(buffer_.view(), *framing_);

        if (result.header_fault()) {
            log_.log(label_, fmt::format("Invalid LSP header ({}), dropping {} bytes",
                result.error, result.header_size));
            buffer_.consume(result.header_size);
            continue;
        }
        if (result.status == DecodeStatus::Incomplete) {
            break;
        }

        std::size_t body_length = result.body_size;

        if (result.status == DecodeStatus::Complete) {
            if (*framing_ == Framing::LSP) {
                log_.log(label_, fmt::format("LSP message detected (length={})", body_length));
            } else {
                log_.log(label_, fmt::format("NDJSON line detected (length={})", body_length));
            }
            summarize(log_, label_, *result.message, body_length);
            ++summarized;
        } else if (result.status == DecodeStatus::Malformed) {
            log_.log(label_, fmt::format("JSON parse failed: {}", result.error));
        }

        buffer_.consume(result.consumed);
    }

    return summarized;
}

void MessageSniffer::summarize(DebugLog& log, std::string_view label, const json& message, std::size_t length) {
    if (message.is_object()) {
        json method = message.contains("method") ? message["method"] : json();
        json id = message.contains("id") ? message["id"] : json();
        log.log(label, fmt::format("JSON message summary: method={}, id={}", method.dump(), id.dump()));
    } else {
        log.log(label, fmt::format("JSON (non-dict) length={}", length));
    }
}

std::string MessageSniffer::escape_preview(std::string_view bytes, std::size_t max_bytes) {
    std::string out;
    for (unsigned char c : bytes.substr(0, max_bytes)) {
        switch (c) {
            case '\r': out += "\\r"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\\': out += "\\\\"; break;
            default:
                if (c >= 0x20 && c < 0x7F) {
                    out.push_back(static_cast<char>(c));
                } else {
                    out += fmt::format("\\x{:02x}", c);
                }
        }
    }
    return out;
}

} // namespace upnote_mcp
