#include "Framing.hpp"

namespace upnote_mcp {

namespace {
    constexpr std::string_view kContentLengthToken = "Content-Length:";
    constexpr std::string_view kHeaderTerminator = "\r\n\r\n";

    bool is_space(char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
    }
}

std::optional<Framing> FramingDetector::detect(std::string_view bytes) {
    if (bytes.substr(0, kContentLengthToken.size()) == kContentLengthToken) {
        return Framing::LSP;
    }
    if (bytes.substr(0, kHeaderScanWindow).find(kHeaderTerminator) != std::string_view::npos) {
        return Framing::LSP;
    }

    for (char c : bytes) {
        if (is_space(c)) {
            continue;
        }
        if (c == '{' || c == '[') {
            return Framing::NDJSON;
        }
        break;
    }

    return std::nullopt;
}

std::string_view FramingDetector::to_string(Framing framing) {
    switch (framing) {
        case Framing::NDJSON:
            return "ndjson";
        case Framing::LSP:
            return "lsp";
    }
    return "unknown";
}

} // namespace upnote_mcp
