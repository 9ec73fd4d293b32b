#include "MessageCodec.hpp"
#include <algorithm>
#include <cctype>

namespace upnote_mcp {

namespace {
    constexpr std::string_view kHeaderTerminator = "\r\n\r\n";
    constexpr std::string_view kLineBreak = "\r\n";

    std::string_view trim(std::string_view text) {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
            text.remove_prefix(1);
        }
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
            text.remove_suffix(1);
        }
        return text;
    }

    bool iequals(std::string_view a, std::string_view b) {
        return a.size() == b.size() &&
            std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                return std::tolower(static_cast<unsigned char>(x)) ==
                       std::tolower(static_cast<unsigned char>(y));
            });
    }

    void parse_body(std::string_view body, DecodeResult& result) {
        try {
            result.message = json::parse(body.begin(), body.end());
            result.status = DecodeStatus::Complete;
        } catch (const json::parse_error& e) {
            result.status = DecodeStatus::Malformed;
            result.error = e.what();
        }
    }
}

DecodeResult MessageReader::decode(std::string_view buffer, Framing framing) {
    return framing == Framing::LSP ? decode_lsp(buffer) : decode_ndjson(buffer);
}

DecodeResult MessageReader::decode_ndjson(std::string_view buffer) {
    DecodeResult result;

    std::size_t newline = buffer.find('\n');
    if (newline == std::string_view::npos) {
        return result;
    }

    std::string_view line = buffer.substr(0, newline);
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    result.consumed = newline + 1;
    result.frame_size = result.consumed;
    result.body_size = line.size();

    if (trim(line).empty()) {
        result.status = DecodeStatus::Empty;
        return result;
    }

    parse_body(line, result);
    return result;
}

DecodeResult MessageReader::decode_lsp(std::string_view buffer) {
    DecodeResult result;

    std::size_t separator = buffer.find(kHeaderTerminator);
    if (separator == std::string_view::npos) {
        return result;
    }

    result.header_size = separator + kHeaderTerminator.size();

    auto content_length = parse_content_length(buffer.substr(0, separator));
    if (!content_length) {
        result.error = "missing, invalid or oversized Content-Length header";
        return result;
    }

    result.frame_size = result.header_size + *content_length;
    result.body_size = *content_length;
    if (buffer.size() < result.frame_size) {
        return result;
    }

    result.consumed = result.frame_size;
    parse_body(buffer.substr(result.header_size, *content_length), result);
    return result;
}

std::optional<std::size_t> MessageReader::parse_content_length(std::string_view headers) {
    std::optional<std::size_t> length;

    while (!headers.empty()) {
        std::size_t eol = headers.find(kLineBreak);
        std::string_view line = headers.substr(0, eol);
        headers = (eol == std::string_view::npos) ? std::string_view() : headers.substr(eol + kLineBreak.size());

        std::size_t colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        if (!iequals(trim(line.substr(0, colon)), "content-length")) {
            continue;
        }

        std::string value(trim(line.substr(colon + 1)));
        if (value.empty() || !std::all_of(value.begin(), value.end(),
                [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        try {
            unsigned long long parsed = std::stoull(value);
            if (parsed == 0 || parsed > kMaxContentLength) {
                return std::nullopt;
            }
            length = static_cast<std::size_t>(parsed);
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }

    return length;
}

std::string MessageWriter::encode(const json& message, Framing framing) {
    std::string body = message.dump(-1, ' ', false, json::error_handler_t::replace);

    if (framing == Framing::LSP) {
        std::string header = "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
        std::string frame;
        frame.reserve(header.size() + body.size());
        frame.append(header);
        frame.append(body);
        return frame;
    }

    body.push_back('\n');
    return body;
}

} // namespace upnote_mcp
