#include "mcp/MessageCodec.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace upnote_mcp;

TEST(MessageReaderTest, NdjsonIncompleteWithoutNewline) {
    DecodeResult result = MessageReader::decode(R"({"id":1)", Framing::NDJSON);

    EXPECT_EQ(result.status, DecodeStatus::Incomplete);
    EXPECT_EQ(result.consumed, 0u);
    EXPECT_FALSE(result.message.has_value());
}

TEST(MessageReaderTest, NdjsonConsumesExactlyOneLine) {
    std::string line = R"({"jsonrpc":"2.0","id":1,"method":"ping"})";
    std::string buffer = line + "\n" + R"({"jsonrpc":"2.0","me)";

    DecodeResult result = MessageReader::decode(buffer, Framing::NDJSON);

    ASSERT_EQ(result.status, DecodeStatus::Complete);
    EXPECT_EQ(result.consumed, line.size() + 1);
    EXPECT_EQ(result.body_size, line.size());
    EXPECT_EQ((*result.message)["method"], "ping");
    EXPECT_EQ((*result.message)["id"], 1);
}

TEST(MessageReaderTest, NdjsonStripsCarriageReturn) {
    DecodeResult result = MessageReader::decode("{\"a\":1}\r\n", Framing::NDJSON);

    ASSERT_EQ(result.status, DecodeStatus::Complete);
    EXPECT_EQ(result.consumed, 9u);
    EXPECT_EQ((*result.message)["a"], 1);
}

TEST(MessageReaderTest, NdjsonParseErrorStillAdvances) {
    DecodeResult result = MessageReader::decode("{not json}\n{\"a\":1}\n", Framing::NDJSON);

    EXPECT_EQ(result.status, DecodeStatus::Malformed);
    EXPECT_EQ(result.consumed, 11u);
    EXPECT_FALSE(result.error.empty());
}

TEST(MessageReaderTest, NdjsonBlankLine) {
    DecodeResult result = MessageReader::decode(" \r\n{}", Framing::NDJSON);

    EXPECT_EQ(result.status, DecodeStatus::Empty);
    EXPECT_EQ(result.consumed, 3u);
}

TEST(MessageReaderTest, DecodeDoesNotDependOnPriorCalls) {
    std::string buffer = "{\"a\":1}\n";
    DecodeResult first = MessageReader::decode(buffer, Framing::NDJSON);
    DecodeResult second = MessageReader::decode(buffer, Framing::NDJSON);

    EXPECT_EQ(first.consumed, second.consumed);
    EXPECT_EQ(*first.message, *second.message);
}

TEST(MessageReaderTest, LspMinimalMessage) {
    DecodeResult result = MessageReader::decode("Content-Length: 2\r\n\r\n{}", Framing::LSP);

    ASSERT_EQ(result.status, DecodeStatus::Complete);
    EXPECT_EQ(*result.message, json::object());
    EXPECT_EQ(result.consumed, 23u);
    EXPECT_EQ(result.header_size, 21u);
}

TEST(MessageReaderTest, LspHeaderKeysAreCaseInsensitive) {
    std::string buffer = "content-type: application/vscode-jsonrpc\r\nCONTENT-LENGTH:  7\r\n\r\n{\"a\":1}";

    DecodeResult result = MessageReader::decode(buffer, Framing::LSP);

    ASSERT_EQ(result.status, DecodeStatus::Complete);
    EXPECT_EQ((*result.message)["a"], 1);
    EXPECT_EQ(result.consumed, buffer.size());
}

TEST(MessageReaderTest, LspBodySplitAcrossReads) {
    std::string body = R"({"jsonrpc":"2.0","id":1,"method":"ping"})";
    std::string frame = "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
    std::string first_part = frame.substr(0, frame.size() - 10);

    DecodeResult partial = MessageReader::decode(first_part, Framing::LSP);
    EXPECT_EQ(partial.status, DecodeStatus::Incomplete);
    EXPECT_EQ(partial.consumed, 0u);
    EXPECT_FALSE(partial.message.has_value());
    EXPECT_FALSE(partial.header_fault());
    EXPECT_EQ(partial.frame_size, frame.size());

    DecodeResult full = MessageReader::decode(frame, Framing::LSP);
    ASSERT_EQ(full.status, DecodeStatus::Complete);
    EXPECT_EQ((*full.message)["method"], "ping");
    EXPECT_EQ(full.consumed, frame.size());
}

TEST(MessageReaderTest, LspIncompleteHeader) {
    DecodeResult result = MessageReader::decode("Content-Length: 2\r\n", Framing::LSP);

    EXPECT_EQ(result.status, DecodeStatus::Incomplete);
    EXPECT_FALSE(result.header_fault());
}

TEST(MessageReaderTest, LspMissingContentLengthIsHeaderFault) {
    DecodeResult result = MessageReader::decode("Content-Type: x\r\n\r\n{}", Framing::LSP);

    EXPECT_EQ(result.status, DecodeStatus::Incomplete);
    EXPECT_EQ(result.consumed, 0u);
    EXPECT_TRUE(result.header_fault());
    EXPECT_EQ(result.header_size, 19u);
}

TEST(MessageReaderTest, LspNonPositiveOrNonNumericLength) {
    EXPECT_TRUE(MessageReader::decode("Content-Length: 0\r\n\r\n", Framing::LSP).header_fault());
    EXPECT_TRUE(MessageReader::decode("Content-Length: -5\r\n\r\n", Framing::LSP).header_fault());
    EXPECT_TRUE(MessageReader::decode("Content-Length: abc\r\n\r\n", Framing::LSP).header_fault());
}

TEST(MessageReaderTest, LspOversizedLengthIsHeaderFault) {
    std::string frame = "Content-Length: 18446744073709551615\r\n\r\n{}";
    DecodeResult result = MessageReader::decode_lsp(frame);

    EXPECT_EQ(result.status, DecodeStatus::Incomplete);
    EXPECT_TRUE(result.header_fault());
    EXPECT_EQ(result.header_size, frame.size() - 2);
    EXPECT_FALSE(result.message.has_value());
    EXPECT_EQ(result.consumed, 0u);
}

TEST(MessageReaderTest, ContentLengthUpperBound) {
    std::string at_limit = "Content-Length: " + std::to_string(MessageReader::kMaxContentLength);
    std::string over_limit = "Content-Length: " + std::to_string(MessageReader::kMaxContentLength + 1);

    EXPECT_EQ(MessageReader::parse_content_length(at_limit).value_or(0), MessageReader::kMaxContentLength);
    EXPECT_FALSE(MessageReader::parse_content_length(over_limit).has_value());
    EXPECT_FALSE(MessageReader::parse_content_length("Content-Length: 99999999999999999999999").has_value());

    DecodeResult pending = MessageReader::decode_lsp(at_limit + "\r\n\r\n{}");
    EXPECT_EQ(pending.status, DecodeStatus::Incomplete);
    EXPECT_FALSE(pending.header_fault());
}

TEST(MessageReaderTest, LspMalformedBody) {
    DecodeResult result = MessageReader::decode("Content-Length: 3\r\n\r\n{x}rest", Framing::LSP);

    EXPECT_EQ(result.status, DecodeStatus::Malformed);
    EXPECT_EQ(result.consumed, 24u);
}

TEST(MessageReaderTest, ParseContentLength) {
    EXPECT_EQ(MessageReader::parse_content_length("Content-Length: 17"), 17u);
    EXPECT_EQ(MessageReader::parse_content_length("X: y\r\ncontent-length:5"), 5u);
    EXPECT_FALSE(MessageReader::parse_content_length("X: y").has_value());
    EXPECT_FALSE(MessageReader::parse_content_length("Content-Length: 1x").has_value());
}

TEST(MessageWriterTest, NdjsonAppendsNewline) {
    json message = {{"jsonrpc", "2.0"}, {"id", 1}, {"result", json::object()}};

    EXPECT_EQ(MessageWriter::encode(message, Framing::NDJSON), "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}\n");
}

TEST(MessageWriterTest, LspReproducesMinimalFrame) {
    std::string frame = "Content-Length: 2\r\n\r\n{}";
    DecodeResult decoded = MessageReader::decode(frame, Framing::LSP);
    ASSERT_EQ(decoded.status, DecodeStatus::Complete);

    EXPECT_EQ(MessageWriter::encode(*decoded.message, Framing::LSP), frame);
}

TEST(MessageWriterTest, LspLengthCountsUtf8Bytes) {
    json message = {{"text", "caf\xC3\xA9 \xE2\x9C\x93"}};
    std::string body = message.dump();

    std::string frame = MessageWriter::encode(message, Framing::LSP);

    EXPECT_EQ(frame, "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);
    EXPECT_EQ(body.size(), 22u);
}

TEST(MessageWriterTest, RoundTripBothFramings) {
    json values[] = {
        json::object(),
        json::array({1, "two", nullptr, 3.5}),
        {{"jsonrpc", "2.0"}, {"id", "abc"}, {"method", "tools/call"},
         {"params", {{"name", "create_note"}, {"arguments", {{"text", "line1\nline2"}}}}}}
    };

    for (const auto& value : values) {
        for (Framing framing : {Framing::NDJSON, Framing::LSP}) {
            DecodeResult result = MessageReader::decode(MessageWriter::encode(value, framing), framing);
            ASSERT_EQ(result.status, DecodeStatus::Complete);
            EXPECT_EQ(*result.message, value);
        }
    }
}
