#include "TripwireInspector.hpp"
#include "FdIo.hpp"
#include "MessageSniffer.hpp"
#include "mcp/Framing.hpp"
#include "mcp/MessageCodec.hpp"
#include <spdlog/fmt/fmt.h>
#include <cstdlib>
#include <filesystem>

namespace upnote_mcp {

namespace {
    constexpr const char* kCategory = "INPUT";
    constexpr const char* kEnvCategory = "ENV";

    bool is_blank_line(const std::string& line) {
        return line == "\r\n" || line == "\n";
    }

    bool looks_like_header(std::string_view line) {
        std::size_t colon = line.find(':');
        return colon != std::string_view::npos && colon > 0 && line.front() != '{' && line.front() != '[';
    }
}

TripwireInspector::TripwireInspector(DebugLog& log, int input_fd)
    : log_(log), input_fd_(input_fd) {}

TripwireOutcome TripwireInspector::run() {
    log_.log("STARTUP", "TRIPWIRE mode ON. Logging first client message then exit.");
    log_environment();

    FdReader reader(input_fd_);
    std::optional<std::string> first = reader.read_line();
    if (!first) {
        log_.log(kCategory, "No bytes from client (EOF?)");
        return finish(TripwireOutcome::NoInput);
    }

    std::string captured = *first;
    std::optional<Framing> framing = FramingDetector::detect(captured);

    if (framing == Framing::NDJSON) {
        DecodeResult result = MessageReader::decode_ndjson(captured.back() == '\n' ? captured : captured + "\n");
        if (result.status == DecodeStatus::Complete) {
            log_.log(kCategory, fmt::format("NDJSON line detected (length={})", result.body_size));
            MessageSniffer::summarize(log_, kCategory, *result.message, result.body_size);
            return finish(TripwireOutcome::Summarized);
        }
        if (result.status == DecodeStatus::Malformed) {
            log_.log(kCategory, fmt::format("JSON parse failed: {}", result.error));
            return finish(TripwireOutcome::ParseFailed);
        }
    }

    if (framing == Framing::LSP || looks_like_header(captured)) {
        // Header candidate: collect lines up to the blank separator line
        while (true) {
            std::optional<std::string> line = reader.read_line();
            if (!line) {
                log_.log(kCategory, "unexpected end of input while reading LSP headers");
                log_.log(kCategory, fmt::format("Raw first bytes ({}): {}", captured.size(),
                    MessageSniffer::escape_preview(captured, kPreviewBytes)));
                return finish(TripwireOutcome::UnexpectedEof);
            }
            captured += *line;
            if (is_blank_line(*line)) {
                break;
            }
        }

        std::size_t header_end = captured.find("\r\n\r\n");
        std::optional<std::size_t> length = header_end == std::string::npos
            ? std::nullopt
            : MessageReader::parse_content_length(std::string_view(captured).substr(0, header_end));

        if (length) {
            std::string body = reader.read_exact(*length);
            captured += body;
            if (body.size() < *length) {
                log_.log(kCategory, fmt::format("unexpected end of input: body has {} of {} bytes",
                    body.size(), *length));
                return finish(TripwireOutcome::UnexpectedEof);
            }

            DecodeResult result = MessageReader::decode_lsp(captured);
            if (result.status == DecodeStatus::Complete) {
                log_.log(kCategory, fmt::format("LSP message detected (length={})", result.body_size));
                MessageSniffer::summarize(log_, kCategory, *result.message, result.body_size);
                return finish(TripwireOutcome::Summarized);
            }
            log_.log(kCategory, fmt::format("JSON parse failed: {}", result.error));
            return finish(TripwireOutcome::ParseFailed);
        }
        log_.log(kCategory, "Invalid LSP header: missing or invalid Content-Length");
    } else {
        // One bounded extra read, then a last attempt with either framing
        captured += reader.read_some(kExtraReadBytes);
        if (auto detected = FramingDetector::detect(captured)) {
            DecodeResult result = MessageReader::decode(captured, *detected);
            if (result.status == DecodeStatus::Complete) {
                log_.log(kCategory, fmt::format("{} message detected (length={})",
                    *detected == Framing::LSP ? "LSP" : "NDJSON", result.body_size));
                MessageSniffer::summarize(log_, kCategory, *result.message, result.body_size);
                return finish(TripwireOutcome::Summarized);
            }
        }
    }

    log_.log(kCategory, fmt::format("Raw first bytes ({}): {}", captured.size(),
        MessageSniffer::escape_preview(captured, kPreviewBytes)));
    return finish(TripwireOutcome::RawPreview);
}

void TripwireInspector::log_environment() {
    std::error_code ec;
    std::filesystem::path exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    log_.log(kEnvCategory, "exe: " + (ec ? std::string("<unknown>") : exe.string()));

    std::filesystem::path cwd = std::filesystem::current_path(ec);
    log_.log(kEnvCategory, "cwd: " + (ec ? std::string("<unknown>") : cwd.string()));

    const char* path = std::getenv("PATH");
    log_.log(kEnvCategory, std::string("PATH: ") + (path ? path : "<unset>"));
}

TripwireOutcome TripwireInspector::finish(TripwireOutcome outcome) {
    log_.log("COMPLETE", fmt::format("Tripwire captured ({}). Exiting now (client likely sees disconnect).",
        to_string(outcome)));
    return outcome;
}

std::string_view TripwireInspector::to_string(TripwireOutcome outcome) {
    switch (outcome) {
        case TripwireOutcome::Summarized:
            return "summarized";
        case TripwireOutcome::ParseFailed:
            return "parse failed";
        case TripwireOutcome::UnexpectedEof:
            return "unexpected end of input";
        case TripwireOutcome::RawPreview:
            return "raw preview";
        case TripwireOutcome::NoInput:
            return "no input";
    }
    return "unknown";
}

} // namespace upnote_mcp
