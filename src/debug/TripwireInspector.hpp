#pragma once

#include "DebugLog.hpp"
#include <cstddef>
#include <string>
#include <unistd.h>

namespace upnote_mcp {

/**
 * @brief How a tripwire run ended
 */
enum class TripwireOutcome {
    Summarized,     // one complete message was decoded and logged
    ParseFailed,    // a complete frame arrived but its body was not JSON
    UnexpectedEof,  // input ended inside an lsp header block or body
    RawPreview,     // no framing matched; the raw prefix was logged
    NoInput         // end of input before any byte
};

/**
 * @brief One-shot inspector for the first inbound message
 *
 * Does not spawn a server and never replies; the client sees a disconnect
 * once the process exits.
 */
class TripwireInspector {
public:
    static constexpr std::size_t kExtraReadBytes = 8192;
    static constexpr std::size_t kPreviewBytes = 256;

    explicit TripwireInspector(DebugLog& log, int input_fd = STDIN_FILENO);

    /**
     * @brief Capture, classify and log exactly one inbound message
     */
    TripwireOutcome run();

    static std::string_view to_string(TripwireOutcome outcome);

private:
    /// Executable, working directory and PATH under "ENV"
    void log_environment();

    TripwireOutcome finish(TripwireOutcome outcome);

    DebugLog& log_;
    int input_fd_;
};

} // namespace upnote_mcp
