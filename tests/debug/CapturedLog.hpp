#pragma once

#include "debug/DebugLog.hpp"
#include <spdlog/sinks/ostream_sink.h>
#include <memory>
#include <sstream>
#include <string>

namespace upnote_mcp {

/**
 * @brief DebugLog writing into a string stream for assertions
 */
class CapturedLog {
public:
    CapturedLog()
        : log(std::vector<spdlog::sink_ptr>{std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_, true)}) {}

    std::string text() const { return stream_.str(); }

    bool contains(const std::string& needle) const {
        return text().find(needle) != std::string::npos;
    }

private:
    std::ostringstream stream_;

public:
    DebugLog log;
};

} // namespace upnote_mcp
