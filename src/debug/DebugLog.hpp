#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/sinks/sink.h>

namespace upnote_mcp {

/**
 * @brief Append-only, categorized log shared by all debug wrapper threads
 *
 * Each record is one line "[time] [elapsed] [CATEGORY] text" written to the
 * dated log file and to stderr. Records from concurrent threads never
 * interleave within a line.
 */
class DebugLog {
public:
    /**
     * @brief Open (or create) the dated log file inside a directory
     * @param log_dir Directory for the log file, created if missing
     */
    explicit DebugLog(const std::filesystem::path& log_dir);

    /**
     * @brief Log into arbitrary sinks (used by tests)
     */
    explicit DebugLog(std::vector<spdlog::sink_ptr> sinks);

    /**
     * @brief Write one record
     * @param category Short tag such as "STARTUP" or "C->S"
     * @param message Record text (a single line)
     */
    void log(std::string_view category, std::string_view message);

    /// Path of the log file, empty when constructed from sinks
    const std::filesystem::path& path() const { return path_; }

    /// Dated file name for today: mcp_debug_YYYYMMDD.log
    static std::string dated_file_name();

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::filesystem::path path_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace upnote_mcp
