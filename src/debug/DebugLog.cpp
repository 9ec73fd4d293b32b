#include "DebugLog.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <ctime>

namespace upnote_mcp {

namespace {
    constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] %v";
}

DebugLog::DebugLog(const std::filesystem::path& log_dir)
    : start_(std::chrono::steady_clock::now()) {
    std::filesystem::create_directories(log_dir);
    path_ = log_dir / dated_file_name();

    std::vector<spdlog::sink_ptr> sinks = {
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(path_.string(), false),
        std::make_shared<spdlog::sinks::stderr_sink_mt>()
    };
    logger_ = std::make_shared<spdlog::logger>("mcp-debug", sinks.begin(), sinks.end());
    logger_->set_pattern(kPattern);
    logger_->set_level(spdlog::level::trace);
    logger_->flush_on(spdlog::level::trace);
}

DebugLog::DebugLog(std::vector<spdlog::sink_ptr> sinks)
    : start_(std::chrono::steady_clock::now()) {
    logger_ = std::make_shared<spdlog::logger>("mcp-debug", sinks.begin(), sinks.end());
    logger_->set_pattern(kPattern);
    logger_->set_level(spdlog::level::trace);
    logger_->flush_on(spdlog::level::trace);
}

void DebugLog::log(std::string_view category, std::string_view message) {
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    logger_->info("[{:8.3f}s] [{:<10}] {}", elapsed, category, message);
}

std::string DebugLog::dated_file_name() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char date[16];
    std::size_t len = std::strftime(date, sizeof(date), "%Y%m%d", &local);
    return "mcp_debug_" + std::string(date, len) + ".log";
}

} // namespace upnote_mcp
