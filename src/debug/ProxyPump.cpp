#include "ProxyPump.hpp"
#include <spdlog/fmt/fmt.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <unistd.h>

namespace upnote_mcp {

ProxyPump::ProxyPump(std::string label, int source_fd, int destination_fd,
                     std::filesystem::path tee_path, DebugLog& log)
    : label_(std::move(label)),
      source_fd_(source_fd),
      destination_fd_(destination_fd),
      tee_path_(std::move(tee_path)),
      log_(log),
      sniffer_(label_, log) {}

void ProxyPump::on_source_closed(std::function<void()> callback) {
    on_source_closed_ = std::move(callback);
}

void ProxyPump::stop() {
    wake_.notify();
}

std::size_t ProxyPump::run() {
    std::ofstream tee(tee_path_, std::ios::binary | std::ios::trunc);
    if (!tee) {
        log_.log("ERROR", fmt::format("Pump [{}] cannot open tee file {}", label_, tee_path_.string()));
    }

    bool source_closed = false;

    while (true) {
        if (!wait_readable(source_fd_, &wake_)) {
            break;
        }

        char byte;
        ssize_t n = ::read(source_fd_, &byte, 1);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            log_.log("ERROR", fmt::format("Pump error [{}]: read failed: {}", label_, std::strerror(errno)));
            break;
        }
        if (n == 0) {
            source_closed = true;
            break;
        }

        if (!write_all(destination_fd_, std::string_view(&byte, 1))) {
            log_.log("ERROR", fmt::format("Pump error [{}]: write failed: {}", label_, std::strerror(errno)));
            break;
        }
        ++bytes_forwarded_;

        if (tee) {
            tee.put(byte);
            tee.flush();
        }

        try {
            sniffer_.feed(std::string_view(&byte, 1));
        } catch (const std::exception& e) {
            log_.log("ERROR", fmt::format("Summarizer error [{}]: {}", label_, e.what()));
        }
    }

    log_.log(label_, fmt::format("Pump finished after {} bytes{}", bytes_forwarded_.load(),
        source_closed ? " (source closed)" : ""));

    if (source_closed && on_source_closed_) {
        on_source_closed_();
    }

    return bytes_forwarded_;
}

} // namespace upnote_mcp
