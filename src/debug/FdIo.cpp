#include "FdIo.hpp"
#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <system_error>
#include <unistd.h>

namespace upnote_mcp {

WakePipe::WakePipe() {
    if (::pipe(fds_) != 0) {
        throw std::system_error(errno, std::generic_category(), "Failed to create wake pipe");
    }
    for (int fd : fds_) {
        ::fcntl(fd, F_SETFD, FD_CLOEXEC);
        ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
    }
}

WakePipe::~WakePipe() {
    for (int fd : fds_) {
        if (fd >= 0) {
            ::close(fd);
        }
    }
}

void WakePipe::notify() {
    char byte = 1;
    ssize_t n;
    do {
        n = ::write(fds_[1], &byte, 1);
    } while (n < 0 && errno == EINTR);
    // EAGAIN means the pipe is already full of wake-ups
}

bool WakePipe::notified() const {
    pollfd pfd{fds_[0], POLLIN, 0};
    return ::poll(&pfd, 1, 0) > 0 && (pfd.revents & POLLIN);
}

bool wait_readable(int fd, const WakePipe* wake) {
    pollfd fds[2] = {
        {fd, POLLIN, 0},
        {wake ? wake->read_fd() : -1, POLLIN, 0}
    };

    while (true) {
        int ready = ::poll(fds, wake ? 2 : 1, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            // Let the caller's read() report the error
            return true;
        }
        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) {
            return true;
        }
        if (wake && (fds[1].revents & POLLIN)) {
            return false;
        }
    }
}

bool write_all(int fd, std::string_view bytes) {
    while (!bytes.empty()) {
        ssize_t n = ::write(fd, bytes.data(), bytes.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        bytes.remove_prefix(static_cast<std::size_t>(n));
    }
    return true;
}

FdReader::FdReader(int fd, const WakePipe* wake)
    : fd_(fd), wake_(wake) {}

bool FdReader::fill(std::size_t max_bytes) {
    if (!wait_readable(fd_, wake_)) {
        return false;
    }

    std::string chunk(max_bytes, '\0');
    while (true) {
        ssize_t n = ::read(fd_, chunk.data(), chunk.size());
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        buffer_.append(chunk.data(), static_cast<std::size_t>(n));
        return true;
    }
}

std::optional<std::string> FdReader::read_line() {
    std::size_t newline;
    while ((newline = buffer_.find('\n')) == std::string::npos) {
        if (!fill(kChunkSize)) {
            if (buffer_.empty()) {
                return std::nullopt;
            }
            std::string rest = std::move(buffer_);
            buffer_.clear();
            return rest;
        }
    }

    std::string line = buffer_.substr(0, newline + 1);
    buffer_.erase(0, newline + 1);
    return line;
}

std::string FdReader::read_exact(std::size_t count) {
    while (buffer_.size() < count) {
        if (!fill(std::min(count - buffer_.size(), kChunkSize))) {
            break;
        }
    }

    std::string out = buffer_.substr(0, count);
    buffer_.erase(0, out.size());
    return out;
}

std::string FdReader::read_some(std::size_t max_bytes) {
    if (buffer_.empty() && !fill(max_bytes)) {
        return "";
    }

    std::string out = buffer_.substr(0, max_bytes);
    buffer_.erase(0, out.size());
    return out;
}

} // namespace upnote_mcp
