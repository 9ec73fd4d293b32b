#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace upnote_mcp {

/**
 * @brief Self-pipe used to wake threads blocked in poll()
 */
class WakePipe {
public:
    WakePipe();
    ~WakePipe();

    WakePipe(const WakePipe&) = delete;
    WakePipe& operator=(const WakePipe&) = delete;

    /// Wake every waiter; stays signalled afterwards
    void notify();

    bool notified() const;

    int read_fd() const { return fds_[0]; }

private:
    int fds_[2] = {-1, -1};
};

/**
 * @brief Block until fd is readable (or hung up)
 *
 * Data on fd wins over a pending wake-up, so a stopped reader still drains
 * bytes that are already available.
 *
 * @return true if fd can be read, false if woken with nothing to read
 */
bool wait_readable(int fd, const WakePipe* wake);

/**
 * @brief Write all bytes, retrying on EINTR and short writes
 * @return false if the write failed (errno is preserved)
 */
bool write_all(int fd, std::string_view bytes);

/**
 * @brief Buffered line and block reader over a file descriptor
 */
class FdReader {
public:
    static constexpr std::size_t kChunkSize = 4096;

    explicit FdReader(int fd, const WakePipe* wake = nullptr);

    /**
     * @brief Read up to and including the next '\n'
     * @return Line (without '\n' only at end of input), or std::nullopt at end of input
     */
    std::optional<std::string> read_line();

    /**
     * @brief Read exactly count bytes unless input ends first
     */
    std::string read_exact(std::size_t count);

    /**
     * @brief Return buffered bytes, or the result of one read of at most max_bytes
     */
    std::string read_some(std::size_t max_bytes);

private:
    bool fill(std::size_t max_bytes);

    int fd_;
    const WakePipe* wake_;
    std::string buffer_;
};

} // namespace upnote_mcp
