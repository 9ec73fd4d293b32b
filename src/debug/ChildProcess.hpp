#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace upnote_mcp {

/**
 * @brief Child process with piped stdin, stdout and stderr
 *
 * The destructor closes the pipes and reaps the child, killing it if it is
 * still running.
 */
class ChildProcess {
public:
    /// Exit status reported when exec fails in the child
    static constexpr int kExecFailedStatus = 127;

    /**
     * @brief Spawn a process
     * @param argv Program and arguments; argv[0] is looked up in PATH
     * Throws std::invalid_argument for an empty argv and std::system_error if
     * pipes or fork fail.
     */
    explicit ChildProcess(const std::vector<std::string>& argv);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }
    int stdin_fd() const { return stdin_fd_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    /// Close the child's stdin so it sees end of input; idempotent
    void close_stdin();

    /**
     * @brief Block until the child exits
     * @return Exit code, or 128 + signal number if killed by a signal
     */
    int wait();

    /**
     * @brief Reap the child if it has exited
     * @return Exit code, or std::nullopt while it is still running
     */
    std::optional<int> try_wait();

    /**
     * @brief SIGTERM, wait up to grace, then SIGKILL
     * @return Exit code of the child
     */
    int terminate(std::chrono::milliseconds grace = std::chrono::seconds(5));

private:
    static int decode_status(int status);

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::mutex mutex_;
    std::optional<int> exit_code_;
};

} // namespace upnote_mcp
