#include "ChildProcess.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <stdexcept>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace upnote_mcp {

namespace {
    void close_fd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    void make_pipe(int fds[2]) {
        if (::pipe(fds) != 0) {
            throw std::system_error(errno, std::generic_category(), "pipe failed");
        }
        ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
        ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    }
}

ChildProcess::ChildProcess(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw std::invalid_argument("Command cannot be empty");
    }

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};

    try {
        make_pipe(in_pipe);
        make_pipe(out_pipe);
        make_pipe(err_pipe);
    } catch (...) {
        for (int* fds : {in_pipe, out_pipe, err_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        throw;
    }

    std::vector<char*> args;
    std::vector<std::string> owned = argv;
    for (auto& arg : owned) {
        args.push_back(arg.data());
    }
    args.push_back(nullptr);

    pid_ = ::fork();
    if (pid_ < 0) {
        int error = errno;
        for (int* fds : {in_pipe, out_pipe, err_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        throw std::system_error(error, std::generic_category(), "fork failed");
    }

    if (pid_ == 0) {
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(args[0], args.data());
        ::_exit(kExecFailedStatus);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
}

ChildProcess::~ChildProcess() {
    close_stdin();
    try {
        if (!try_wait()) {
            ::kill(pid_, SIGKILL);
            wait();
        }
    } catch (const std::system_error& e) {
        spdlog::warn("Failed to reap child {}: {}", pid_, e.what());
    }
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

void ChildProcess::close_stdin() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_fd(stdin_fd_);
}

int ChildProcess::decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

int ChildProcess::wait() {
    if (exit_code_) {
        return *exit_code_;
    }

    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid failed");
        }
    }
    exit_code_ = decode_status(status);
    return *exit_code_;
}

std::optional<int> ChildProcess::try_wait() {
    if (exit_code_) {
        return exit_code_;
    }

    int status = 0;
    pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == 0) {
        return std::nullopt;
    }
    if (result < 0) {
        if (errno == EINTR) {
            return std::nullopt;
        }
        throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
    exit_code_ = decode_status(status);
    return exit_code_;
}

int ChildProcess::terminate(std::chrono::milliseconds grace) {
    if (auto code = try_wait()) {
        return *code;
    }

    ::kill(pid_, SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (auto code = try_wait()) {
            return *code;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    ::kill(pid_, SIGKILL);
    return wait();
}

} // namespace upnote_mcp
