#include "UrlLauncher.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace upnote_mcp {

SystemUrlLauncher::SystemUrlLauncher()
#if defined(__APPLE__)
    : opener_("open") {
#else
    : opener_("xdg-open") {
#endif
}

std::vector<std::string> SystemUrlLauncher::command_for(const std::string& url) const {
    return {opener_, url};
}

void SystemUrlLauncher::open(const std::string& url) {
    std::vector<std::string> command = command_for(url);
    std::vector<char*> argv;
    for (auto& arg : command) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    spdlog::debug("Opening URL with {}: {}", opener_, url);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::runtime_error(std::string("Failed to open URL: fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Keep the opener away from the protocol stream on stdout
        ::dup2(STDERR_FILENO, STDOUT_FILENO);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("Failed to open URL: waitpid failed: ") + std::strerror(errno));
        }
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        throw std::runtime_error("Failed to open URL: " + opener_ + " exited with status " + std::to_string(code));
    }
}

} // namespace upnote_mcp
