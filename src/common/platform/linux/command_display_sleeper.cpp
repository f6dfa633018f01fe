#include "platform/linux/command_display_sleeper.hpp"

#include <cerrno>
#include <cstring>
#include <sys/wait.h>
#include <unistd.h>

CommandDisplaySleeper::CommandDisplaySleeper(std::vector<std::string> argv)
    : argv_(std::move(argv)) {}

std::expected<void, std::string> CommandDisplaySleeper::sleep_display() {
    if (argv_.empty()) {
        return std::unexpected("sleep command is empty");
    }

    // Build argv before fork; only async-signal-safe calls in the child
    std::vector<char*> args;
    args.reserve(argv_.size() + 1);
    for (auto& a : argv_) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return std::unexpected(argv_[0] + " exited with code " + std::to_string(WEXITSTATUS(status)));
    }
    if (WIFSIGNALED(status)) {
        return std::unexpected(argv_[0] + " killed by signal " + std::to_string(WTERMSIG(status)));
    }

    return {};
}
