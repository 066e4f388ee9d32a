#include "process.hpp"

#include <cerrno>
#include <cstring>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace dirshift::adapters::process {

auto format_command(const std::vector<std::string>& argv) -> std::string {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out.push_back(' ');
        if (arg.find_first_of(" \t'\"") != std::string::npos) {
            out += fmt::format("'{}'", arg);
        } else {
            out += arg;
        }
    }
    return out;
}

auto run_command(const std::vector<std::string>& argv) -> infra::Result<int> {
    if (argv.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::CopyFailed, "Empty command line"));
    }

    spdlog::debug("exec: {}", format_command(argv));

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& s : argv) {
        args.push_back(const_cast<char*>(s.c_str()));
    }
    args.push_back(nullptr);

    // 127 from the child means exec failed, as with a shell
    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::CopyFailed,
            fmt::format("fork failed: {}", std::strerror(errno))));
    }
    if (pid == 0) {
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return std::unexpected(infra::make_error(infra::ErrorCode::CopyFailed,
                fmt::format("waitpid failed: {}", std::strerror(errno))));
        }
    }

    if (WIFEXITED(status)) {
        const int code = WEXITSTATUS(status);
        if (code == 127) {
            return std::unexpected(infra::make_error(infra::ErrorCode::CopyFailed,
                fmt::format("Cannot execute '{}'", argv.front())));
        }
        return code;
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

} // namespace dirshift::adapters::process
