// SPDX-License-Identifier: Apache-2.0
#include "Subprocess.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace rigchat
{

namespace
{
    constexpr auto PollIntervalMs = 100;

    /// @brief Closes a file descriptor on scope exit.
    struct FdGuard
    {
        int fd = -1;
        ~FdGuard()
        {
            if (fd >= 0)
                ::close(fd);
        }
        void reset()
        {
            if (fd >= 0)
                ::close(fd);
            fd = -1;
        }
    };

    /// @brief Appends up to the capture limit, remembering whether anything was dropped.
    void capture(std::string& sink, const char* data, std::size_t size, bool& truncated)
    {
        auto const room = sink.size() < MaxCapturedBytes ? MaxCapturedBytes - sink.size() : 0;
        if (size > room)
            truncated = true;
        sink.append(data, std::min(size, room));
    }

    auto decodeStatus(int status) -> int
    {
        if (WIFEXITED(status))
            return WEXITSTATUS(status);
        if (WIFSIGNALED(status))
            return 128 + WTERMSIG(status);
        return -1;
    }
} // namespace

auto runProcess(const ProcessRequest& request, std::stop_token stopToken) -> Result<ProcessOutput>
{
    if (!request.workingDirectory.empty())
    {
        auto ec = std::error_code {};
        if (!std::filesystem::is_directory(request.workingDirectory, ec))
            return makeError(ErrorCode::ToolExecutionError,
                             std::format("Working directory does not exist: {}", request.workingDirectory));
    }

    int stdoutPipe[2];
    int stderrPipe[2];

    if (pipe(stdoutPipe) != 0)
        return makeError(ErrorCode::ToolExecutionError, "Failed to create stdout pipe");
    if (pipe(stderrPipe) != 0)
    {
        ::close(stdoutPipe[0]);
        ::close(stdoutPipe[1]);
        return makeError(ErrorCode::ToolExecutionError, "Failed to create stderr pipe");
    }

    auto outRead = FdGuard { stdoutPipe[0] };
    auto outWrite = FdGuard { stdoutPipe[1] };
    auto errRead = FdGuard { stderrPipe[0] };
    auto errWrite = FdGuard { stderrPipe[1] };

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, outWrite.fd, STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, errWrite.fd, STDERR_FILENO);
    posix_spawn_file_actions_addclose(&actions, outRead.fd);
    posix_spawn_file_actions_addclose(&actions, errRead.fd);
    if (!request.workingDirectory.empty())
        posix_spawn_file_actions_addchdir_np(&actions, request.workingDirectory.c_str());

    auto programCopy = request.program;
    auto argCopies = std::vector<std::string>(request.args);
    auto argv = std::vector<char*> {};
    argv.push_back(programCopy.data());
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    pid_t pid;
    auto const status = posix_spawnp(&pid, request.program.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    outWrite.reset();
    errWrite.reset();

    if (status != 0)
        return makeError(ErrorCode::ToolExecutionError,
                         std::format("Failed to spawn process '{}': {}", request.program, strerror(status)));

    log::debug("Spawned '{}' (pid {})", request.program, pid);

    auto output = ProcessOutput {};
    auto fds = std::array<pollfd, 2> { {
        { .fd = outRead.fd, .events = POLLIN, .revents = 0 },
        { .fd = errRead.fd, .events = POLLIN, .revents = 0 },
    } };
    auto openStreams = 2;
    auto buf = std::array<char, 4096> {};

    while (openStreams > 0)
    {
        if (stopToken.stop_requested())
        {
            kill(pid, SIGTERM);
            int ignored;
            waitpid(pid, &ignored, 0);
            log::debug("Process {} terminated on cancellation", pid);
            return makeError(ErrorCode::Cancelled, std::format("'{}' was cancelled", request.program));
        }

        auto const ready = poll(fds.data(), fds.size(), PollIntervalMs);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            break;
        }

        for (auto i = std::size_t { 0 }; i < fds.size(); ++i)
        {
            if (fds[i].fd < 0 || fds[i].revents == 0)
                continue;

            auto const n = ::read(fds[i].fd, buf.data(), buf.size());
            if (n <= 0)
            {
                fds[i].fd = -1;
                --openStreams;
                continue;
            }

            auto& sink = i == 0 ? output.standardOutput : output.standardError;
            capture(sink, buf.data(), static_cast<std::size_t>(n), output.truncated);
        }
    }

    int waitStatus = 0;
    if (waitpid(pid, &waitStatus, 0) < 0)
        return makeError(ErrorCode::ToolExecutionError, std::format("waitpid failed: {}", strerror(errno)));

    output.exitCode = decodeStatus(waitStatus);
    return output;
}

} // namespace rigchat
