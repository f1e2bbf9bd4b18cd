// SPDX-License-Identifier: Apache-2.0
#include <process/ProcessRunner.hpp>

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <format>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace clockr
{

namespace
{
    constexpr auto PollIntervalMs = 100;

    /// Owns a file descriptor, closing it on destruction.
    class FileDescriptor
    {
      public:
        FileDescriptor() = default;
        explicit FileDescriptor(int fd) noexcept: _fd(fd) {}
        ~FileDescriptor() { reset(); }

        FileDescriptor(FileDescriptor const&) = delete;
        auto operator=(FileDescriptor const&) -> FileDescriptor& = delete;

        [[nodiscard]] auto get() const noexcept -> int { return _fd; }
        [[nodiscard]] auto valid() const noexcept -> bool { return _fd >= 0; }

        void reset(int fd = -1) noexcept
        {
            if (_fd >= 0)
                ::close(_fd);
            _fd = fd;
        }

      private:
        int _fd = -1;
    };

    struct Pipe
    {
        FileDescriptor readEnd;
        FileDescriptor writeEnd;
    };

    auto makePipe(std::string_view name) -> Result<Pipe>
    {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0)
            return makeError(ErrorCode::ProcessError,
                             std::format("Failed to create {} pipe: {}", name, std::strerror(errno)));
        auto result = Pipe {};
        result.readEnd.reset(fds[0]);
        result.writeEnd.reset(fds[1]);
        return result;
    }

    auto variableName(std::string_view entry) -> std::string_view
    {
        return entry.substr(0, entry.find('='));
    }

    auto decodeWaitStatus(int status) -> int
    {
        if (WIFEXITED(status))
            return WEXITSTATUS(status);
        if (WIFSIGNALED(status))
            return 128 + WTERMSIG(status);
        return -1;
    }

    /// Splits buffered stdout into complete lines and hands them to the callback.
    void emitLines(std::string& pending, LineCallback const& onLine)
    {
        auto start = std::size_t { 0 };
        while (true)
        {
            auto const newline = pending.find('\n', start);
            if (newline == std::string::npos)
                break;
            auto line = std::string_view(pending).substr(start, newline - start);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);
            onLine(line);
            start = newline + 1;
        }
        pending.erase(0, start);
    }
} // namespace

auto buildEnvironment(std::vector<std::string> const& inherited,
                      std::map<std::string, std::string> const& overrides,
                      std::vector<std::string> const& unset) -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    result.reserve(inherited.size() + overrides.size());
    for (auto const& entry: inherited)
    {
        auto const name = variableName(entry);
        if (std::ranges::find(unset, name) != unset.end())
            continue;
        if (overrides.contains(std::string(name)))
            continue;
        result.push_back(entry);
    }
    for (auto const& [key, value]: overrides)
        result.push_back(std::format("{}={}", key, value));
    return result;
}

auto runProcess(ProcessSpec const& spec, LineCallback const& onLine, std::stop_token stopToken)
    -> Result<ProcessOutput>
{
    auto stdinPipe = makePipe("stdin");
    if (!stdinPipe)
        return std::unexpected(stdinPipe.error());
    auto stdoutPipe = makePipe("stdout");
    if (!stdoutPipe)
        return std::unexpected(stdoutPipe.error());
    auto stderrPipe = makePipe("stderr");
    if (!stderrPipe)
        return std::unexpected(stderrPipe.error());

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe->readEnd.get(), STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe->writeEnd.get(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe->writeEnd.get(), STDERR_FILENO);

    // Build argv
    auto argStrings = std::vector<std::string> {};
    argStrings.push_back(spec.command);
    argStrings.insert(argStrings.end(), spec.args.begin(), spec.args.end());
    auto argv = std::vector<char*> {};
    for (auto& arg: argStrings)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment (inherit - unset + overrides)
    auto inherited = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
            inherited.emplace_back(*e);
    }
    auto envStrings = buildEnvironment(inherited, spec.env, spec.unsetEnv);
    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    auto const status = posix_spawnp(&pid, spec.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    stdinPipe->readEnd.reset();
    stdoutPipe->writeEnd.reset();
    stderrPipe->writeEnd.reset();

    if (status != 0)
        return makeError(ErrorCode::ProcessError,
                         std::format("Failed to spawn process '{}': {}", spec.command, std::strerror(status)));

    log::debug("Spawned '{}' (pid {})", spec.command, pid);

    auto& stdinFd = stdinPipe->writeEnd;
    auto& stdoutFd = stdoutPipe->readEnd;
    auto& stderrFd = stderrPipe->readEnd;
    ::fcntl(stdinFd.get(), F_SETFL, ::fcntl(stdinFd.get(), F_GETFL) | O_NONBLOCK);
    if (spec.stdinData.empty())
        stdinFd.reset();

    auto output = ProcessOutput {};
    auto pendingLine = std::string {};
    auto stdinOffset = std::size_t { 0 };
    auto terminated = false;
    auto buf = std::array<char, 4096> {};

    while (stdoutFd.valid() || stderrFd.valid())
    {
        if (!terminated && stopToken.stop_requested())
        {
            log::debug("Stopping '{}' (pid {})", spec.command, pid);
            ::kill(pid, SIGTERM);
            terminated = true;
            output.cancelled = true;
            stdinFd.reset();
        }

        auto fds = std::array<pollfd, 3> {};
        auto count = nfds_t { 0 };
        auto const addFd = [&](FileDescriptor const& fd, short events) {
            if (fd.valid())
                fds[count++] = pollfd { .fd = fd.get(), .events = events, .revents = 0 };
        };
        addFd(stdoutFd, POLLIN);
        addFd(stderrFd, POLLIN);
        addFd(stdinFd, POLLOUT);

        auto const ready = ::poll(fds.data(), count, PollIntervalMs);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            log::error("poll() failed while running '{}': {}", spec.command, std::strerror(errno));
            break;
        }
        if (ready == 0)
            continue;

        for (auto i = nfds_t { 0 }; i < count; ++i)
        {
            auto const& pfd = fds[i];
            if (pfd.revents == 0)
                continue;

            if (pfd.fd == stdinFd.get())
            {
                auto const remaining = std::string_view(spec.stdinData).substr(stdinOffset);
                auto const written = ::write(stdinFd.get(), remaining.data(), remaining.size());
                if (written > 0)
                    stdinOffset += static_cast<std::size_t>(written);
                if ((written < 0 && errno != EAGAIN && errno != EINTR) || stdinOffset >= spec.stdinData.size())
                    stdinFd.reset();
                continue;
            }

            auto const isStdout = pfd.fd == stdoutFd.get();
            auto const bytesRead = ::read(pfd.fd, buf.data(), buf.size());
            if (bytesRead < 0 && (errno == EINTR || errno == EAGAIN))
                continue;
            if (bytesRead <= 0)
            {
                (isStdout ? stdoutFd : stderrFd).reset();
                continue;
            }

            auto const chunk = std::string_view(buf.data(), static_cast<std::size_t>(bytesRead));
            if (isStdout)
            {
                output.stdoutData.append(chunk);
                if (onLine)
                {
                    pendingLine.append(chunk);
                    emitLines(pendingLine, onLine);
                }
            }
            else
                output.stderrData.append(chunk);
        }
    }

    if (onLine && !pendingLine.empty())
        onLine(pendingLine);

    stdinFd.reset();
    auto waitStatus = 0;
    while (::waitpid(pid, &waitStatus, 0) < 0)
    {
        if (errno != EINTR)
            return makeError(ErrorCode::ProcessError,
                             std::format("waitpid failed for '{}': {}", spec.command, std::strerror(errno)));
    }
    output.exitCode = decodeWaitStatus(waitStatus);
    log::debug("'{}' exited with status {}", spec.command, output.exitCode);
    return output;
}

} // namespace clockr
