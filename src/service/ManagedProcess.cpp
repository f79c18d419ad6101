// SPDX-License-Identifier: Apache-2.0
#include "ManagedProcess.hpp"

#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace agentloop
{

struct ManagedProcess::Impl
{
    ProcessOptions options;

    mutable std::mutex mutex;
    std::condition_variable exited;
    pid_t pid = -1;
    bool running = false;
    std::optional<int> exitCode;

    int stdoutRead = -1;
    int stderrRead = -1;

    std::jthread reader;
    std::jthread waiter;

    void readOutput(std::stop_token stopToken);
    void waitForChild(pid_t child);
    void closePipes();
};

namespace
{
    auto decodeExitStatus(int status) -> int
    {
        if (WIFEXITED(status))
            return WEXITSTATUS(status);
        if (WIFSIGNALED(status))
            return 128 + WTERMSIG(status);
        return -1;
    }

    /// @brief Splits complete lines off @p buffer and hands them to @p emit.
    template <typename Emit>
    void drainLines(std::string& buffer, Emit&& emit)
    {
        auto start = std::size_t { 0 };
        for (auto nl = buffer.find('\n'); nl != std::string::npos; nl = buffer.find('\n', start))
        {
            auto line = std::string_view(buffer).substr(start, nl - start);
            if (line.ends_with('\r'))
                line.remove_suffix(1);
            if (!line.empty())
                emit(line);
            start = nl + 1;
        }
        buffer.erase(0, start);
    }
} // namespace

void ManagedProcess::Impl::readOutput(std::stop_token stopToken)
{
    auto fds = std::array<pollfd, 2> {
        pollfd { .fd = stdoutRead, .events = POLLIN, .revents = 0 },
        pollfd { .fd = stderrRead, .events = POLLIN, .revents = 0 },
    };
    auto buffers = std::array<std::string, 2> {};
    auto const streams = std::array { OutputStream::Stdout, OutputStream::Stderr };

    auto const emit = [this](OutputStream stream, std::string_view line) {
        log::debug("[{}] {}", options.name, line);
        if (options.onLine)
            options.onLine(stream, line);
    };

    while (!stopToken.stop_requested() && (fds[0].fd >= 0 || fds[1].fd >= 0))
    {
        auto const ready = ::poll(fds.data(), fds.size(), 100);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            log::warning("[{}] poll failed: {}", options.name, std::strerror(errno));
            break;
        }

        for (auto i = std::size_t { 0 }; i < fds.size(); ++i)
        {
            if (fds[i].fd < 0 || fds[i].revents == 0)
                continue;

            auto chunk = std::array<char, 4096> {};
            auto const n = ::read(fds[i].fd, chunk.data(), chunk.size());
            if (n > 0)
            {
                buffers[i].append(chunk.data(), static_cast<std::size_t>(n));
                drainLines(buffers[i], [&](std::string_view line) { emit(streams[i], line); });
            }
            else if (n == 0 || errno != EINTR)
                fds[i].fd = -1; // EOF; descriptor is closed by closePipes()
        }
    }

    for (auto i = std::size_t { 0 }; i < buffers.size(); ++i)
    {
        if (!buffers[i].empty())
        {
            buffers[i].push_back('\n');
            drainLines(buffers[i], [&](std::string_view line) { emit(streams[i], line); });
        }
    }
}

void ManagedProcess::Impl::waitForChild(pid_t child)
{
    auto status = 0;
    while (::waitpid(child, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            status = -1;
            break;
        }
    }

    auto const code = status == -1 ? -1 : decodeExitStatus(status);
    log::debug("[{}] exited with code {}", options.name, code);

    // stop() returns only after the exit callback has run.
    if (options.onExit)
        options.onExit(code);

    {
        auto lock = std::lock_guard(mutex);
        running = false;
        exitCode = code;
    }
    exited.notify_all();
}

void ManagedProcess::Impl::closePipes()
{
    if (stdoutRead >= 0)
    {
        ::close(stdoutRead);
        stdoutRead = -1;
    }
    if (stderrRead >= 0)
    {
        ::close(stderrRead);
        stderrRead = -1;
    }
}

ManagedProcess::ManagedProcess(ProcessOptions options): _impl(std::make_unique<Impl>())
{
    _impl->options = std::move(options);
}

ManagedProcess::~ManagedProcess()
{
    stop();

    if (_impl->waiter.joinable())
        _impl->waiter.join();
    if (_impl->reader.joinable())
    {
        _impl->reader.request_stop();
        _impl->reader.join();
    }
    _impl->closePipes();
}

auto ManagedProcess::start() -> VoidResult
{
    auto const& options = _impl->options;
    if (options.argv.empty())
        return makeError(ErrorCode::ProcessError, std::format("Process '{}' requires a command", options.name));

    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->running)
            return makeError(ErrorCode::ProcessError, std::format("Process '{}' is already running", options.name));
    }

    // Threads of a previous run must be finished before their state is reused.
    if (_impl->waiter.joinable())
        _impl->waiter.join();
    if (_impl->reader.joinable())
    {
        _impl->reader.request_stop();
        _impl->reader.join();
    }
    _impl->closePipes();

    int stdoutPipe[2];
    int stderrPipe[2];

    if (::pipe2(stdoutPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::ProcessError, "Failed to create stdout pipe");
    if (::pipe2(stderrPipe, O_CLOEXEC) != 0)
    {
        ::close(stdoutPipe[0]);
        ::close(stdoutPipe[1]);
        return makeError(ErrorCode::ProcessError, "Failed to create stderr pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);

    // Own process group, so stop() reaches grandchildren started by wrapper scripts.
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attr, 0);

    auto argCopies = options.argv;
    auto argv = std::vector<char*> {};
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto entry = std::string_view(*e);
            auto const key = entry.substr(0, entry.find('='));
            if (!options.env.contains(std::string(key)))
                envStrings.emplace_back(entry);
        }
    }
    for (const auto& [key, value]: options.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status = posix_spawnp(&pid, argv[0], &actions, &attr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);

    ::close(stdoutPipe[1]);
    ::close(stderrPipe[1]);

    if (status != 0)
    {
        ::close(stdoutPipe[0]);
        ::close(stderrPipe[0]);
        return makeError(ErrorCode::ProcessError,
                         std::format("Failed to spawn '{}': {}", options.argv.front(), std::strerror(status)));
    }

    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->pid = pid;
        _impl->running = true;
        _impl->exitCode.reset();
    }
    _impl->stdoutRead = stdoutPipe[0];
    _impl->stderrRead = stderrPipe[0];

    _impl->reader = std::jthread([impl = _impl.get()](std::stop_token token) { impl->readOutput(token); });
    _impl->waiter = std::jthread([impl = _impl.get(), pid] { impl->waitForChild(pid); });

    log::info("[{}] started (pid {})", options.name, pid);
    return {};
}

void ManagedProcess::stop(std::chrono::milliseconds grace)
{
    auto lock = std::unique_lock(_impl->mutex);
    if (!_impl->running)
        return;

    auto const group = _impl->pid;
    if (::kill(-group, SIGTERM) != 0 && errno != ESRCH)
        log::warning("[{}] SIGTERM failed: {}", _impl->options.name, std::strerror(errno));

    if (!_impl->exited.wait_for(lock, grace, [this] { return !_impl->running; }))
    {
        log::warning("[{}] did not exit within {} ms, sending SIGKILL", _impl->options.name, grace.count());
        if (::kill(-group, SIGKILL) != 0 && errno != ESRCH)
            log::warning("[{}] SIGKILL failed: {}", _impl->options.name, std::strerror(errno));
        _impl->exited.wait(lock, [this] { return !_impl->running; });
    }
}

auto ManagedProcess::waitForExit(std::chrono::milliseconds timeout) -> std::optional<int>
{
    auto lock = std::unique_lock(_impl->mutex);
    if (!_impl->exited.wait_for(lock, timeout, [this] { return !_impl->running; }))
        return std::nullopt;
    return _impl->exitCode;
}

auto ManagedProcess::isRunning() const -> bool
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->running;
}

auto ManagedProcess::pid() const -> std::optional<int>
{
    auto lock = std::lock_guard(_impl->mutex);
    if (!_impl->running)
        return std::nullopt;
    return static_cast<int>(_impl->pid);
}

auto ManagedProcess::exitCode() const -> std::optional<int>
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->exitCode;
}

} // namespace agentloop
