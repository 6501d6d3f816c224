// SPDX-License-Identifier: Apache-2.0
#include "Process.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <format>
#include <mutex>
#include <ranges>
#include <thread>

#ifdef _WIN32
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
#else
    #include <sys/wait.h>

    #include <fcntl.h>
    #include <poll.h>
    #include <signal.h>
    #include <spawn.h>
    #include <unistd.h>

extern char** environ;
#endif

namespace mcprunner
{

namespace
{

#ifdef _WIN32
    constexpr auto PathSeparator = ';';
#else
    constexpr auto PathSeparator = ':';
#endif

    constexpr auto PollInterval = std::chrono::milliseconds { 100 };

    /// @brief Splits accumulated stderr text into lines and logs each complete one.
    void emitStderrLines(std::string& pending, const std::string& name)
    {
        auto start = size_t { 0 };
        auto pos = pending.find('\n');
        while (pos != std::string::npos)
        {
            auto line = std::string_view(pending).substr(start, pos - start);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);
            if (!line.empty())
                log::debug("[{}] {}", name, line);
            start = pos + 1;
            pos = pending.find('\n', start);
        }
        pending.erase(0, start);
    }

    auto isExecutableFile(const std::filesystem::path& path) -> bool
    {
        auto ec = std::error_code {};
        if (!std::filesystem::is_regular_file(path, ec))
            return false;
#ifdef _WIN32
        return true;
#else
        return ::access(path.c_str(), X_OK) == 0;
#endif
    }

} // namespace

auto resolveCommand(const ServerConfig& config, Platform platform) -> Invocation
{
    if (platform == Platform::Windows && (config.command == "npx" || config.command == "npm"))
    {
        auto invocation = Invocation { .executable = "cmd.exe", .args = { "/c", config.command + ".cmd" } };
        invocation.args.insert(invocation.args.end(), config.args.begin(), config.args.end());
        return invocation;
    }

    return Invocation { .executable = config.command, .args = config.args };
}

auto currentEnvironment() -> Environment
{
    auto env = Environment {};
#ifdef _WIN32
    auto* const block = GetEnvironmentStringsA();
    if (!block)
        return env;
    for (auto const* entry = block; *entry; entry += std::strlen(entry) + 1)
    {
        auto const text = std::string_view(entry);
        auto const eq = text.find('=', 1); // skip the leading '=' of drive-letter entries
        if (eq != std::string_view::npos)
            env[std::string(text.substr(0, eq))] = std::string(text.substr(eq + 1));
    }
    FreeEnvironmentStringsA(block);
#else
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const text = std::string_view(*e);
            auto const eq = text.find('=');
            if (eq != std::string_view::npos)
                env[std::string(text.substr(0, eq))] = std::string(text.substr(eq + 1));
        }
    }
#endif
    return env;
}

auto mergeEnvironment(Environment base, const Environment& overrides) -> Environment
{
    for (const auto& [key, value]: overrides)
        base[key] = value;
    return base;
}

auto findExecutable(std::string_view name, const Environment& env) -> std::optional<std::string>
{
    if (name.empty())
        return std::nullopt;

    auto candidates = std::vector<std::string> { std::string(name) };
#ifdef _WIN32
    if (!std::filesystem::path(name).has_extension())
    {
        for (auto const* ext: { ".exe", ".cmd", ".bat", ".com" })
            candidates.push_back(std::string(name) + ext);
    }
    auto const hasDirectory = name.find_first_of("/\\") != std::string_view::npos;
#else
    auto const hasDirectory = name.find('/') != std::string_view::npos;
#endif

    if (hasDirectory)
    {
        for (const auto& candidate: candidates)
        {
            if (isExecutableFile(candidate))
                return candidate;
        }
        return std::nullopt;
    }

    auto const pathIt = env.find("PATH");
    auto const searchPath = pathIt != env.end() ? pathIt->second : std::string {};

    for (auto const dirRange: std::views::split(searchPath, PathSeparator))
    {
        auto dir = std::string(dirRange.begin(), dirRange.end());
        if (dir.empty())
            dir = ".";
        for (const auto& candidate: candidates)
        {
            auto const path = std::filesystem::path(dir) / candidate;
            if (isExecutableFile(path))
                return path.string();
        }
    }

    return std::nullopt;
}

// {{{ Process::Impl

struct Process::Impl
{
    std::string name;

#ifdef _WIN32
    HANDLE process = INVALID_HANDLE_VALUE;
    HANDLE stdinWrite = INVALID_HANDLE_VALUE;
    HANDLE stdoutRead = INVALID_HANDLE_VALUE;
    HANDLE stderrRead = INVALID_HANDLE_VALUE;
    DWORD processId = 0;
#else
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;
#endif

    /// Serializes writes to stdin against closing it.
    std::timed_mutex writeMutex;

    /// Guards the exit status.
    std::mutex stateMutex;
    std::optional<int> exitCode;

    std::mutex terminateMutex;
    bool terminated = false;

    std::jthread stderrDrain;

    /// @brief Polls the exit status; blocks until exit if @p block is set.
    auto reap(bool block) -> std::optional<int>
    {
        auto const lock = std::lock_guard(stateMutex);
        if (exitCode)
            return exitCode;
#ifdef _WIN32
        if (WaitForSingleObject(process, block ? INFINITE : 0) == WAIT_OBJECT_0)
        {
            DWORD code = 0;
            GetExitCodeProcess(process, &code);
            exitCode = static_cast<int>(code);
        }
#else
        auto status = 0;
        auto result = pid_t { 0 };
        do
            result = ::waitpid(childPid, &status, block ? 0 : WNOHANG);
        while (result < 0 && errno == EINTR);

        if (result == childPid)
            exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
        else if (result < 0)
            exitCode = -1; // ECHILD: already reaped elsewhere
#endif
        return exitCode;
    }

    void closeStdinLocked()
    {
#ifdef _WIN32
        if (stdinWrite != INVALID_HANDLE_VALUE)
        {
            CloseHandle(stdinWrite);
            stdinWrite = INVALID_HANDLE_VALUE;
        }
#else
        if (stdinWrite >= 0)
        {
            ::close(stdinWrite);
            stdinWrite = -1;
        }
#endif
    }

    void killNow()
    {
        if (reap(false))
            return;
#ifdef _WIN32
        TerminateProcess(process, 1);
#else
        // The child leads its own process group; take down helpers it spawned (e.g. npx -> node).
        if (::kill(-childPid, SIGKILL) != 0)
            ::kill(childPid, SIGKILL);
#endif
    }

    void drainStderr(const std::stop_token& stopToken)
    {
        auto pending = std::string {};
        auto buf = std::array<char, 4096> {};

        while (!stopToken.stop_requested())
        {
#ifdef _WIN32
            DWORD available = 0;
            if (!PeekNamedPipe(stderrRead, nullptr, 0, nullptr, &available, nullptr))
                break;
            if (available == 0)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds { 20 });
                continue;
            }
            DWORD bytesRead = 0;
            if (!ReadFile(stderrRead, buf.data(), static_cast<DWORD>(buf.size()), &bytesRead, nullptr)
                || bytesRead == 0)
                break;
            pending.append(buf.data(), bytesRead);
#else
            auto pfd = pollfd { .fd = stderrRead, .events = POLLIN, .revents = 0 };
            auto const rc = ::poll(&pfd, 1, static_cast<int>(PollInterval.count()));
            if (rc < 0 && errno == EINTR)
                continue;
            if (rc < 0)
                break;
            if (rc == 0)
                continue;

            auto const bytesRead = ::read(stderrRead, buf.data(), buf.size());
            if (bytesRead < 0 && errno == EINTR)
                continue;
            if (bytesRead <= 0)
                break;
            pending.append(buf.data(), static_cast<size_t>(bytesRead));
#endif
            emitStderrLines(pending, name);
        }

        if (!pending.empty())
            log::debug("[{}] {}", name, pending);
    }

    ~Impl()
    {
        if (stderrDrain.joinable())
        {
            stderrDrain.request_stop();
            stderrDrain.join();
        }
#ifdef _WIN32
        for (auto* handle: { &stdinWrite, &stdoutRead, &stderrRead, &process })
        {
            if (*handle != INVALID_HANDLE_VALUE)
                CloseHandle(*handle);
        }
#else
        for (auto const fd: { stdinWrite, stdoutRead, stderrRead })
        {
            if (fd >= 0)
                ::close(fd);
        }
#endif
    }
};

// }}}

Process::Process(Token): _impl(std::make_unique<Impl>())
{
}

Process::~Process()
{
    terminate(std::chrono::milliseconds { 2000 });
}

auto Process::launch(const ServerConfig& config, const LaunchOptions& options) -> Result<std::unique_ptr<Process>>
{
    auto const env =
        mergeEnvironment(mergeEnvironment(currentEnvironment(), options.baseOverrides), config.env);
    auto const invocation = resolveCommand(config, currentPlatform());

    auto const executable = findExecutable(invocation.executable, env);
    if (!executable)
        return makeError(ErrorCode::LaunchError, std::format("Executable not found: {}", invocation.executable));

    auto process = std::make_unique<Process>(Token {});
    auto& impl = *process->_impl;
    impl.name = config.name.empty() ? config.command : config.name;

#ifdef _WIN32
    SECURITY_ATTRIBUTES sa {};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE stdinRead, stdinWrite, stdoutRead, stdoutWrite, stderrRead, stderrWrite;
    if (!CreatePipe(&stdinRead, &stdinWrite, &sa, 0))
        return makeError(ErrorCode::LaunchError, "Failed to create stdin pipe");
    if (!CreatePipe(&stdoutRead, &stdoutWrite, &sa, 0))
    {
        CloseHandle(stdinRead);
        CloseHandle(stdinWrite);
        return makeError(ErrorCode::LaunchError, "Failed to create stdout pipe");
    }
    if (!CreatePipe(&stderrRead, &stderrWrite, &sa, 0))
    {
        for (auto handle: { stdinRead, stdinWrite, stdoutRead, stdoutWrite })
            CloseHandle(handle);
        return makeError(ErrorCode::LaunchError, "Failed to create stderr pipe");
    }

    SetHandleInformation(stdinWrite, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(stdoutRead, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(stderrRead, HANDLE_FLAG_INHERIT, 0);

    auto const quote = [](const std::string& arg) {
        if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos)
            return arg;
        auto quoted = std::string("\"");
        for (auto const c: arg)
        {
            if (c == '"')
                quoted += '\\';
            quoted += c;
        }
        return quoted + "\"";
    };

    auto cmdLine = quote(*executable);
    for (const auto& arg: invocation.args)
        cmdLine += " " + quote(arg);

    auto envBlock = std::string {};
    for (const auto& [key, value]: env)
    {
        envBlock += key + "=" + value;
        envBlock.push_back('\0');
    }
    envBlock.push_back('\0');

    STARTUPINFOA si {};
    si.cb = sizeof(si);
    si.hStdInput = stdinRead;
    si.hStdOutput = stdoutWrite;
    si.hStdError = stderrWrite;
    si.dwFlags |= STARTF_USESTDHANDLES;

    PROCESS_INFORMATION pi {};
    auto const created = CreateProcessA(nullptr,
                                        cmdLine.data(),
                                        nullptr,
                                        nullptr,
                                        TRUE,
                                        CREATE_NO_WINDOW,
                                        envBlock.data(),
                                        nullptr,
                                        &si,
                                        &pi);

    CloseHandle(stdinRead);
    CloseHandle(stdoutWrite);
    CloseHandle(stderrWrite);

    if (!created)
    {
        CloseHandle(stdinWrite);
        CloseHandle(stdoutRead);
        CloseHandle(stderrRead);
        return makeError(ErrorCode::LaunchError,
                         std::format("Failed to start process '{}' (error {})", *executable, GetLastError()));
    }

    CloseHandle(pi.hThread);

    impl.process = pi.hProcess;
    impl.processId = pi.dwProcessId;
    impl.stdinWrite = stdinWrite;
    impl.stdoutRead = stdoutRead;
    impl.stderrRead = stderrRead;
#else
    // Writing to a dead server must surface as EPIPE rather than terminating the runner.
    static auto sigpipeOnce = std::once_flag {};
    std::call_once(sigpipeOnce, [] { ::signal(SIGPIPE, SIG_IGN); });

    int stdinPipe[2];
    int stdoutPipe[2];
    int stderrPipe[2];

    if (::pipe(stdinPipe) != 0)
        return makeError(ErrorCode::LaunchError, "Failed to create stdin pipe");
    if (::pipe(stdoutPipe) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::LaunchError, "Failed to create stdout pipe");
    }
    if (::pipe(stderrPipe) != 0)
    {
        for (auto const fd: { stdinPipe[0], stdinPipe[1], stdoutPipe[0], stdoutPipe[1] })
            ::close(fd);
        return makeError(ErrorCode::LaunchError, "Failed to create stderr pipe");
    }

    // Keep our pipe ends out of servers spawned concurrently from other threads.
    for (auto const fd: { stdinPipe[0], stdinPipe[1], stdoutPipe[0], stdoutPipe[1], stderrPipe[0], stderrPipe[1] })
        ::fcntl(fd, F_SETFD, FD_CLOEXEC);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);

    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t defaultSignals;
    sigemptyset(&defaultSignals);
    sigaddset(&defaultSignals, SIGPIPE);
    posix_spawnattr_setsigdefault(&attr, &defaultSignals);
    posix_spawnattr_setpgroup(&attr, 0);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF);

    // Build argv
    auto argStrings = std::vector<std::string> { invocation.executable };
    argStrings.insert(argStrings.end(), invocation.args.begin(), invocation.args.end());
    auto argv = std::vector<char*> {};
    for (auto& arg: argStrings)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment
    auto envStrings = std::vector<std::string> {};
    for (const auto& [key, value]: env)
        envStrings.push_back(std::format("{}={}", key, value));
    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    auto const status = ::posix_spawn(&pid, executable->c_str(), &actions, &attr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);
    ::close(stderrPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        ::close(stderrPipe[0]);
        return makeError(ErrorCode::LaunchError,
                         std::format("Failed to spawn process '{}': {}", *executable, std::strerror(status)));
    }

    impl.childPid = pid;
    impl.stdinWrite = stdinPipe[1];
    impl.stdoutRead = stdoutPipe[0];
    impl.stderrRead = stderrPipe[0];
#endif

    impl.stderrDrain = std::jthread([&impl](const std::stop_token& token) { impl.drainStderr(token); });

    log::info("MCP server '{}' started: {} (pid {})", impl.name, *executable, process->pid());
    return process;
}

auto Process::write(std::string_view data) -> VoidResult
{
    auto const lock = std::lock_guard(_impl->writeMutex);

#ifdef _WIN32
    if (_impl->stdinWrite == INVALID_HANDLE_VALUE)
        return makeError(ErrorCode::ConnectionClosed, "Process stdin is closed");

    while (!data.empty())
    {
        DWORD written = 0;
        if (!WriteFile(_impl->stdinWrite, data.data(), static_cast<DWORD>(data.size()), &written, nullptr))
            return makeError(ErrorCode::ConnectionClosed, "Failed to write to process stdin");
        data.remove_prefix(written);
    }
#else
    if (_impl->stdinWrite < 0)
        return makeError(ErrorCode::ConnectionClosed, "Process stdin is closed");

    while (!data.empty())
    {
        auto const written = ::write(_impl->stdinWrite, data.data(), data.size());
        if (written < 0 && errno == EINTR)
            continue;
        if (written < 0 && errno == EPIPE)
            return makeError(ErrorCode::ConnectionClosed, "Process closed its stdin");
        if (written < 0)
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to process stdin: {}", std::strerror(errno)));
        data.remove_prefix(static_cast<size_t>(written));
    }
#endif

    return {};
}

auto Process::read(std::span<char> buffer, std::chrono::milliseconds timeout) -> Result<size_t>
{
#ifdef _WIN32
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    DWORD available = 0;
    while (true)
    {
        if (!PeekNamedPipe(_impl->stdoutRead, nullptr, 0, nullptr, &available, nullptr))
            return makeError(ErrorCode::ConnectionClosed, "Process stdout closed");
        if (available > 0)
            break;
        if (std::chrono::steady_clock::now() >= deadline)
            return size_t { 0 };
        std::this_thread::sleep_for(std::chrono::milliseconds { 10 });
    }

    DWORD bytesRead = 0;
    auto const toRead = std::min<DWORD>(available, static_cast<DWORD>(buffer.size()));
    if (!ReadFile(_impl->stdoutRead, buffer.data(), toRead, &bytesRead, nullptr) || bytesRead == 0)
        return makeError(ErrorCode::ConnectionClosed, "Process stdout closed");
    return static_cast<size_t>(bytesRead);
#else
    auto pfd = pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 };
    auto const rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc < 0 && errno == EINTR)
        return size_t { 0 };
    if (rc < 0)
        return makeError(ErrorCode::TransportError, std::format("poll() failed: {}", std::strerror(errno)));
    if (rc == 0)
        return size_t { 0 };

    auto const bytesRead = ::read(_impl->stdoutRead, buffer.data(), buffer.size());
    if (bytesRead < 0 && (errno == EINTR || errno == EAGAIN))
        return size_t { 0 };
    if (bytesRead < 0)
        return makeError(ErrorCode::TransportError,
                         std::format("Failed to read process stdout: {}", std::strerror(errno)));
    if (bytesRead == 0)
        return makeError(ErrorCode::ConnectionClosed, "Process stdout closed");
    return static_cast<size_t>(bytesRead);
#endif
}

void Process::closeStdin()
{
    auto const lock = std::lock_guard(_impl->writeMutex);
    _impl->closeStdinLocked();
}

auto Process::wait(std::chrono::milliseconds timeout) -> std::optional<int>
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        if (auto const code = _impl->reap(false))
            return code;
        if (std::chrono::steady_clock::now() >= deadline)
            return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds { 10 });
    }
}

auto Process::isRunning() -> bool
{
    return !_impl->reap(false).has_value();
}

void Process::kill()
{
    _impl->killNow();
}

void Process::terminate(std::chrono::milliseconds grace)
{
    auto const terminateLock = std::lock_guard(_impl->terminateMutex);
#ifdef _WIN32
    if (_impl->terminated || _impl->process == INVALID_HANDLE_VALUE)
        return;
#else
    if (_impl->terminated || _impl->childPid <= 0)
        return;
#endif
    _impl->terminated = true;

    // A writer blocked on a full pipe holds the write lock; killing the child releases it.
    if (_impl->writeMutex.try_lock_for(grace))
    {
        _impl->closeStdinLocked();
        _impl->writeMutex.unlock();
    }
    else
    {
        _impl->killNow();
        auto const lock = std::lock_guard(_impl->writeMutex);
        _impl->closeStdinLocked();
    }

    if (!wait(grace))
    {
#ifdef _WIN32
        log::debug("MCP server '{}' did not exit within {}, terminating", _impl->name, grace);
        _impl->killNow();
#else
        log::debug("MCP server '{}' did not exit within {}, sending SIGTERM", _impl->name, grace);
        if (::kill(-_impl->childPid, SIGTERM) != 0)
            ::kill(_impl->childPid, SIGTERM);
        if (!wait(grace))
        {
            log::warning("MCP server '{}' ignored SIGTERM, killing", _impl->name);
            _impl->killNow();
        }
#endif
        (void) _impl->reap(true);
    }
#ifndef _WIN32
    else
    {
        // Leader exited on its own; make sure no helpers of its group survive it.
        ::kill(-_impl->childPid, SIGTERM);
    }
#endif

    if (_impl->stderrDrain.joinable())
    {
        _impl->stderrDrain.request_stop();
        _impl->stderrDrain.join();
    }

    log::debug("MCP server '{}' terminated (exit code {})", _impl->name, _impl->exitCode.value_or(-1));
}

auto Process::pid() const -> int
{
#ifdef _WIN32
    return static_cast<int>(_impl->processId);
#else
    return static_cast<int>(_impl->childPid);
#endif
}

auto Process::name() const -> const std::string&
{
    return _impl->name;
}

} // namespace mcprunner
