// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ServerConfig.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mcprunner
{

/// @brief Operating system family, used to pick command forms.
enum class Platform
{
    Posix,
    Windows,
};

/// @brief Returns the platform this binary was built for.
[[nodiscard]] constexpr auto currentPlatform() -> Platform
{
#ifdef _WIN32
    return Platform::Windows;
#else
    return Platform::Posix;
#endif
}

/// @brief Returns "windows" or "posix".
[[nodiscard]] constexpr auto platformName(Platform platform) -> std::string_view
{
    return platform == Platform::Windows ? "windows" : "posix";
}

/// @brief The concrete program and argument vector to start for a server config.
struct Invocation
{
    std::string executable;
    std::vector<std::string> args;

    auto operator==(const Invocation&) const -> bool = default;
};

/// @brief Maps a server config to the program invocation for the given platform.
///
/// On Windows the npm shims (`npx`, `npm`) are batch files and are run as
/// `cmd.exe /c npx.cmd ...`. On POSIX the command is used verbatim.
[[nodiscard]] auto resolveCommand(const ServerConfig& config, Platform platform) -> Invocation;

using Environment = std::map<std::string, std::string>;

/// @brief Returns a copy of the current process environment.
[[nodiscard]] auto currentEnvironment() -> Environment;

/// @brief Returns @p base with every entry of @p overrides applied on top.
[[nodiscard]] auto mergeEnvironment(Environment base, const Environment& overrides) -> Environment;

/// @brief Locates an executable, searching the PATH of @p env when @p name has no directory part.
/// @return The path to the executable, or std::nullopt if none was found.
[[nodiscard]] auto findExecutable(std::string_view name, const Environment& env) -> std::optional<std::string>;

/// @brief Options applied to every launched server process.
struct LaunchOptions
{
    /// Variables applied between the inherited environment and the config's own env.
    Environment baseOverrides;
};

/// @brief A supervised MCP server subprocess with piped stdin, stdout and stderr.
///
/// stderr is drained continuously on a background thread into the log, so that a chatty
/// server never blocks on a full pipe. The destructor terminates the process.
class Process
{
    struct Token
    {
        explicit Token() = default;
    };

  public:
    /// @brief Constructs an idle process object; use launch() to start one.
    explicit Process(Token);
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /// @brief Starts a server subprocess.
    /// @param config The server launch configuration.
    /// @param options Additional launch options.
    /// @return The running process, or a LaunchError.
    [[nodiscard]] static auto launch(const ServerConfig& config, const LaunchOptions& options = {})
        -> Result<std::unique_ptr<Process>>;

    /// @brief Writes all bytes to the child's stdin.
    [[nodiscard]] auto write(std::string_view data) -> VoidResult;

    /// @brief Reads from the child's stdout, waiting at most @p timeout for data.
    /// @return The number of bytes read (0 if nothing arrived in time), or ConnectionClosed on EOF.
    [[nodiscard]] auto read(std::span<char> buffer, std::chrono::milliseconds timeout) -> Result<size_t>;

    /// @brief Closes the child's stdin, signalling end of input.
    void closeStdin();

    /// @brief Waits up to @p timeout for the process to exit.
    /// @return The exit code if the process has exited.
    [[nodiscard]] auto wait(std::chrono::milliseconds timeout) -> std::optional<int>;

    /// @brief Returns true if the process has not yet exited.
    [[nodiscard]] auto isRunning() -> bool;

    /// @brief Forcefully kills the process (and its process group on POSIX).
    void kill();

    /// @brief Graceful shutdown: close stdin, wait up to @p grace, then escalate.
    ///
    /// Idempotent; terminating an exited process only reaps it.
    void terminate(std::chrono::milliseconds grace);

    /// @brief Returns the OS process id.
    [[nodiscard]] auto pid() const -> int;

    /// @brief Returns the server name used to tag log lines.
    [[nodiscard]] auto name() const -> const std::string&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcprunner
