// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/McpClient.hpp>
#include <mcp/ServerConfig.hpp>
#include <mcp/StdioTransport.hpp>
#include <session/ToolCache.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcprunner
{

/// @brief Lifecycle of a managed session.
///
/// CREATING -> READY -> (BUSY <-> READY) -> STOPPING -> STOPPED.
/// FAILED is entered from any live state on an unrecoverable error and left only via stop.
enum class SessionState
{
    Creating,
    Ready,
    Busy,
    Stopping,
    Stopped,
    Failed,
};

[[nodiscard]] constexpr auto stateName(SessionState state) -> std::string_view
{
    switch (state)
    {
        case SessionState::Creating: return "creating";
        case SessionState::Ready: return "ready";
        case SessionState::Busy: return "busy";
        case SessionState::Stopping: return "stopping";
        case SessionState::Stopped: return "stopped";
        case SessionState::Failed: return "failed";
    }
    return "unknown";
}

/// @brief Creates a connected, not yet initialized client for a server config.
using ClientFactory = std::function<Result<std::unique_ptr<McpClient>>(const ServerConfig&)>;

/// @brief Returns the factory that spawns the server via a StdioTransport.
[[nodiscard]] auto stdioClientFactory(McpClientOptions clientOptions, StdioTransportOptions transportOptions)
    -> ClientFactory;

struct SessionManagerOptions
{
    bool cacheEnabled = true;
    std::chrono::seconds cacheTtl { 300 };

    bool autoCleanup = true;
    /// READY sessions idle longer than this are reclaimed.
    std::chrono::seconds idleTimeout { 600 };
    /// FAILED sessions are reclaimed after this grace.
    std::chrono::seconds failedGrace { 30 };

    McpClientOptions client;
    StdioTransportOptions transport;
};

struct DiscoverOptions
{
    /// Skip the tool cache and query the server.
    bool bypassCache = false;
    std::string agentId;
};

struct DiscoveryResult
{
    std::vector<ToolDescriptor> tools;
    ServerCapabilities server;
    bool fromCache = false;
};

/// @brief Point-in-time view of a session.
struct SessionStatus
{
    std::string sessionId;
    SessionState state = SessionState::Stopped;
    std::string fingerprint;
    std::string serverName;
    ServerCapabilities server;
    std::string agentId;
    std::chrono::milliseconds idle {};
    std::chrono::milliseconds uptime {};
    size_t inFlight = 0;
    size_t toolCount = 0;
    std::optional<Error> failure;
};

struct ManagerStats
{
    size_t activeSessions = 0;
    size_t failedSessions = 0;
    size_t stoppedSessions = 0;
    size_t cacheEntries = 0;
    bool cacheEnabled = false;
    std::chrono::seconds cacheTtl {};
    bool autoCleanup = false;
    std::chrono::seconds idleTimeout {};
    std::string_view platform;
};

/// @brief Owns every MCP server session and its subprocess.
///
/// Maps caller-chosen session ids to live protocol clients, creating them on demand,
/// serving tool lists from the shared ToolCache, and tearing them down on stop or
/// reclamation. All operations are safe to call concurrently; no lock is held across
/// a protocol round trip.
class SessionManager
{
  public:
    explicit SessionManager(SessionManagerOptions options = {},
                            ClientFactory factory = {},
                            TimeSource now = systemTimeSource());
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// @brief Returns the tools of a session's server, starting the session if needed.
    ///
    /// Fails with SessionConfigMismatch if the session exists with a different configuration.
    [[nodiscard]] auto discover(const std::string& sessionId,
                                const ServerConfig& config,
                                const DiscoverOptions& options = {}) -> Result<DiscoveryResult>;

    /// @brief Calls a tool on a session's server.
    /// @param config If given, a missing session is created from it; otherwise it must exist.
    [[nodiscard]] auto execute(const std::string& sessionId,
                               std::string_view toolName,
                               const nlohmann::json& arguments,
                               const std::optional<ServerConfig>& config = std::nullopt,
                               std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<ToolResult>;

    /// @brief Stops a session and terminates its server process.
    [[nodiscard]] auto stop(const std::string& sessionId) -> VoidResult;

    /// @brief Returns the status of a live or recently stopped session.
    ///
    /// A session whose server has gone away since its last call is reported as failed.
    [[nodiscard]] auto status(const std::string& sessionId) -> Result<SessionStatus>;

    /// @brief Returns all sessions that are creating, ready or busy.
    [[nodiscard]] auto listActive() -> std::vector<SessionStatus>;

    [[nodiscard]] auto stats() -> ManagerStats;

    /// @brief Reclaims idle READY sessions and expired FAILED sessions, prunes old tombstones.
    /// @return The number of sessions stopped.
    auto reclaimIdle() -> size_t;

    /// @brief Stops every session.
    void shutdown();

    [[nodiscard]] auto options() const noexcept -> const SessionManagerOptions& { return _options; }
    [[nodiscard]] auto cache() noexcept -> ToolCache& { return _cache; }

  private:
    struct ManagedSession;
    using SessionPtr = std::shared_ptr<ManagedSession>;

    struct Tombstone
    {
        std::string fingerprint;
        std::string serverName;
        ServerCapabilities server;
        std::string agentId;
        Clock::time_point createdAt;
        Clock::time_point stoppedAt;
    };

    [[nodiscard]] auto acquire(const std::string& sessionId, const ServerConfig* config) -> Result<SessionPtr>;
    [[nodiscard]] auto createSession(const SessionPtr& session) -> Result<SessionPtr>;
    [[nodiscard]] auto beginCall(ManagedSession& session) -> VoidResult;
    void endCall(ManagedSession& session);
    void handleCallError(ManagedSession& session, const Error& error);
    void failSession(ManagedSession& session, const Error& error);
    void checkConnection(ManagedSession& session);
    [[nodiscard]] auto liveSessions() const -> std::vector<SessionPtr>;
    auto finishStop(const SessionPtr& session) -> bool;
    [[nodiscard]] auto snapshot(const ManagedSession& session) const -> SessionStatus;

    SessionManagerOptions _options;
    ClientFactory _factory;
    TimeSource _now;
    ToolCache _cache;

    mutable std::mutex _mutex;
    std::map<std::string, SessionPtr> _sessions;
    std::map<std::string, Tombstone> _tombstones;
};

} // namespace mcprunner
