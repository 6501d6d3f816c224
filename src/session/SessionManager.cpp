// SPDX-License-Identifier: Apache-2.0
#include "SessionManager.hpp"

#include <core/Log.hpp>
#include <mcp/Process.hpp>

#include <algorithm>
#include <format>
#include <thread>

namespace mcprunner
{

struct SessionManager::ManagedSession
{
    std::string id;
    ServerConfig config;
    std::string fingerprint;
    Clock::time_point createdAt;

    /// Serializes creation and teardown.
    std::mutex lifecycleMutex;

    /// Guards everything below.
    mutable std::mutex stateMutex;
    SessionState state = SessionState::Creating;
    Clock::time_point lastActivity;
    size_t inFlight = 0;
    std::string agentId;
    ServerCapabilities server;
    std::vector<ToolDescriptor> tools;
    std::optional<Error> failure;

    /// Set once before the session becomes READY, never reset while the session is alive.
    std::unique_ptr<McpClient> client;
};

auto stdioClientFactory(McpClientOptions clientOptions, StdioTransportOptions transportOptions) -> ClientFactory
{
    return [clientOptions = std::move(clientOptions), transportOptions = std::move(transportOptions)](
               const ServerConfig& config) -> Result<std::unique_ptr<McpClient>> {
        auto transport = std::make_unique<StdioTransport>();
        if (auto started = transport->start(config, transportOptions); !started)
            return std::unexpected(started.error());
        return std::make_unique<McpClient>(std::move(transport), clientOptions);
    };
}

SessionManager::SessionManager(SessionManagerOptions options, ClientFactory factory, TimeSource now):
    _options(std::move(options)),
    _factory(factory ? std::move(factory) : stdioClientFactory(_options.client, _options.transport)),
    _now(std::move(now)),
    _cache(_options.cacheTtl, _options.cacheEnabled, _now)
{
}

SessionManager::~SessionManager()
{
    shutdown();
}

auto SessionManager::discover(const std::string& sessionId,
                              const ServerConfig& config,
                              const DiscoverOptions& options) -> Result<DiscoveryResult>
{
    auto acquired = acquire(sessionId, &config);
    if (!acquired)
        return std::unexpected(acquired.error());
    auto& session = **acquired;

    auto server = ServerCapabilities {};
    {
        auto lock = std::scoped_lock(session.stateMutex);
        if (!options.agentId.empty())
            session.agentId = options.agentId;
        session.lastActivity = _now();
        server = session.server;
    }

    if (!options.bypassCache)
    {
        if (auto cached = _cache.get(session.fingerprint))
        {
            log::debug("Session '{}': serving {} tool(s) from cache", sessionId, cached->size());
            auto lock = std::scoped_lock(session.stateMutex);
            session.tools = *cached;
            return DiscoveryResult { .tools = std::move(*cached), .server = server, .fromCache = true };
        }
    }

    if (auto begun = beginCall(session); !begun)
        return std::unexpected(begun.error());
    auto tools = session.client->listTools();
    endCall(session);

    if (!tools)
    {
        handleCallError(session, tools.error());
        return std::unexpected(tools.error());
    }

    log::info("Session '{}': discovered {} tool(s)", sessionId, tools->size());
    _cache.put(session.fingerprint, *tools);
    {
        auto lock = std::scoped_lock(session.stateMutex);
        session.tools = *tools;
    }
    return DiscoveryResult { .tools = std::move(*tools), .server = std::move(server), .fromCache = false };
}

auto SessionManager::execute(const std::string& sessionId,
                             std::string_view toolName,
                             const nlohmann::json& arguments,
                             const std::optional<ServerConfig>& config,
                             std::optional<std::chrono::milliseconds> timeout) -> Result<ToolResult>
{
    auto acquired = acquire(sessionId, config ? &*config : nullptr);
    if (!acquired)
        return std::unexpected(acquired.error());
    auto& session = **acquired;

    {
        auto lock = std::scoped_lock(session.stateMutex);
        auto const known = std::ranges::any_of(
            session.tools, [&](const ToolDescriptor& tool) { return tool.name == toolName; });
        if (!session.tools.empty() && !known)
            log::warning("Session '{}': tool '{}' was not reported by the last discovery", sessionId, toolName);
    }

    if (auto begun = beginCall(session); !begun)
        return std::unexpected(begun.error());
    log::debug("Session '{}': calling tool '{}'", sessionId, toolName);
    auto result = session.client->callTool(toolName, arguments, timeout);
    endCall(session);

    if (!result)
    {
        handleCallError(session, result.error());
        return std::unexpected(result.error());
    }
    return result;
}

auto SessionManager::stop(const std::string& sessionId) -> VoidResult
{
    auto session = SessionPtr {};
    {
        auto lock = std::scoped_lock(_mutex);
        auto it = _sessions.find(sessionId);
        if (it == _sessions.end())
            return makeError(ErrorCode::SessionNotFound, std::format("Session '{}' not found", sessionId));
        session = it->second;
    }

    if (!finishStop(session))
        return makeError(ErrorCode::SessionNotFound, std::format("Session '{}' not found", sessionId));
    return {};
}

auto SessionManager::status(const std::string& sessionId) -> Result<SessionStatus>
{
    auto session = SessionPtr {};
    {
        auto lock = std::scoped_lock(_mutex);
        if (auto it = _sessions.find(sessionId); it != _sessions.end())
            session = it->second;
        else if (auto tomb = _tombstones.find(sessionId); tomb != _tombstones.end())
        {
            auto const& t = tomb->second;
            return SessionStatus {
                .sessionId = sessionId,
                .state = SessionState::Stopped,
                .fingerprint = t.fingerprint,
                .serverName = t.serverName,
                .server = t.server,
                .agentId = t.agentId,
                .idle = std::chrono::duration_cast<std::chrono::milliseconds>(_now() - t.stoppedAt),
                .uptime = std::chrono::duration_cast<std::chrono::milliseconds>(t.stoppedAt - t.createdAt),
            };
        }
    }

    if (!session)
        return makeError(ErrorCode::SessionNotFound, std::format("Session '{}' not found", sessionId));
    checkConnection(*session);
    return snapshot(*session);
}

auto SessionManager::listActive() -> std::vector<SessionStatus>
{
    auto result = std::vector<SessionStatus> {};
    for (const auto& session: liveSessions())
    {
        checkConnection(*session);
        auto s = snapshot(*session);
        if (s.state == SessionState::Creating || s.state == SessionState::Ready || s.state == SessionState::Busy)
            result.push_back(std::move(s));
    }
    return result;
}

auto SessionManager::stats() -> ManagerStats
{
    auto stats = ManagerStats {
        .cacheEnabled = _options.cacheEnabled,
        .cacheTtl = _options.cacheTtl,
        .autoCleanup = _options.autoCleanup,
        .idleTimeout = _options.idleTimeout,
        .platform = platformName(currentPlatform()),
    };

    {
        auto lock = std::scoped_lock(_mutex);
        stats.stoppedSessions = _tombstones.size();
    }
    for (const auto& session: liveSessions())
    {
        checkConnection(*session);
        auto stateLock = std::scoped_lock(session->stateMutex);
        switch (session->state)
        {
            case SessionState::Creating:
            case SessionState::Ready:
            case SessionState::Busy: ++stats.activeSessions; break;
            case SessionState::Failed: ++stats.failedSessions; break;
            case SessionState::Stopping:
            case SessionState::Stopped: break;
        }
    }
    stats.cacheEntries = _cache.size();
    return stats;
}

auto SessionManager::reclaimIdle() -> size_t
{
    auto sessions = std::vector<SessionPtr> {};
    auto const now = _now();
    {
        auto lock = std::scoped_lock(_mutex);
        std::erase_if(_tombstones, [&](const auto& entry) {
            return now - entry.second.stoppedAt > _options.idleTimeout;
        });
        for (const auto& [id, session]: _sessions)
            sessions.push_back(session);
    }

    auto reclaimed = size_t { 0 };
    for (const auto& session: sessions)
    {
        checkConnection(*session);
        {
            auto lock = std::scoped_lock(session->stateMutex);
            auto const idleFor = now - session->lastActivity;
            auto const idleReady =
                session->state == SessionState::Ready && session->inFlight == 0 && idleFor > _options.idleTimeout;
            auto const expiredFailure =
                session->state == SessionState::Failed && idleFor > _options.failedGrace;
            if (!idleReady && !expiredFailure)
                continue;

            log::info("Reclaiming {} session '{}' (idle {})",
                      stateName(session->state),
                      session->id,
                      std::chrono::duration_cast<std::chrono::seconds>(idleFor));
            session->state = SessionState::Stopping;
        }

        if (finishStop(session))
            ++reclaimed;
    }
    return reclaimed;
}

void SessionManager::shutdown()
{
    auto const sessions = liveSessions();
    if (!sessions.empty())
        log::info("Shutting down {} session(s)", sessions.size());
    for (const auto& session: sessions)
        finishStop(session);
}

auto SessionManager::acquire(const std::string& sessionId, const ServerConfig* config) -> Result<SessionPtr>
{
    auto const requestedFingerprint = config ? fingerprint(*config) : std::string {};

    while (true)
    {
        auto session = SessionPtr {};
        auto creating = std::unique_lock<std::mutex> {};
        {
            auto lock = std::scoped_lock(_mutex);
            if (auto it = _sessions.find(sessionId); it != _sessions.end())
                session = it->second;
            else
            {
                if (!config)
                    return makeError(ErrorCode::SessionNotFound, std::format("Session '{}' not found", sessionId));

                session = std::make_shared<ManagedSession>();
                session->id = sessionId;
                session->config = *config;
                session->fingerprint = requestedFingerprint;
                session->createdAt = _now();
                session->lastActivity = session->createdAt;
                creating = std::unique_lock(session->lifecycleMutex);
                _sessions.emplace(sessionId, session);
                _tombstones.erase(sessionId);
            }
        }

        if (creating.owns_lock())
            return createSession(session);

        checkConnection(*session);
        auto state = SessionState {};
        auto failure = std::optional<Error> {};
        {
            auto lock = std::scoped_lock(session->stateMutex);
            state = session->state;
            failure = session->failure;
        }

        if (state == SessionState::Creating || state == SessionState::Stopping || state == SessionState::Stopped)
        {
            // Wait for the concurrent create or stop to finish, then look again.
            {
                auto const wait = std::scoped_lock(session->lifecycleMutex);
            }
            std::this_thread::yield();
            continue;
        }

        if (config && requestedFingerprint != session->fingerprint)
        {
            return makeError(ErrorCode::SessionConfigMismatch,
                             std::format("Session '{}' is already running with a different configuration",
                                         sessionId),
                             { { "sessionId", sessionId },
                               { "expected", session->fingerprint },
                               { "actual", requestedFingerprint } });
        }

        if (state == SessionState::Failed)
        {
            auto cause = failure ? failure->message : std::string("unknown failure");
            return makeError(ErrorCode::SessionFailed,
                             std::format("Session '{}' has failed: {}", sessionId, cause),
                             { { "sessionId", sessionId },
                               { "cause", failure ? std::string(errorCodeName(failure->code)) : "" } });
        }

        return session;
    }
}

auto SessionManager::createSession(const SessionPtr& session) -> Result<SessionPtr>
{
    // Called with session->lifecycleMutex held.
    log::info("Session '{}': starting MCP server '{}' ({})",
              session->id,
              session->config.name,
              session->config.command);

    auto client = _factory(session->config);
    if (!client)
    {
        log::error("Session '{}': launch failed: {}", session->id, client.error());
        failSession(*session, client.error());
        return std::unexpected(client.error());
    }

    auto capabilities = (*client)->initialize();
    if (!capabilities)
    {
        log::error("Session '{}': handshake failed: {}", session->id, capabilities.error());
        (*client)->close();
        failSession(*session, capabilities.error());
        return std::unexpected(capabilities.error());
    }

    {
        auto lock = std::scoped_lock(session->stateMutex);
        session->client = std::move(*client);
        session->server = *capabilities;
        session->lastActivity = _now();
        session->state = SessionState::Ready;
    }
    log::info("Session '{}': ready ({} v{})",
              session->id,
              capabilities->serverInfo.name,
              capabilities->serverInfo.version);
    return session;
}

auto SessionManager::beginCall(ManagedSession& session) -> VoidResult
{
    auto lock = std::scoped_lock(session.stateMutex);
    switch (session.state)
    {
        case SessionState::Ready:
        case SessionState::Busy:
            ++session.inFlight;
            session.state = SessionState::Busy;
            session.lastActivity = _now();
            return {};
        case SessionState::Failed:
            return makeError(ErrorCode::SessionFailed,
                             std::format("Session '{}' has failed: {}",
                                         session.id,
                                         session.failure ? session.failure->message : "unknown failure"));
        case SessionState::Creating:
        case SessionState::Stopping:
        case SessionState::Stopped: break;
    }
    return makeError(ErrorCode::SessionNotFound, std::format("Session '{}' is no longer running", session.id));
}

void SessionManager::endCall(ManagedSession& session)
{
    auto lock = std::scoped_lock(session.stateMutex);
    if (session.inFlight > 0)
        --session.inFlight;
    if (session.inFlight == 0 && session.state == SessionState::Busy)
        session.state = SessionState::Ready;
    session.lastActivity = _now();
}

void SessionManager::handleCallError(ManagedSession& session, const Error& error)
{
    // Tool errors and timeouts leave the server usable; a broken connection does not.
    auto const connectionLost = error.code == ErrorCode::ConnectionClosed
                                || error.code == ErrorCode::TransportError
                                || (session.client && session.client->failure().has_value());
    if (connectionLost)
        failSession(session, error);
}

void SessionManager::failSession(ManagedSession& session, const Error& error)
{
    {
        auto lock = std::scoped_lock(session.stateMutex);
        if (session.state == SessionState::Stopping || session.state == SessionState::Stopped
            || session.state == SessionState::Failed)
            return;
        session.state = SessionState::Failed;
        session.failure = error;
        session.lastActivity = _now();
    }

    log::error("Session '{}' failed: {}", session.id, error);
    _cache.invalidate(session.fingerprint);
    if (session.client)
        session.client->close();
}

void SessionManager::checkConnection(ManagedSession& session)
{
    {
        auto lock = std::scoped_lock(session.stateMutex);
        if (session.state != SessionState::Ready && session.state != SessionState::Busy)
            return;
    }

    // The reader records a hang-up or a malformed frame even when no call is waiting for it.
    if (auto failure = session.client->failure())
        failSession(session, *failure);
}

auto SessionManager::liveSessions() const -> std::vector<SessionPtr>
{
    auto lock = std::scoped_lock(_mutex);
    auto sessions = std::vector<SessionPtr> {};
    sessions.reserve(_sessions.size());
    for (const auto& [id, session]: _sessions)
        sessions.push_back(session);
    return sessions;
}

auto SessionManager::finishStop(const SessionPtr& session) -> bool
{
    auto lifecycle = std::scoped_lock(session->lifecycleMutex);
    {
        auto lock = std::scoped_lock(session->stateMutex);
        if (session->state == SessionState::Stopped)
            return false;
        session->state = SessionState::Stopping;
    }

    if (session->client)
        session->client->close();

    auto tombstone = Tombstone {};
    {
        auto lock = std::scoped_lock(session->stateMutex);
        tombstone = Tombstone {
            .fingerprint = session->fingerprint,
            .serverName = session->config.name,
            .server = session->server,
            .agentId = session->agentId,
            .createdAt = session->createdAt,
            .stoppedAt = _now(),
        };
    }

    {
        auto lock = std::scoped_lock(_mutex);
        if (auto it = _sessions.find(session->id); it != _sessions.end() && it->second == session)
            _sessions.erase(it);
        _tombstones.insert_or_assign(session->id, std::move(tombstone));
    }

    {
        auto lock = std::scoped_lock(session->stateMutex);
        session->state = SessionState::Stopped;
    }
    log::info("Session '{}' stopped", session->id);
    return true;
}

auto SessionManager::snapshot(const ManagedSession& session) const -> SessionStatus
{
    auto const now = _now();
    auto lock = std::scoped_lock(session.stateMutex);
    return SessionStatus {
        .sessionId = session.id,
        .state = session.state,
        .fingerprint = session.fingerprint,
        .serverName = session.config.name,
        .server = session.server,
        .agentId = session.agentId,
        .idle = std::chrono::duration_cast<std::chrono::milliseconds>(now - session.lastActivity),
        .uptime = std::chrono::duration_cast<std::chrono::milliseconds>(now - session.createdAt),
        .inFlight = session.inFlight,
        .toolCount = session.tools.size(),
        .failure = session.failure,
    };
}

} // namespace mcprunner
