// SPDX-License-Identifier: Apache-2.0
#include "RequestHandler.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/Process.hpp>

#include <format>

namespace mcprunner
{

namespace
{

    auto toJson(const ToolDescriptor& tool) -> nlohmann::json
    {
        return nlohmann::json {
            { "name", tool.name },
            { "description", tool.description },
            { "inputSchema", tool.inputSchema },
        };
    }

    auto toJson(const ServerCapabilities& server) -> nlohmann::json
    {
        auto out = nlohmann::json {
            { "server_name", server.serverInfo.name },
            { "version", server.serverInfo.version },
            { "protocol_version", server.protocolVersion },
            { "capabilities",
              {
                  { "tools", server.hasTools },
                  { "resources", server.hasResources },
                  { "prompts", server.hasPrompts },
              } },
        };
        if (!server.instructions.empty())
            out["instructions"] = server.instructions;
        return out;
    }

    auto toSeconds(std::chrono::milliseconds duration) -> double
    {
        return std::chrono::duration<double>(duration).count();
    }

    auto toJson(const SessionStatus& status) -> nlohmann::json
    {
        auto out = nlohmann::json {
            { "session_id", status.sessionId },
            { "status", std::string(stateName(status.state)) },
            { "name", status.serverName },
            { "fingerprint", status.fingerprint },
            { "server_info", toJson(status.server) },
            { "idle_seconds", toSeconds(status.idle) },
            { "uptime_seconds", toSeconds(status.uptime) },
            { "in_flight", status.inFlight },
            { "tool_count", status.toolCount },
        };
        if (!status.agentId.empty())
            out["agent_id"] = status.agentId;
        if (status.failure)
        {
            out["error"] = status.failure->message;
            out["error_code"] = std::string(errorCodeName(status.failure->code));
        }
        return out;
    }

    auto requireSessionId(const nlohmann::json& request) -> Result<std::string>
    {
        auto sessionId = json::get<std::string>(request, "session_id");
        if (!sessionId || sessionId->empty())
            return makeError(ErrorCode::InvalidArgument, "Request requires a non-empty 'session_id'");
        return sessionId;
    }

} // namespace

auto formatUptime(std::chrono::seconds uptime) -> std::string
{
    auto const total = uptime.count() < 0 ? 0 : uptime.count();
    return std::format("{}:{:02}:{:02}", total / 3600, (total / 60) % 60, total % 60);
}

auto errorResponse(const Error& error) -> nlohmann::json
{
    auto response = nlohmann::json {
        { "status", "error" },
        { "error", error.message },
        { "error_code", std::string(errorCodeName(error.code)) },
    };
    if (!error.details.is_null())
        response["details"] = error.details;
    return response;
}

RequestHandler::RequestHandler(SessionManager& manager, RunnerConfig config, TimeSource now):
    _manager(manager), _config(std::move(config)), _now(std::move(now)), _startedAt(_now())
{
}

auto RequestHandler::handle(const nlohmann::json& request) -> nlohmann::json
{
    auto response = nlohmann::json {};
    auto operation = json::get<std::string>(request, "operation");
    if (!operation)
        response = errorResponse(Error { .code = ErrorCode::InvalidArgument,
                                         .message = "Request requires a string 'operation'" });
    else if (auto result = dispatch(*operation, request); result)
        response = std::move(*result);
    else
    {
        log::warning("{} failed: {}", *operation, result.error());
        response = errorResponse(result.error());
    }

    if (request.is_object() && request.contains("request_id"))
        response["request_id"] = request["request_id"];
    return response;
}

auto RequestHandler::handleLine(std::string_view line) -> nlohmann::json
{
    auto request = json::parse(line);
    if (!request)
        return errorResponse(Error { .code = ErrorCode::InvalidArgument, .message = request.error().message });
    return handle(*request);
}

auto RequestHandler::dispatch(std::string_view operation, const nlohmann::json& request) -> Result<nlohmann::json>
{
    if (operation == "discover")
        return discover(request);
    if (operation == "execute")
        return execute(request);
    if (operation == "stop")
        return stop(request);
    if (operation == "status")
        return status(request);
    if (operation == "active-sessions")
        return activeSessions();
    if (operation == "health")
        return health();
    if (operation == "stats")
        return stats();

    return makeError(ErrorCode::InvalidArgument, std::format("Unknown operation: {}", operation));
}

auto RequestHandler::discover(const nlohmann::json& request) -> Result<nlohmann::json>
{
    auto sessionId = requireSessionId(request);
    if (!sessionId)
        return std::unexpected(sessionId.error());

    auto config = resolveServerConfig(request);
    if (!config)
        return std::unexpected(config.error());
    if (!*config)
        return makeError(ErrorCode::InvalidArgument, "discover requires 'mcp_config' or 'server'");

    auto options = DiscoverOptions {
        .bypassCache = json::getOr<bool>(request, "bypass_cache", false),
        .agentId = json::getOr<std::string>(request, "agent_id", ""),
    };
    log::info("Tool discovery request: {} (session {})", (*config)->name, *sessionId);

    auto discovery = _manager.discover(*sessionId, **config, options);
    if (!discovery)
        return std::unexpected(discovery.error());

    auto tools = nlohmann::json::array();
    for (const auto& tool: discovery->tools)
        tools.push_back(toJson(tool));

    return nlohmann::json {
        { "status", "success" },
        { "session_id", *sessionId },
        { "tools", std::move(tools) },
        { "server_info", toJson(discovery->server) },
        { "from_cache", discovery->fromCache },
    };
}

auto RequestHandler::execute(const nlohmann::json& request) -> Result<nlohmann::json>
{
    auto sessionId = requireSessionId(request);
    if (!sessionId)
        return std::unexpected(sessionId.error());

    auto toolName = json::get<std::string>(request, "tool_name");
    if (!toolName || toolName->empty())
        return makeError(ErrorCode::InvalidArgument, "execute requires a non-empty 'tool_name'");

    auto arguments = nlohmann::json::object();
    if (request.contains("arguments") && !request["arguments"].is_null())
    {
        if (!request["arguments"].is_object())
            return makeError(ErrorCode::InvalidArgument, "'arguments' must be an object");
        arguments = request["arguments"];
    }

    auto timeout = std::optional<std::chrono::milliseconds> {};
    if (auto const timeoutMs = json::getOr<int>(request, "timeout_ms", 0); timeoutMs > 0)
        timeout = std::chrono::milliseconds { timeoutMs };

    auto config = resolveServerConfig(request);
    if (!config)
        return std::unexpected(config.error());

    log::info("Tool execution request: {} (session {})", *toolName, *sessionId);
    auto result = _manager.execute(*sessionId, *toolName, arguments, *config, timeout);
    if (!result)
        return std::unexpected(result.error());

    auto response = nlohmann::json {
        { "status", "success" },
        { "session_id", *sessionId },
        { "result", result->content },
    };
    if (result->structuredContent)
        response["structured_content"] = *result->structuredContent;
    return response;
}

auto RequestHandler::stop(const nlohmann::json& request) -> Result<nlohmann::json>
{
    auto sessionId = requireSessionId(request);
    if (!sessionId)
        return std::unexpected(sessionId.error());

    log::info("Server stop request: {}", *sessionId);
    if (auto stopped = _manager.stop(*sessionId); !stopped)
        return std::unexpected(stopped.error());

    return nlohmann::json {
        { "status", "stopped" },
        { "session_id", *sessionId },
        { "message", "Session stopped" },
    };
}

auto RequestHandler::status(const nlohmann::json& request) -> Result<nlohmann::json>
{
    auto sessionId = requireSessionId(request);
    if (!sessionId)
        return std::unexpected(sessionId.error());

    auto status = _manager.status(*sessionId);
    if (!status)
    {
        if (status.error().code == ErrorCode::SessionNotFound)
            return nlohmann::json { { "status", "not_found" }, { "session_id", *sessionId } };
        return std::unexpected(status.error());
    }
    return toJson(*status);
}

auto RequestHandler::activeSessions() -> nlohmann::json
{
    auto sessions = nlohmann::json::array();
    for (const auto& session: _manager.listActive())
        sessions.push_back(toJson(session));

    auto const count = sessions.size();
    return nlohmann::json {
        { "status", "success" },
        { "sessions", std::move(sessions) },
        { "total_count", count },
    };
}

auto RequestHandler::health() -> nlohmann::json
{
    return nlohmann::json {
        { "status", "healthy" },
        { "platform", std::string(platformName(currentPlatform())) },
        { "is_windows", currentPlatform() == Platform::Windows },
        { "version", std::string(RunnerVersion) },
        { "uptime", formatUptime(uptime()) },
        { "active_sessions", _manager.stats().activeSessions },
    };
}

auto RequestHandler::stats() -> nlohmann::json
{
    auto const stats = _manager.stats();
    return nlohmann::json {
        { "status", "success" },
        { "system",
          {
              { "version", std::string(RunnerVersion) },
              { "uptime", formatUptime(uptime()) },
              { "platform", std::string(stats.platform) },
              { "config", toJson(_config) },
          } },
        { "mcp",
          {
              { "active_sessions", stats.activeSessions },
              { "failed_sessions", stats.failedSessions },
              { "stopped_sessions", stats.stoppedSessions },
              { "cached_tools", stats.cacheEntries },
              { "cache_enabled", stats.cacheEnabled },
              { "cache_ttl", stats.cacheTtl.count() },
              { "auto_cleanup_enabled", stats.autoCleanup },
              { "idle_timeout", stats.idleTimeout.count() },
              { "platform", std::string(stats.platform) },
              { "is_windows", currentPlatform() == Platform::Windows },
          } },
    };
}

auto RequestHandler::resolveServerConfig(const nlohmann::json& request) const
    -> Result<std::optional<ServerConfig>>
{
    if (request.contains("mcp_config") && !request["mcp_config"].is_null())
    {
        auto config = serverConfigFromJson(request["mcp_config"]);
        if (!config)
            return std::unexpected(config.error());
        return std::optional { std::move(*config) };
    }

    if (request.contains("server"))
    {
        auto name = json::get<std::string>(request, "server");
        if (!name)
            return std::unexpected(name.error());
        auto it = _config.mcpServers.find(*name);
        if (it == _config.mcpServers.end())
            return makeError(ErrorCode::InvalidArgument, std::format("Unknown server preset: {}", *name));
        return std::optional { it->second };
    }

    return std::optional<ServerConfig> {};
}

auto RequestHandler::uptime() const -> std::chrono::seconds
{
    return std::chrono::duration_cast<std::chrono::seconds>(_now() - _startedAt);
}

} // namespace mcprunner
