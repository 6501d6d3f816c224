// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace mcprunner
{

namespace
{

    auto toLower(std::string_view text) -> std::string
    {
        auto out = std::string(text);
        std::ranges::transform(out, out.begin(), [](unsigned char c) { return std::tolower(c); });
        return out;
    }

    auto parseBool(std::string_view name, std::string_view value) -> Result<bool>
    {
        auto const lower = toLower(value);
        if (lower == "1" || lower == "true" || lower == "yes" || lower == "on")
            return true;
        if (lower == "0" || lower == "false" || lower == "no" || lower == "off")
            return false;
        return makeError(ErrorCode::ConfigError, std::format("{} must be a boolean, got '{}'", name, value));
    }

    auto parseInt(std::string_view name, std::string_view value) -> Result<int>
    {
        auto result = 0;
        auto const* const end = value.data() + value.size();
        auto const [ptr, ec] = std::from_chars(value.data(), end, result);
        if (ec != std::errc {} || ptr != end)
            return makeError(ErrorCode::ConfigError, std::format("{} must be an integer, got '{}'", name, value));
        return result;
    }

    auto overrideBool(const EnvLookup& lookup, std::string_view name, bool& target) -> VoidResult
    {
        if (auto value = lookup(name))
        {
            auto parsed = parseBool(name, *value);
            if (!parsed)
                return std::unexpected(parsed.error());
            target = *parsed;
        }
        return {};
    }

    auto overrideInt(const EnvLookup& lookup, std::string_view name, int& target) -> VoidResult
    {
        if (auto value = lookup(name))
        {
            auto parsed = parseInt(name, *value);
            if (!parsed)
                return std::unexpected(parsed.error());
            target = *parsed;
        }
        return {};
    }

    void overrideString(const EnvLookup& lookup, std::string_view name, std::string& target)
    {
        if (auto value = lookup(name))
            target = std::move(*value);
    }

} // namespace

auto processEnvironment() -> EnvLookup
{
    return [](std::string_view name) -> std::optional<std::string> {
        auto const* const value = std::getenv(std::string(name).c_str());
        if (!value)
            return std::nullopt;
        return std::string(value);
    };
}

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\mcprunner";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/mcprunner";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/mcprunner";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcprunner";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto defaultNpmCacheDir() -> std::string
{
#ifdef _WIN32
    auto const* const temp = std::getenv("TEMP");
    return (std::filesystem::path(temp ? temp : "C:\\Temp") / ".npm").string();
#else
    return "/tmp/.npm";
#endif
}

auto parseConfig(const nlohmann::json& root) -> Result<RunnerConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto config = RunnerConfig {};

    // Session section
    if (root.contains("session"))
    {
        auto const& session = root["session"];
        auto const defaults = SessionConfig {};
        config.session.cacheEnabled = json::getOr<bool>(session, "cacheEnabled", defaults.cacheEnabled);
        config.session.cacheTtlSeconds = json::getOr<int>(session, "cacheTtl", defaults.cacheTtlSeconds);
        config.session.autoCleanup = json::getOr<bool>(session, "autoCleanup", defaults.autoCleanup);
        config.session.idleTimeoutSeconds = json::getOr<int>(session, "idleTimeout", defaults.idleTimeoutSeconds);
        config.session.cleanupIntervalSeconds =
            json::getOr<int>(session, "cleanupInterval", defaults.cleanupIntervalSeconds);
        config.session.failedGraceSeconds = json::getOr<int>(session, "failedGrace", defaults.failedGraceSeconds);
        config.session.handshakeTimeoutSeconds =
            json::getOr<int>(session, "handshakeTimeout", defaults.handshakeTimeoutSeconds);
        config.session.callTimeoutSeconds = json::getOr<int>(session, "callTimeout", defaults.callTimeoutSeconds);
        config.session.requestTimeoutSeconds =
            json::getOr<int>(session, "requestTimeout", defaults.requestTimeoutSeconds);
        config.session.terminateGraceMs = json::getOr<int>(session, "terminateGraceMs", defaults.terminateGraceMs);
        config.session.maxConcurrentRequests =
            json::getOr<int>(session, "maxConcurrentRequests", defaults.maxConcurrentRequests);
    }

    // Log section
    if (root.contains("log"))
    {
        auto const& log = root["log"];
        config.log.level = json::getOr<std::string>(log, "level", "INFO");
        config.log.file = json::getOr<std::string>(log, "file", "");
    }

    // Node section
    if (root.contains("node"))
    {
        auto const& node = root["node"];
        config.node.npmConfigCache = json::getOr<std::string>(node, "npmConfigCache", "");
        config.node.nodePath = json::getOr<std::string>(node, "nodePath", "");
    }

    // MCP server presets
    if (root.contains("mcpServers"))
    {
        if (!root["mcpServers"].is_object())
            return makeError(ErrorCode::ConfigError, "'mcpServers' must be an object");

        for (const auto& [name, serverJson]: root["mcpServers"].items())
        {
            auto server = serverConfigFromJson(serverJson);
            if (!server)
                return makeError(ErrorCode::ConfigError,
                                 std::format("Invalid MCP server '{}': {}", name, server.error().message));
            if (!serverJson.contains("name"))
                server->name = name;
            config.mcpServers[name] = std::move(*server);
        }
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<RunnerConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return makeError(ErrorCode::ConfigError,
                         std::format("Invalid config file {}: {}", path, parseResult.error().message));

    return parseConfig(*parseResult);
}

auto loadConfig() -> Result<RunnerConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::debug("No config file found at {}, using defaults", path);
        return RunnerConfig {};
    }

    return loadConfigFromFile(path);
}

auto applyEnvironment(RunnerConfig& config, const EnvLookup& lookup) -> VoidResult
{
    auto& session = config.session;
    auto results = {
        overrideBool(lookup, "MCP_CACHE_ENABLED", session.cacheEnabled),
        overrideInt(lookup, "MCP_CACHE_TTL", session.cacheTtlSeconds),
        overrideBool(lookup, "MCP_AUTO_CLEANUP", session.autoCleanup),
        overrideInt(lookup, "MCP_SESSION_TIMEOUT", session.idleTimeoutSeconds),
        overrideInt(lookup, "MCP_CLEANUP_INTERVAL", session.cleanupIntervalSeconds),
        overrideInt(lookup, "MCP_HANDSHAKE_TIMEOUT", session.handshakeTimeoutSeconds),
        overrideInt(lookup, "MCP_CALL_TIMEOUT", session.callTimeoutSeconds),
        overrideInt(lookup, "MCP_MAX_CONCURRENT_REQUESTS", session.maxConcurrentRequests),
    };
    for (const auto& result: results)
    {
        if (!result)
            return result;
    }

    overrideString(lookup, "LOG_LEVEL", config.log.level);
    overrideString(lookup, "LOG_FILE", config.log.file);
    overrideString(lookup, "NPM_CONFIG_CACHE", config.node.npmConfigCache);
    overrideString(lookup, "NODE_PATH", config.node.nodePath);
    return {};
}

auto validateConfig(const RunnerConfig& config) -> VoidResult
{
    auto const& session = config.session;
    auto const positive = {
        std::pair { "cacheTtl", session.cacheTtlSeconds },
        std::pair { "idleTimeout", session.idleTimeoutSeconds },
        std::pair { "cleanupInterval", session.cleanupIntervalSeconds },
        std::pair { "handshakeTimeout", session.handshakeTimeoutSeconds },
        std::pair { "callTimeout", session.callTimeoutSeconds },
        std::pair { "requestTimeout", session.requestTimeoutSeconds },
        std::pair { "maxConcurrentRequests", session.maxConcurrentRequests },
    };
    for (const auto& [name, value]: positive)
    {
        if (value <= 0)
            return makeError(ErrorCode::ConfigError, std::format("session.{} must be positive, got {}", name, value));
    }

    if (session.failedGraceSeconds < 0)
        return makeError(ErrorCode::ConfigError, "session.failedGrace must not be negative");
    if (session.terminateGraceMs < 0)
        return makeError(ErrorCode::ConfigError, "session.terminateGraceMs must not be negative");

    if (!log::parseLevel(config.log.level))
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level: {}", config.log.level));

    return {};
}

auto toJson(const RunnerConfig& config) -> nlohmann::json
{
    auto const& session = config.session;
    auto servers = nlohmann::json::object();
    for (const auto& [name, server]: config.mcpServers)
        servers[name] = toJson(server);

    return nlohmann::json {
        { "session",
          {
              { "cacheEnabled", session.cacheEnabled },
              { "cacheTtl", session.cacheTtlSeconds },
              { "autoCleanup", session.autoCleanup },
              { "idleTimeout", session.idleTimeoutSeconds },
              { "cleanupInterval", session.cleanupIntervalSeconds },
              { "failedGrace", session.failedGraceSeconds },
              { "handshakeTimeout", session.handshakeTimeoutSeconds },
              { "callTimeout", session.callTimeoutSeconds },
              { "requestTimeout", session.requestTimeoutSeconds },
              { "terminateGraceMs", session.terminateGraceMs },
              { "maxConcurrentRequests", session.maxConcurrentRequests },
          } },
        { "log", { { "level", config.log.level }, { "file", config.log.file } } },
        { "node", { { "npmConfigCache", config.node.npmConfigCache }, { "nodePath", config.node.nodePath } } },
        { "mcpServers", std::move(servers) },
    };
}

auto sessionManagerOptions(const RunnerConfig& config) -> SessionManagerOptions
{
    auto const& session = config.session;
    auto options = SessionManagerOptions {
        .cacheEnabled = session.cacheEnabled,
        .cacheTtl = std::chrono::seconds { session.cacheTtlSeconds },
        .autoCleanup = session.autoCleanup,
        .idleTimeout = std::chrono::seconds { session.idleTimeoutSeconds },
        .failedGrace = std::chrono::seconds { session.failedGraceSeconds },
    };

    options.client.handshakeTimeout = std::chrono::seconds { session.handshakeTimeoutSeconds };
    options.client.callTimeout = std::chrono::seconds { session.callTimeoutSeconds };
    options.client.requestTimeout = std::chrono::seconds { session.requestTimeoutSeconds };
    options.transport.terminateGrace = std::chrono::milliseconds { session.terminateGraceMs };

    auto& overrides = options.transport.launch.baseOverrides;
    overrides["NPM_CONFIG_CACHE"] =
        config.node.npmConfigCache.empty() ? defaultNpmCacheDir() : config.node.npmConfigCache;
    if (!config.node.nodePath.empty())
        overrides["NODE_PATH"] = config.node.nodePath;

    return options;
}

} // namespace mcprunner
