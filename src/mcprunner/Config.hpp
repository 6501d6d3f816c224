// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ServerConfig.hpp>
#include <session/SessionManager.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace mcprunner
{

/// @brief Session orchestration section.
struct SessionConfig
{
    bool cacheEnabled = true;
    int cacheTtlSeconds = 300;
    bool autoCleanup = true;

    /// @brief READY sessions idle longer than this are stopped by the cleanup loop.
    int idleTimeoutSeconds = 600;
    int cleanupIntervalSeconds = 60;
    int failedGraceSeconds = 30;

    int handshakeTimeoutSeconds = 10;
    int callTimeoutSeconds = 60;
    int requestTimeoutSeconds = 30;

    /// @brief How long a server gets to exit after its stdin is closed.
    int terminateGraceMs = 2000;

    /// @brief Upper bound on request lines handled at the same time; further lines wait.
    int maxConcurrentRequests = 32;
};

/// @brief Logging section.
struct LogConfig
{
    std::string level = "INFO";
    std::string file;
};

/// @brief Node.js environment injected into every server process (npx-launched servers).
struct NodeConfig
{
    std::string npmConfigCache;
    std::string nodePath;
};

/// @brief Top-level runner configuration.
struct RunnerConfig
{
    SessionConfig session;
    LogConfig log;
    NodeConfig node;

    /// @brief Named server presets that requests may reference instead of a full config.
    std::map<std::string, ServerConfig> mcpServers;
};

/// @brief Looks up an environment variable by name.
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

/// @brief Returns a lookup backed by the process environment.
[[nodiscard]] auto processEnvironment() -> EnvLookup;

/// @brief Loads the configuration from the default config path, or defaults if there is none.
[[nodiscard]] auto loadConfig() -> Result<RunnerConfig>;

/// @brief Loads the configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or a ConfigError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<RunnerConfig>;

/// @brief Builds a configuration from a parsed JSON document.
[[nodiscard]] auto parseConfig(const nlohmann::json& root) -> Result<RunnerConfig>;

/// @brief Applies MCP_*, LOG_*, NPM_CONFIG_CACHE and NODE_PATH overrides.
/// @return Success or a ConfigError naming the offending variable.
[[nodiscard]] auto applyEnvironment(RunnerConfig& config, const EnvLookup& lookup) -> VoidResult;

/// @brief Checks value ranges.
[[nodiscard]] auto validateConfig(const RunnerConfig& config) -> VoidResult;

/// @brief Serializes the effective configuration (reported by the stats operation).
[[nodiscard]] auto toJson(const RunnerConfig& config) -> nlohmann::json;

/// @brief Derives the SessionManager options, including the Node.js environment overrides.
[[nodiscard]] auto sessionManagerOptions(const RunnerConfig& config) -> SessionManagerOptions;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the npm cache directory used when none is configured.
/// On Windows: %TEMP%\.npm, elsewhere /tmp/.npm
[[nodiscard]] auto defaultNpmCacheDir() -> std::string;

} // namespace mcprunner
