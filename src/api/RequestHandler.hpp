// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcprunner/Config.hpp>
#include <session/SessionManager.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace mcprunner
{

constexpr auto RunnerVersion = std::string_view { "1.0.0" };

/// @brief Formats a duration as H:MM:SS.
[[nodiscard]] auto formatUptime(std::chrono::seconds uptime) -> std::string;

/// @brief Renders an error as {"status": "error", "error", "error_code", "details"?}.
[[nodiscard]] auto errorResponse(const Error& error) -> nlohmann::json;

/// @brief Maps JSON requests onto SessionManager operations.
///
/// A request is an object with an "operation" member, one of "discover", "execute", "stop",
/// "status", "active-sessions", "health" or "stats", plus the operation's arguments in
/// snake_case. A "request_id" member is copied to the response unchanged.
class RequestHandler
{
  public:
    RequestHandler(SessionManager& manager, RunnerConfig config, TimeSource now = systemTimeSource());

    /// @brief Handles one request. Never fails; errors are rendered into the response.
    [[nodiscard]] auto handle(const nlohmann::json& request) -> nlohmann::json;

    /// @brief Parses and handles one line of input.
    [[nodiscard]] auto handleLine(std::string_view line) -> nlohmann::json;

  private:
    [[nodiscard]] auto dispatch(std::string_view operation, const nlohmann::json& request) -> Result<nlohmann::json>;

    [[nodiscard]] auto discover(const nlohmann::json& request) -> Result<nlohmann::json>;
    [[nodiscard]] auto execute(const nlohmann::json& request) -> Result<nlohmann::json>;
    [[nodiscard]] auto stop(const nlohmann::json& request) -> Result<nlohmann::json>;
    [[nodiscard]] auto status(const nlohmann::json& request) -> Result<nlohmann::json>;
    [[nodiscard]] auto activeSessions() -> nlohmann::json;
    [[nodiscard]] auto health() -> nlohmann::json;
    [[nodiscard]] auto stats() -> nlohmann::json;

    /// @brief Resolves "mcp_config" (inline) or "server" (preset name).
    [[nodiscard]] auto resolveServerConfig(const nlohmann::json& request) const -> Result<std::optional<ServerConfig>>;
    [[nodiscard]] auto uptime() const -> std::chrono::seconds;

    SessionManager& _manager;
    RunnerConfig _config;
    TimeSource _now;
    Clock::time_point _startedAt;
};

} // namespace mcprunner
