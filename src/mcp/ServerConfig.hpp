// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace mcprunner
{

/// @brief Launch configuration of a single MCP server.
struct ServerConfig
{
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    auto operator==(const ServerConfig&) const -> bool = default;
};

/// @brief Returns the canonical serialization of a config (name, command, args, sorted env).
///
/// Two configs with equal fingerprints are interchangeable for tool caching.
[[nodiscard]] auto fingerprint(const ServerConfig& config) -> std::string;

/// @brief Serializes a config as {"name", "command", "args", "env"}.
[[nodiscard]] auto toJson(const ServerConfig& config) -> nlohmann::json;

/// @brief Parses and validates a config object.
///
/// "command" is required and must be a non-empty string; "name" defaults to the command.
/// "args" must be an array of strings and "env" an object of strings when present.
/// @return The config or an InvalidArgument error.
[[nodiscard]] auto serverConfigFromJson(const nlohmann::json& obj) -> Result<ServerConfig>;

} // namespace mcprunner
