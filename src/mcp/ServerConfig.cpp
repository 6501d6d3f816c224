// SPDX-License-Identifier: Apache-2.0
#include "ServerConfig.hpp"

#include <format>

namespace mcprunner
{

auto toJson(const ServerConfig& config) -> nlohmann::json
{
    // nlohmann::json objects keep their keys sorted, so env ordering is canonical.
    return nlohmann::json {
        { "name", config.name },
        { "command", config.command },
        { "args", config.args },
        { "env", config.env },
    };
}

auto fingerprint(const ServerConfig& config) -> std::string
{
    return toJson(config).dump();
}

auto serverConfigFromJson(const nlohmann::json& obj) -> Result<ServerConfig>
{
    if (!obj.is_object())
        return makeError(ErrorCode::InvalidArgument, "Server config must be a JSON object");

    if (!obj.contains("command") || !obj["command"].is_string() || obj["command"].get<std::string>().empty())
        return makeError(ErrorCode::InvalidArgument, "Server config requires a non-empty 'command'");

    auto config = ServerConfig {};
    config.command = obj["command"].get<std::string>();
    config.name = config.command;

    if (obj.contains("name"))
    {
        if (!obj["name"].is_string())
            return makeError(ErrorCode::InvalidArgument, "Server config 'name' must be a string");
        config.name = obj["name"].get<std::string>();
    }

    if (obj.contains("args") && !obj["args"].is_null())
    {
        if (!obj["args"].is_array())
            return makeError(ErrorCode::InvalidArgument, "Server config 'args' must be an array");

        for (const auto& arg: obj["args"])
        {
            if (!arg.is_string())
                return makeError(ErrorCode::InvalidArgument,
                                 std::format("Server config argument is not a string: {}", arg.dump()));
            config.args.push_back(arg.get<std::string>());
        }
    }

    if (obj.contains("env") && !obj["env"].is_null())
    {
        if (!obj["env"].is_object())
            return makeError(ErrorCode::InvalidArgument, "Server config 'env' must be an object");

        for (const auto& [key, value]: obj["env"].items())
        {
            if (!value.is_string())
                return makeError(ErrorCode::InvalidArgument,
                                 std::format("Environment variable '{}' must be a string", key));
            config.env[key] = value.get<std::string>();
        }
    }

    return config;
}

} // namespace mcprunner
