// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include "JsonUtils.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mcprunner
{

/// @brief Monotonic clock used for activity tracking, TTLs and deadlines.
using Clock = std::chrono::steady_clock;

/// @brief Injectable time source, so that TTL and idle logic can be driven by tests.
using TimeSource = std::function<Clock::time_point()>;

/// @brief Returns the default time source backed by Clock::now().
[[nodiscard]] inline auto systemTimeSource() -> TimeSource
{
    return [] { return Clock::now(); };
}

/// @brief A tool as reported by an MCP server during discovery.
struct ToolDescriptor
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema = nlohmann::json::object();

    auto operator==(const ToolDescriptor&) const -> bool = default;
};

/// @brief The payload returned by a tools/call request.
struct ToolResult
{
    /// Content items exactly as reported by the server (text, image, resource, ...).
    nlohmann::json content = nlohmann::json::array();
    std::optional<nlohmann::json> structuredContent;

    /// @brief Concatenates all text content items, separated by newlines.
    [[nodiscard]] auto text() const -> std::string
    {
        auto out = std::string {};
        if (!content.is_array())
            return out;
        for (const auto& item: content)
        {
            auto value = json::get<std::string>(item, "text");
            if (json::getOr<std::string>(item, "type", "") != "text" || !value)
                continue;
            if (!out.empty())
                out += "\n";
            out += *value;
        }
        return out;
    }
};

/// @brief Name and version reported by an MCP server in its initialize response.
struct ServerInfo
{
    std::string name = "unknown";
    std::string version = "unknown";
};

/// @brief MCP server capabilities reported during initialization.
struct ServerCapabilities
{
    std::string protocolVersion;
    ServerInfo serverInfo;
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
    std::string instructions;
};

} // namespace mcprunner
