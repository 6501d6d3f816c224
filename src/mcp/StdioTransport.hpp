// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Process.hpp>
#include <mcp/ServerConfig.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <memory>

namespace mcprunner
{

/// @brief Options for spawning and tearing down the server process behind a StdioTransport.
struct StdioTransportOptions
{
    LaunchOptions launch;

    /// How long close() waits for the server to exit after closing its stdin.
    std::chrono::milliseconds terminateGrace { 2000 };
};

/// @brief Transport that communicates with an MCP server via stdio pipes.
///
/// Spawns a child process and exchanges newline-delimited JSON messages over its
/// stdin/stdout. Partial reads are buffered until a full line is available.
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Starts the MCP server process.
    /// @param config The server configuration.
    /// @param options Launch and teardown options.
    /// @return Success or a LaunchError.
    [[nodiscard]] auto start(const ServerConfig& config, const StdioTransportOptions& options = {}) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive() -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcprunner
