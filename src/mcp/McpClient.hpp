// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Transport.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace mcprunner
{

/// @brief Protocol revisions this client can talk.
constexpr auto SupportedProtocolVersions = std::array<std::string_view, 3> {
    "2025-06-18",
    "2025-03-26",
    "2024-11-05",
};

/// @brief Tunables of an McpClient.
struct McpClientOptions
{
    std::chrono::milliseconds handshakeTimeout { 10'000 };
    std::chrono::milliseconds requestTimeout { 30'000 };
    std::chrono::milliseconds callTimeout { 60'000 };
    std::string clientName = "mcprunner";
    std::string clientVersion = "1.0.0";
};

/// @brief Receives server notifications (messages without an id).
using NotificationHandler = std::function<void(std::string_view method, const nlohmann::json& params)>;

/// @brief Client for the Model Context Protocol (MCP).
///
/// Owns a Transport and a reader thread that demultiplexes responses by request id,
/// so that several threads may have requests in flight at the same time. Responses
/// may arrive in any order. A frame that cannot be parsed fails the whole connection.
class McpClient
{
  public:
    /// @brief Constructs an McpClient and starts reading from the given transport.
    /// @param transport The transport to use for communication.
    /// @param options Timeouts and client identity.
    explicit McpClient(std::unique_ptr<Transport> transport, McpClientOptions options = {});
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Performs the MCP initialize handshake.
    /// @return The server's capabilities or a HandshakeError.
    [[nodiscard]] auto initialize() -> Result<ServerCapabilities>;

    /// @brief Lists available tools from the server, following pagination cursors.
    /// @return A vector of tool descriptors or an error.
    [[nodiscard]] auto listTools() -> Result<std::vector<ToolDescriptor>>;

    /// @brief Calls a tool on the server.
    /// @param name The tool name.
    /// @param arguments The tool arguments.
    /// @param timeout Overrides the configured call timeout.
    /// @return The tool result, ToolExecutionError if the server reported a failure, or TimeoutError.
    [[nodiscard]] auto callTool(std::string_view name,
                                const nlohmann::json& arguments,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<ToolResult>;

    /// @brief Installs a handler for server notifications. Must be set before initialize().
    void setNotificationHandler(NotificationHandler handler);

    /// @brief Closes the transport; requests still in flight fail with ConnectionClosed.
    void close();

    /// @brief Returns true if the client has been initialized.
    [[nodiscard]] auto isInitialized() const -> bool;

    /// @brief Returns the error that broke the connection, if any.
    [[nodiscard]] auto failure() const -> std::optional<Error>;

    /// @brief Returns the number of requests awaiting a response.
    [[nodiscard]] auto pendingCount() const -> size_t;

  private:
    using PendingPromise = std::promise<Result<jsonrpc::Message>>;

    std::unique_ptr<Transport> _transport;
    McpClientOptions _options;
    NotificationHandler _notificationHandler;
    std::atomic<int64_t> _nextId = 1;
    std::atomic<bool> _initialized = false;

    mutable std::mutex _mutex;
    std::map<int64_t, PendingPromise> _pending;
    std::optional<Error> _failure;
    bool _closed = false;

    std::jthread _reader;

    [[nodiscard]] auto sendRequest(std::string_view method,
                                   nlohmann::json params,
                                   std::chrono::milliseconds timeout) -> Result<jsonrpc::Message>;

    void readLoop(const std::stop_token& stopToken);
    void dispatch(jsonrpc::Message message);
    void failPending(const Error& error, bool markFailed);
};

} // namespace mcprunner
