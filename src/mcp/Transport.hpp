// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

namespace mcprunner
{

/// @brief Abstract interface for MCP transport communication.
///
/// send() may be called from several threads; implementations serialize writes.
/// receive() is called from a single reader thread and must return once close() was called.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Sends a JSON message to the server.
    /// @param message The JSON message to send.
    /// @return Success or an error.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Receives the next JSON message from the server (blocking).
    /// @return The received message, ConnectionClosed once the stream ended or the transport
    ///         was closed, or ProtocolError if a frame could not be parsed.
    [[nodiscard]] virtual auto receive() -> Result<nlohmann::json> = 0;

    /// @brief Closes the transport connection and releases the peer.
    virtual void close() = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace mcprunner
