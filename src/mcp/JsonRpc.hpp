// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace mcprunner::jsonrpc
{

/// @brief Standard JSON-RPC 2.0 error codes.
namespace codes
{
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
} // namespace codes

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;

    /// @brief Returns the error as a JSON-RPC error object.
    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/// @brief The three shapes an incoming JSON-RPC message can take.
enum class MessageKind
{
    Response,     ///< Carries an id and either result or error.
    Request,      ///< Carries an id and a method (server-to-client request).
    Notification, ///< Carries a method but no id.
};

/// @brief Represents a parsed JSON-RPC 2.0 message.
struct Message
{
    MessageKind kind = MessageKind::Response;
    nlohmann::json id;
    std::string method;
    nlohmann::json params;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this is a response indicating success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }

    /// @brief Returns the id as integer if it is one.
    [[nodiscard]] auto integerId() const -> std::optional<int64_t>;
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a successful response to a request received from the peer.
[[nodiscard]] auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds an error response to a request received from the peer.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id, const RpcError& error) -> nlohmann::json;

/// @brief Parses and classifies a JSON-RPC 2.0 message.
/// @param message The JSON message to parse.
/// @return The parsed message or a ProtocolError.
[[nodiscard]] auto parseMessage(const nlohmann::json& message) -> Result<Message>;

} // namespace mcprunner::jsonrpc
