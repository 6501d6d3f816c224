// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace mcprunner::jsonrpc
{

auto RpcError::toJson() const -> nlohmann::json
{
    auto obj = nlohmann::json {
        { "code", code },
        { "message", message },
    };
    if (!data.is_null())
        obj["data"] = data;
    return obj;
}

auto Message::integerId() const -> std::optional<int64_t>
{
    if (id.is_number_integer())
        return id.get<int64_t>();
    return std::nullopt;
}

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(const nlohmann::json& id, const RpcError& error) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", error.toJson() },
    };
}

auto parseMessage(const nlohmann::json& message) -> Result<Message>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto parsed = Message {};

    if (message.contains("id"))
        parsed.id = message["id"];

    if (message.contains("method"))
    {
        if (!message["method"].is_string())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC method must be a string");

        parsed.method = message["method"].get<std::string>();
        parsed.params = message.value("params", nlohmann::json::object());
        parsed.kind = parsed.id.is_null() ? MessageKind::Notification : MessageKind::Request;
        return parsed;
    }

    if (parsed.id.is_null())
        return makeError(ErrorCode::ProtocolError, "JSON-RPC response without id");

    if (message.contains("result"))
    {
        parsed.result = message["result"];
    }
    else if (message.contains("error") && message["error"].is_object())
    {
        auto const& err = message["error"];
        parsed.error = RpcError {
            .code = json::getOr<int>(err, "code", 0),
            .message = json::getOr<std::string>(err, "message", "Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }
    else
    {
        return makeError(ErrorCode::ProtocolError,
                         std::format("JSON-RPC message has neither result, error, nor method: {}",
                                     message.dump()));
    }

    return parsed;
}

} // namespace mcprunner::jsonrpc
