// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace mcprunner
{

namespace
{
    /// Upper bound on tools/list pages, guarding against servers that repeat cursors.
    constexpr auto MaxToolPages = 256;

    auto isSupportedVersion(std::string_view version) -> bool
    {
        return std::ranges::find(SupportedProtocolVersions, version) != SupportedProtocolVersions.end();
    }

    auto handshakeError(const Error& cause) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::HandshakeError,
                         std::format("MCP handshake failed: {}", cause.message),
                         { { "cause", std::string(errorCodeName(cause.code)) } });
    }

    auto parseTool(const nlohmann::json& toolJson) -> Result<ToolDescriptor>
    {
        auto name = json::get<std::string>(toolJson, "name");
        if (!name)
            return makeError(ErrorCode::ProtocolError, "tools/list returned a tool without a name", toolJson);

        auto tool = ToolDescriptor {
            .name = std::move(*name),
            .description = json::getOr<std::string>(toolJson, "description", ""),
        };
        if (toolJson.contains("inputSchema") && toolJson["inputSchema"].is_object())
            tool.inputSchema = toolJson["inputSchema"];
        return tool;
    }

    /// Every content item needs a string type, and text items a string text.
    auto checkContentItems(const nlohmann::json& content) -> VoidResult
    {
        for (const auto& item: content)
        {
            auto type = json::get<std::string>(item, "type");
            if (!type)
                return makeError(ErrorCode::ProtocolError, "tools/call content item without a type", item);
            if (*type == "text" && !json::get<std::string>(item, "text"))
                return makeError(ErrorCode::ProtocolError, "tools/call text item without a text string", item);
        }
        return {};
    }
} // namespace

McpClient::McpClient(std::unique_ptr<Transport> transport, McpClientOptions options):
    _transport(std::move(transport)), _options(std::move(options))
{
    _reader = std::jthread([this](std::stop_token stopToken) { readLoop(stopToken); });
}

McpClient::~McpClient()
{
    close();
}

auto McpClient::initialize() -> Result<ServerCapabilities>
{
    auto params = nlohmann::json {
        { "protocolVersion", std::string(SupportedProtocolVersions.front()) },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", _options.clientName },
              { "version", _options.clientVersion },
          } },
    };

    auto response = sendRequest("initialize", std::move(params), _options.handshakeTimeout);
    if (!response)
        return handshakeError(response.error());

    if (response->error)
    {
        return makeError(ErrorCode::HandshakeError,
                         std::format("Server rejected initialize: {}", response->error->message),
                         response->error->toJson());
    }

    auto const& result = *response->result;
    if (!result.is_object())
        return makeError(ErrorCode::HandshakeError, "Malformed initialize response", result);

    auto version = json::get<std::string>(result, "protocolVersion");
    if (!version)
        return makeError(ErrorCode::HandshakeError, "initialize response lacks protocolVersion", result);
    if (!isSupportedVersion(*version))
    {
        return makeError(ErrorCode::HandshakeError,
                         std::format("Unsupported protocol version: {}", *version),
                         { { "protocolVersion", *version } });
    }

    auto capabilities = ServerCapabilities {};
    capabilities.protocolVersion = std::move(*version);
    if (result.contains("serverInfo"))
    {
        auto const& info = result["serverInfo"];
        capabilities.serverInfo.name = json::getOr<std::string>(info, "name", "unknown");
        capabilities.serverInfo.version = json::getOr<std::string>(info, "version", "unknown");
    }
    if (result.contains("capabilities") && result["capabilities"].is_object())
    {
        auto const& caps = result["capabilities"];
        capabilities.hasTools = caps.contains("tools");
        capabilities.hasResources = caps.contains("resources");
        capabilities.hasPrompts = caps.contains("prompts");
    }
    capabilities.instructions = json::getOr<std::string>(result, "instructions", "");

    if (auto sent = _transport->send(jsonrpc::makeNotification("notifications/initialized")); !sent)
        return handshakeError(sent.error());

    _initialized = true;
    log::info("MCP server initialized: {} v{} (protocol {})",
              capabilities.serverInfo.name,
              capabilities.serverInfo.version,
              capabilities.protocolVersion);

    return capabilities;
}

auto McpClient::listTools() -> Result<std::vector<ToolDescriptor>>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto tools = std::vector<ToolDescriptor> {};
    auto cursor = std::optional<std::string> {};

    for (auto page = 0; page < MaxToolPages; ++page)
    {
        auto params = cursor ? nlohmann::json { { "cursor", *cursor } } : nlohmann::json(nullptr);
        auto response = sendRequest("tools/list", std::move(params), _options.requestTimeout);
        if (!response)
            return std::unexpected(response.error());

        if (response->error)
        {
            return makeError(ErrorCode::ProtocolError,
                             std::format("tools/list failed: {}", response->error->message),
                             response->error->toJson());
        }

        auto const& result = *response->result;
        if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array())
            return makeError(ErrorCode::ProtocolError, "Malformed tools/list response", result);

        for (const auto& toolJson: result["tools"])
        {
            auto tool = parseTool(toolJson);
            if (!tool)
                return std::unexpected(tool.error());
            tools.push_back(std::move(*tool));
        }

        auto next = json::getOr<std::string>(result, "nextCursor", "");
        if (next.empty() || next == cursor)
            return tools;
        cursor = std::move(next);
    }

    log::warning("tools/list pagination stopped after {} pages", MaxToolPages);
    return tools;
}

auto McpClient::callTool(std::string_view name,
                         const nlohmann::json& arguments,
                         std::optional<std::chrono::milliseconds> timeout) -> Result<ToolResult>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    auto response = sendRequest("tools/call", std::move(params), timeout.value_or(_options.callTimeout));
    if (!response)
        return std::unexpected(response.error());

    if (response->error)
    {
        return makeError(ErrorCode::ToolExecutionError,
                         std::format("Tool '{}' failed: {}", name, response->error->message),
                         response->error->toJson());
    }

    auto const& result = *response->result;
    if (!result.is_object())
        return makeError(ErrorCode::ProtocolError, "Malformed tools/call response", result);

    auto toolResult = ToolResult {};
    if (result.contains("content"))
    {
        if (!result["content"].is_array())
            return makeError(ErrorCode::ProtocolError, "tools/call content is not an array", result);
        if (auto checked = checkContentItems(result["content"]); !checked)
            return std::unexpected(checked.error());
        toolResult.content = result["content"];
    }
    if (result.contains("structuredContent"))
        toolResult.structuredContent = result["structuredContent"];

    if (json::getOr<bool>(result, "isError", false))
    {
        auto text = toolResult.text();
        return makeError(ErrorCode::ToolExecutionError,
                         std::format("Tool '{}' reported an error: {}", name, text.empty() ? "(no message)" : text),
                         toolResult.content);
    }

    log::debug("Tool '{}' returned {} content item(s)", name, toolResult.content.size());
    return toolResult;
}

void McpClient::setNotificationHandler(NotificationHandler handler)
{
    _notificationHandler = std::move(handler);
}

void McpClient::close()
{
    {
        auto lock = std::scoped_lock(_mutex);
        if (_closed)
            return;
        _closed = true;
    }

    failPending(Error { .code = ErrorCode::ConnectionClosed, .message = "Connection closed" }, false);

    _reader.request_stop();
    _transport->close();
    if (_reader.joinable())
        _reader.join();
}

auto McpClient::isInitialized() const -> bool
{
    return _initialized;
}

auto McpClient::failure() const -> std::optional<Error>
{
    auto lock = std::scoped_lock(_mutex);
    return _failure;
}

auto McpClient::pendingCount() const -> size_t
{
    auto lock = std::scoped_lock(_mutex);
    return _pending.size();
}

auto McpClient::sendRequest(std::string_view method, nlohmann::json params, std::chrono::milliseconds timeout)
    -> Result<jsonrpc::Message>
{
    auto const id = _nextId++;
    auto future = std::future<Result<jsonrpc::Message>> {};
    {
        auto lock = std::scoped_lock(_mutex);
        if (_failure)
            return std::unexpected(*_failure);
        if (_closed)
            return makeError(ErrorCode::ConnectionClosed, "Connection closed");
        future = _pending[id].get_future();
    }

    if (auto sent = _transport->send(jsonrpc::makeRequest(id, method, std::move(params))); !sent)
    {
        auto lock = std::scoped_lock(_mutex);
        // The reader may already have failed this request; prefer its verdict.
        if (_pending.erase(id) == 0)
            return future.get();
        return std::unexpected(sent.error());
    }

    if (future.wait_for(timeout) == std::future_status::timeout)
    {
        auto lock = std::scoped_lock(_mutex);
        if (_pending.erase(id) != 0)
        {
            log::warning("Request '{}' (id {}) timed out after {}", method, id, timeout);
            return makeError(ErrorCode::TimeoutError,
                             std::format("Request '{}' timed out after {}", method, timeout),
                             { { "method", std::string(method) }, { "timeoutMs", timeout.count() } });
        }
        // Completed between the timeout and taking the lock.
    }

    return future.get();
}

void McpClient::readLoop(const std::stop_token& stopToken)
{
    while (!stopToken.stop_requested())
    {
        auto frame = _transport->receive();
        if (!frame)
        {
            if (stopToken.stop_requested())
                return;

            auto const& error = frame.error();
            if (error.code == ErrorCode::ProtocolError)
            {
                log::error("Malformed frame from MCP server: {}", error.message);
                failPending(Error { .code = ErrorCode::ProtocolError,
                                    .message = std::format("Malformed message from server: {}", error.message) },
                            true);
            }
            else
            {
                log::debug("MCP connection ended: {}", error);
                failPending(Error { .code = ErrorCode::ConnectionClosed,
                                    .message = std::format("Server connection lost: {}", error.message) },
                            true);
            }
            return;
        }

        auto message = jsonrpc::parseMessage(*frame);
        if (!message)
        {
            log::error("Invalid JSON-RPC message from MCP server: {}", message.error().message);
            failPending(Error { .code = ErrorCode::ProtocolError,
                                .message = message.error().message,
                                .details = *frame },
                        true);
            return;
        }

        dispatch(std::move(*message));
    }
}

void McpClient::dispatch(jsonrpc::Message message)
{
    switch (message.kind)
    {
        case jsonrpc::MessageKind::Response: {
            auto const id = message.integerId();
            auto promise = std::optional<PendingPromise> {};
            if (id)
            {
                auto lock = std::scoped_lock(_mutex);
                if (auto it = _pending.find(*id); it != _pending.end())
                {
                    promise = std::move(it->second);
                    _pending.erase(it);
                }
            }
            if (!promise)
            {
                log::debug("Dropping response for unknown request id {}", message.id.dump());
                return;
            }
            promise->set_value(std::move(message));
            return;
        }

        case jsonrpc::MessageKind::Request: {
            auto reply = message.method == "ping"
                             ? jsonrpc::makeResult(message.id, nlohmann::json::object())
                             : jsonrpc::makeErrorResponse(
                                   message.id,
                                   jsonrpc::RpcError {
                                       .code = jsonrpc::codes::MethodNotFound,
                                       .message = std::format("Method not supported: {}", message.method),
                                   });
            if (auto sent = _transport->send(reply); !sent)
                log::warning("Failed to answer server request '{}': {}", message.method, sent.error());
            return;
        }

        case jsonrpc::MessageKind::Notification:
            if (_notificationHandler)
                _notificationHandler(message.method, message.params);
            else
                log::debug("MCP notification: {}", message.method);
            return;
    }
}

void McpClient::failPending(const Error& error, bool markFailed)
{
    auto pending = std::map<int64_t, PendingPromise> {};
    {
        auto lock = std::scoped_lock(_mutex);
        if (markFailed && !_failure)
            _failure = error;
        pending.swap(_pending);
    }

    for (auto& [id, promise]: pending)
        promise.set_value(std::unexpected(error));
}

} // namespace mcprunner
