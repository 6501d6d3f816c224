// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/McpClient.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcprunner::test
{

/// @brief Scripted in-process MCP server.
///
/// Requests the client sends are answered synchronously from send(), so replies are queued
/// before the client starts waiting. tools/call requests may be held back and answered later,
/// in any order, to exercise response demultiplexing.
struct FakeServer
{
    using CallHandler = std::function<std::optional<nlohmann::json>(const nlohmann::json& request)>;

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Result<nlohmann::json>> inbox;
    std::vector<nlohmann::json> received;
    bool closed = false;
    bool hungUp = false;

    std::string protocolVersion = "2024-11-05";
    std::string name = "fake-server";
    nlohmann::json capabilities = { { "tools", nlohmann::json::object() } };
    std::string instructions;
    bool answerInitialize = true;
    nlohmann::json tools = nlohmann::json::array({
        { { "name", "read_file" },
          { "description", "Read a file" },
          { "inputSchema", { { "type", "object" } } } },
        { { "name", "write_file" },
          { "description", "Write a file" },
          { "inputSchema", { { "type", "object" } } } },
    });
    size_t pageSize = 0;
    int toolsListCalls = 0;
    bool holdCalls = false;
    std::vector<nlohmann::json> heldCalls;
    CallHandler callHandler;

    /// @brief Queues a frame for the client.
    void push(nlohmann::json message)
    {
        auto lock = std::lock_guard(mutex);
        inbox.emplace_back(std::move(message));
        cv.notify_all();
    }

    /// @brief Queues a frame the transport could not parse.
    void pushMalformed()
    {
        auto lock = std::lock_guard(mutex);
        inbox.emplace_back(makeError(ErrorCode::ProtocolError, "JSON parse error: unexpected 'x'"));
        cv.notify_all();
    }

    /// @brief Simulates the server process exiting.
    void hangUp()
    {
        auto lock = std::lock_guard(mutex);
        hungUp = true;
        cv.notify_all();
    }

    /// @brief Answers a held tools/call request.
    void answer(const nlohmann::json& request, nlohmann::json result)
    {
        push(jsonrpc::makeResult(request["id"], std::move(result)));
    }

    /// @brief Waits until @p count tools/call requests are held.
    auto waitForHeldCalls(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds { 5 }) -> bool
    {
        auto lock = std::unique_lock(mutex);
        return cv.wait_for(lock, timeout, [&] { return heldCalls.size() >= count; });
    }

    /// @brief Waits until @p predicate holds; it is evaluated with the mutex held.
    auto waitUntil(const std::function<bool()>& predicate,
                   std::chrono::milliseconds timeout = std::chrono::seconds { 5 }) -> bool
    {
        auto lock = std::unique_lock(mutex);
        return cv.wait_for(lock, timeout, predicate);
    }

    auto takeHeldCalls() -> std::vector<nlohmann::json>
    {
        auto lock = std::lock_guard(mutex);
        return std::exchange(heldCalls, {});
    }

    auto countReceived(std::string_view method) -> size_t
    {
        auto lock = std::lock_guard(mutex);
        return static_cast<size_t>(std::ranges::count_if(received, [&](const nlohmann::json& message) {
            return message.is_object() && message.value("method", "") == method;
        }));
    }

    auto lastReceived() -> nlohmann::json
    {
        auto lock = std::lock_guard(mutex);
        return received.empty() ? nlohmann::json {} : received.back();
    }

    auto isClosed() -> bool
    {
        auto lock = std::lock_guard(mutex);
        return closed;
    }

    static auto textContent(std::string_view text) -> nlohmann::json
    {
        return nlohmann::json::array({ { { "type", "text" }, { "text", text } } });
    }

    // Called with mutex held.
    void handleRequest(const nlohmann::json& request)
    {
        auto const method = request.value("method", "");
        auto const& id = request["id"];

        if (method == "initialize")
        {
            if (!answerInitialize)
                return;
            auto result = nlohmann::json {
                { "protocolVersion", protocolVersion },
                { "capabilities", capabilities },
                { "serverInfo", { { "name", name }, { "version", "0.1.0" } } },
            };
            if (!instructions.empty())
                result["instructions"] = instructions;
            inbox.emplace_back(jsonrpc::makeResult(id, std::move(result)));
        }
        else if (method == "tools/list")
        {
            ++toolsListCalls;
            auto start = size_t { 0 };
            if (request.contains("params") && request["params"].is_object() && request["params"].contains("cursor"))
                start = std::stoul(request["params"]["cursor"].get<std::string>());

            auto const end = pageSize == 0 ? tools.size() : std::min(tools.size(), start + pageSize);
            auto page = nlohmann::json::array();
            for (auto i = start; i < end; ++i)
                page.push_back(tools[i]);

            auto result = nlohmann::json { { "tools", std::move(page) } };
            if (end < tools.size())
                result["nextCursor"] = std::to_string(end);
            inbox.emplace_back(jsonrpc::makeResult(id, std::move(result)));
        }
        else if (method == "tools/call")
        {
            if (holdCalls)
            {
                heldCalls.push_back(request);
                return;
            }
            auto result = callHandler ? callHandler(request) : defaultCall(request["params"]);
            if (result)
                inbox.emplace_back(jsonrpc::makeResult(id, std::move(*result)));
            else
                heldCalls.push_back(request);
        }
        else
        {
            inbox.emplace_back(jsonrpc::makeErrorResponse(
                id, jsonrpc::RpcError { .code = jsonrpc::codes::MethodNotFound, .message = "Method not found" }));
        }
    }

    /// @brief read_file succeeds for "/exists" and reports isError otherwise; echo returns its arguments.
    static auto defaultCall(const nlohmann::json& params) -> std::optional<nlohmann::json>
    {
        auto const tool = params.value("name", "");
        auto const& arguments = params["arguments"];
        if (tool == "read_file")
        {
            if (arguments.value("path", "") == "/exists")
                return nlohmann::json { { "content", textContent("hello world") } };
            return nlohmann::json { { "content", textContent("ENOENT: no such file") }, { "isError", true } };
        }
        if (tool == "echo")
            return nlohmann::json { { "content", textContent(arguments.dump()) } };
        return nlohmann::json { { "content", textContent("unknown tool") }, { "isError", true } };
    }
};

/// @brief Transport that talks to a FakeServer.
class FakeTransport: public Transport
{
  public:
    explicit FakeTransport(std::shared_ptr<FakeServer> server): _server(std::move(server)) {}

    auto send(const nlohmann::json& message) -> VoidResult override
    {
        auto lock = std::lock_guard(_server->mutex);
        if (_server->closed || _server->hungUp)
            return makeError(ErrorCode::ConnectionClosed, "Transport closed");

        _server->received.push_back(message);
        if (message.contains("method") && message.contains("id"))
            _server->handleRequest(message);
        _server->cv.notify_all();
        return {};
    }

    auto receive() -> Result<nlohmann::json> override
    {
        auto lock = std::unique_lock(_server->mutex);
        _server->cv.wait(lock, [this] { return !_server->inbox.empty() || _server->closed || _server->hungUp; });
        if (_server->closed)
            return makeError(ErrorCode::ConnectionClosed, "Transport closed");
        if (!_server->inbox.empty())
        {
            auto frame = std::move(_server->inbox.front());
            _server->inbox.pop_front();
            return frame;
        }
        return makeError(ErrorCode::ConnectionClosed, "Server exited");
    }

    void close() override
    {
        auto lock = std::lock_guard(_server->mutex);
        _server->closed = true;
        _server->cv.notify_all();
    }

    [[nodiscard]] auto isConnected() const -> bool override
    {
        auto lock = std::lock_guard(_server->mutex);
        return !_server->closed && !_server->hungUp;
    }

  private:
    std::shared_ptr<FakeServer> _server;
};

/// @brief Creates a client connected to @p server.
inline auto makeFakeClient(std::shared_ptr<FakeServer> server, McpClientOptions options = {})
    -> std::unique_ptr<McpClient>
{
    return std::make_unique<McpClient>(std::make_unique<FakeTransport>(std::move(server)), std::move(options));
}

} // namespace mcprunner::test
