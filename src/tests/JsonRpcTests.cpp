// SPDX-License-Identifier: Apache-2.0
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcprunner;

TEST_CASE("makeRequest creates valid JSON-RPC 2.0 request", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest(1, "tools/list");

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 1);
    CHECK(request["method"] == "tools/list");
    CHECK(!request.contains("params"));
}

TEST_CASE("makeRequest includes params when provided", "[jsonrpc]")
{
    auto params = nlohmann::json { { "cursor", "abc" } };
    auto request = jsonrpc::makeRequest(42, "tools/list", params);

    CHECK(request["id"] == 42);
    REQUIRE(request.contains("params"));
    CHECK(request["params"]["cursor"] == "abc");
}

TEST_CASE("makeNotification creates valid notification (no id)", "[jsonrpc]")
{
    auto notif = jsonrpc::makeNotification("notifications/initialized");

    CHECK(notif["jsonrpc"] == "2.0");
    CHECK(!notif.contains("id"));
    CHECK(notif["method"] == "notifications/initialized");
}

TEST_CASE("makeResult and makeErrorResponse echo the peer's id", "[jsonrpc]")
{
    auto const result = jsonrpc::makeResult("srv-7", nlohmann::json::object());
    CHECK(result["id"] == "srv-7");
    CHECK(result["result"].is_object());

    auto const error = jsonrpc::makeErrorResponse(
        3, jsonrpc::RpcError { .code = jsonrpc::codes::MethodNotFound, .message = "Method not found" });
    CHECK(error["id"] == 3);
    CHECK(error["error"]["code"] == -32601);
    CHECK(error["error"]["message"] == "Method not found");
    CHECK(!error["error"].contains("data"));
}

TEST_CASE("parseMessage handles success response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result", { { "status", "ok" } } },
    };

    auto result = jsonrpc::parseMessage(msg);
    REQUIRE(result.has_value());
    CHECK(result->kind == jsonrpc::MessageKind::Response);
    CHECK(result->isSuccess());
    CHECK(result->integerId() == 1);
    CHECK(result->result->at("status") == "ok");
    CHECK(!result->error.has_value());
}

TEST_CASE("parseMessage handles error response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "error",
          {
              { "code", -32602 },
              { "message", "Invalid params" },
              { "data", { { "field", "path" } } },
          } },
    };

    auto result = jsonrpc::parseMessage(msg);
    REQUIRE(result.has_value());
    CHECK(!result->isSuccess());
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == jsonrpc::codes::InvalidParams);
    CHECK(result->error->message == "Invalid params");
    CHECK(result->error->data["field"] == "path");
}

TEST_CASE("parseMessage tolerates error objects with odd member types", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 5 },
        { "error", { { "code", "not-a-number" } } },
    };

    auto result = jsonrpc::parseMessage(msg);
    REQUIRE(result.has_value());
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == 0);
    CHECK(result->error->message == "Unknown error");
}

TEST_CASE("parseMessage classifies requests and notifications", "[jsonrpc]")
{
    auto ping = jsonrpc::parseMessage(nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", "srv-1" },
        { "method", "ping" },
    });
    REQUIRE(ping.has_value());
    CHECK(ping->kind == jsonrpc::MessageKind::Request);
    CHECK(ping->method == "ping");
    CHECK(ping->id == "srv-1");
    CHECK(!ping->integerId().has_value());

    auto progress = jsonrpc::parseMessage(nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", "notifications/progress" },
        { "params", { { "progress", 50 } } },
    });
    REQUIRE(progress.has_value());
    CHECK(progress->kind == jsonrpc::MessageKind::Notification);
    CHECK(progress->params["progress"] == 50);
}

TEST_CASE("parseMessage rejects non-JSON-RPC messages", "[jsonrpc]")
{
    auto result = jsonrpc::parseMessage(nlohmann::json { { "version", "1.0" } });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);

    auto array = jsonrpc::parseMessage(nlohmann::json::array({ 1, 2 }));
    REQUIRE(!array.has_value());
    CHECK(array.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("parseMessage rejects response without result or error", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
    };

    auto result = jsonrpc::parseMessage(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("parseMessage rejects response without id", "[jsonrpc]")
{
    auto result = jsonrpc::parseMessage(nlohmann::json { { "jsonrpc", "2.0" }, { "result", 1 } });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}
