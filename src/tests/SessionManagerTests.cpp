// SPDX-License-Identifier: Apache-2.0
#include <session/SessionManager.hpp>

#include "FakeClock.hpp"
#include "FakeServer.hpp"
#include "LogCapture.hpp"

#include <catch2/catch_test_macros.hpp>

#include <future>
#include <mutex>
#include <thread>

using namespace mcprunner;
using namespace mcprunner::test;
using namespace std::chrono_literals;

namespace
{

auto filesystemServer(std::string root = "/tmp") -> ServerConfig
{
    return ServerConfig {
        .name = "filesystem",
        .command = "npx",
        .args = { "-y", "@modelcontextprotocol/server-filesystem", std::move(root) },
    };
}

void holdCalls(FakeServer& server, bool hold)
{
    auto lock = std::lock_guard(server.mutex);
    server.holdCalls = hold;
}

template <typename Predicate>
auto eventually(Predicate predicate, std::chrono::milliseconds timeout = 5s) -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate())
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

/// Session manager whose every launch connects to a fresh FakeServer.
struct Fixture
{
    FakeClock clock;
    std::mutex mutex;
    std::vector<std::shared_ptr<FakeServer>> servers;
    std::function<void(FakeServer&)> configure;
    std::optional<Error> launchError;
    size_t launchAttempts = 0;
    std::unique_ptr<SessionManager> manager;

    explicit Fixture(SessionManagerOptions options = {})
    {
        auto clientOptions = options.client;
        manager = std::make_unique<SessionManager>(
            std::move(options),
            [this, clientOptions](const ServerConfig&) -> Result<std::unique_ptr<McpClient>> {
                auto lock = std::lock_guard(mutex);
                ++launchAttempts;
                if (launchError)
                    return std::unexpected(*launchError);
                auto server = std::make_shared<FakeServer>();
                if (configure)
                    configure(*server);
                servers.push_back(server);
                return makeFakeClient(server, clientOptions);
            },
            clock.source());
    }

    auto server(size_t index = 0) -> std::shared_ptr<FakeServer>
    {
        auto lock = std::lock_guard(mutex);
        REQUIRE(index < servers.size());
        return servers[index];
    }

    auto launches() -> size_t
    {
        auto lock = std::lock_guard(mutex);
        return launchAttempts;
    }

    auto state(const std::string& sessionId) -> SessionState
    {
        auto status = manager->status(sessionId);
        REQUIRE(status.has_value());
        return status->state;
    }
};

} // namespace

TEST_CASE("SessionManager discover starts the server and returns its tools", "[session]")
{
    auto f = Fixture {};

    auto result = f.manager->discover("s1", filesystemServer(), DiscoverOptions { .agentId = "agent-7" });
    REQUIRE(result.has_value());
    CHECK(!result->fromCache);
    REQUIRE(result->tools.size() == 2);
    CHECK(result->tools[0].name == "read_file");
    CHECK(result->server.serverInfo.name == "fake-server");
    CHECK(result->server.protocolVersion == "2024-11-05");
    CHECK(result->server.hasTools);
    CHECK(f.launches() == 1);

    auto status = f.manager->status("s1");
    REQUIRE(status.has_value());
    CHECK(status->state == SessionState::Ready);
    CHECK(status->serverName == "filesystem");
    CHECK(status->agentId == "agent-7");
    CHECK(status->toolCount == 2);
    CHECK(status->fingerprint == fingerprint(filesystemServer()));
}

TEST_CASE("SessionManager serves repeated discovery from the cache", "[session]")
{
    auto f = Fixture {};

    auto first = f.manager->discover("s1", filesystemServer());
    REQUIRE(first.has_value());
    auto again = f.manager->discover("s1", filesystemServer());
    REQUIRE(again.has_value());
    CHECK(again->fromCache);
    CHECK(again->tools == first->tools);
    CHECK(f.server()->countReceived("tools/list") == 1);

    SECTION("bypassCache queries the server")
    {
        auto fresh = f.manager->discover("s1", filesystemServer(), DiscoverOptions { .bypassCache = true });
        REQUIRE(fresh.has_value());
        CHECK(!fresh->fromCache);
        CHECK(fresh->tools == first->tools);
        CHECK(f.server()->countReceived("tools/list") == 2);
    }

    SECTION("sessions with an identical config share the cache")
    {
        auto other = f.manager->discover("s2", filesystemServer());
        REQUIRE(other.has_value());
        CHECK(other->fromCache);
        CHECK(f.launches() == 2);
        CHECK(f.server(1)->countReceived("tools/list") == 0);
    }

    SECTION("entries expire after the TTL")
    {
        f.clock.advance(301s);
        auto expired = f.manager->discover("s1", filesystemServer());
        REQUIRE(expired.has_value());
        CHECK(!expired->fromCache);
        CHECK(f.server()->countReceived("tools/list") == 2);
    }
}

TEST_CASE("SessionManager with the cache disabled always queries the server", "[session]")
{
    auto f = Fixture(SessionManagerOptions { .cacheEnabled = false });

    REQUIRE(f.manager->discover("s1", filesystemServer()).has_value());
    auto again = f.manager->discover("s1", filesystemServer());
    REQUIRE(again.has_value());
    CHECK(!again->fromCache);
    CHECK(f.server()->countReceived("tools/list") == 2);
    CHECK(f.manager->stats().cacheEntries == 0);
}

TEST_CASE("SessionManager rejects a different config for a live session", "[session]")
{
    auto f = Fixture {};
    REQUIRE(f.manager->discover("s1", filesystemServer("/tmp")).has_value());

    auto mismatch = f.manager->discover("s1", filesystemServer("/var"));
    REQUIRE(!mismatch.has_value());
    CHECK(mismatch.error().code == ErrorCode::SessionConfigMismatch);
    CHECK(mismatch.error().details["sessionId"] == "s1");

    auto executeMismatch = f.manager->execute("s1", "read_file", { { "path", "/exists" } }, filesystemServer("/var"));
    REQUIRE(!executeMismatch.has_value());
    CHECK(executeMismatch.error().code == ErrorCode::SessionConfigMismatch);

    // Without a config the existing session is used as is.
    CHECK(f.manager->execute("s1", "read_file", { { "path", "/exists" } }).has_value());
    CHECK(f.launches() == 1);
}

TEST_CASE("SessionManager execute calls a tool on an existing session", "[session]")
{
    auto f = Fixture {};
    REQUIRE(f.manager->discover("s1", filesystemServer()).has_value());

    auto result = f.manager->execute("s1", "read_file", { { "path", "/exists" } });
    REQUIRE(result.has_value());
    CHECK(result->text() == "hello world");
    CHECK(f.state("s1") == SessionState::Ready);
}

TEST_CASE("SessionManager execute reports tool failures without failing the session", "[session]")
{
    auto f = Fixture {};
    REQUIRE(f.manager->discover("s1", filesystemServer()).has_value());

    auto result = f.manager->execute("s1", "read_file", { { "path", "/missing" } });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ToolExecutionError);
    CHECK(f.state("s1") == SessionState::Ready);
}

TEST_CASE("SessionManager execute forwards tools the last discovery did not report", "[session]")
{
    auto f = Fixture {};
    REQUIRE(f.manager->discover("s1", filesystemServer()).has_value());
    auto capture = LogCapture {};

    auto unknown = f.manager->execute("s1", "echo", { { "x", 1 } });
    REQUIRE(unknown.has_value());
    CHECK(unknown->text() == R"({"x":1})");
    CHECK(f.server()->countReceived("tools/call") == 1);
    CHECK(capture.contains("tool 'echo' was not reported by the last discovery"));

    auto known = f.manager->execute("s1", "read_file", { { "path", "/exists" } });
    REQUIRE(known.has_value());
    CHECK(f.server()->countReceived("tools/call") == 2);
    CHECK(!capture.contains("tool 'read_file' was not reported"));
}

TEST_CASE("SessionManager execute needs a config to create a session", "[session]")
{
    auto f = Fixture {};

    auto missing = f.manager->execute("s1", "read_file", { { "path", "/exists" } });
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::SessionNotFound);
    CHECK(f.launches() == 0);

    auto created = f.manager->execute("s1", "read_file", { { "path", "/exists" } }, filesystemServer());
    REQUIRE(created.has_value());
    CHECK(f.launches() == 1);
    CHECK(f.state("s1") == SessionState::Ready);
}

TEST_CASE("SessionManager execute keeps the session usable after a timeout", "[session]")
{
    auto f = Fixture {};
    REQUIRE(f.manager->discover("s1", filesystemServer()).has_value());
    holdCalls(*f.server(), true);

    auto result = f.manager->execute("s1", "echo", { { "n", 1 } }, std::nullopt, 50ms);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TimeoutError);

    holdCalls(*f.server(), false);
    CHECK(f.state("s1") == SessionState::Ready);
    CHECK(f.manager->execute("s1", "echo", { { "n", 2 } }).has_value());
}

TEST_CASE("SessionManager stop terminates the session", "[session]")
{
    auto f = Fixture {};
    REQUIRE(f.manager->discover("s1", filesystemServer(), DiscoverOptions { .agentId = "agent-7" }).has_value());

    REQUIRE(f.manager->stop("s1").has_value());
    CHECK(f.server()->isClosed());

    auto status = f.manager->status("s1");
    REQUIRE(status.has_value());
    CHECK(status->state == SessionState::Stopped);
    CHECK(status->agentId == "agent-7");
    CHECK(f.manager->listActive().empty());
    CHECK(f.manager->stats().stoppedSessions == 1);

    auto again = f.manager->stop("s1");
    REQUIRE(!again.has_value());
    CHECK(again.error().code == ErrorCode::SessionNotFound);

    auto execute = f.manager->execute("s1", "read_file", { { "path", "/exists" } });
    REQUIRE(!execute.has_value());
    CHECK(execute.error().code == ErrorCode::SessionNotFound);

    SECTION("the id can be reused with a fresh server")
    {
        auto restarted = f.manager->discover("s1", filesystemServer("/var"));
        REQUIRE(restarted.has_value());
        CHECK(f.launches() == 2);
        CHECK(f.state("s1") == SessionState::Ready);
        CHECK(f.manager->stats().stoppedSessions == 0);
    }
}

TEST_CASE("SessionManager stop of an unknown session is SessionNotFound", "[session]")
{
    auto f = Fixture {};
    auto result = f.manager->stop("nope");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::SessionNotFound);

    auto status = f.manager->status("nope");
    REQUIRE(!status.has_value());
    CHECK(status.error().code == ErrorCode::SessionNotFound);
}

TEST_CASE("SessionManager runs concurrent calls on one session", "[session]")
{
    auto f = Fixture {};
    REQUIRE(f.manager->discover("s1", filesystemServer()).has_value());
    auto server = f.server();
    holdCalls(*server, true);

    auto first = std::async(std::launch::async, [&] { return f.manager->execute("s1", "echo", { { "n", 1 } }); });
    auto second = std::async(std::launch::async, [&] { return f.manager->execute("s1", "echo", { { "n", 2 } }); });
    REQUIRE(server->waitForHeldCalls(2));

    auto busy = f.manager->status("s1");
    REQUIRE(busy.has_value());
    CHECK(busy->state == SessionState::Busy);
    CHECK(busy->inFlight == 2);

    // Busy sessions are never reclaimed.
    f.clock.advance(3600s);
    CHECK(f.manager->reclaimIdle() == 0);

    auto held = server->takeHeldCalls();
    for (auto it = held.rbegin(); it != held.rend(); ++it)
        server->answer(*it, { { "content", FakeServer::textContent((*it)["params"]["arguments"].dump()) } });

    auto firstResult = first.get();
    auto secondResult = second.get();
    REQUIRE(firstResult.has_value());
    REQUIRE(secondResult.has_value());
    CHECK(firstResult->text() == R"({"n":1})");
    CHECK(secondResult->text() == R"({"n":2})");
    CHECK(f.state("s1") == SessionState::Ready);
}

TEST_CASE("SessionManager creates a session once under concurrent discovery", "[session]")
{
    auto f = Fixture {};

    auto first = std::async(std::launch::async, [&] { return f.manager->discover("s1", filesystemServer()); });
    auto second = std::async(std::launch::async, [&] { return f.manager->discover("s1", filesystemServer()); });

    CHECK(first.get().has_value());
    CHECK(second.get().has_value());
    CHECK(f.launches() == 1);
}

TEST_CASE("SessionManager reclaims idle sessions", "[session]")
{
    auto f = Fixture {};
    REQUIRE(f.manager->discover("s1", filesystemServer()).has_value());

    f.clock.advance(599s);
    CHECK(f.manager->reclaimIdle() == 0);
    CHECK(f.state("s1") == SessionState::Ready);

    // Activity resets the idle timer.
    REQUIRE(f.manager->execute("s1", "echo", nlohmann::json::object()).has_value());
    f.clock.advance(599s);
    CHECK(f.manager->reclaimIdle() == 0);

    f.clock.advance(2s);
    CHECK(f.manager->reclaimIdle() == 1);
    CHECK(f.state("s1") == SessionState::Stopped);
    CHECK(f.server()->isClosed());

    // Tombstones are pruned after another idle timeout.
    f.clock.advance(601s);
    CHECK(f.manager->reclaimIdle() == 0);
    CHECK(!f.manager->status("s1").has_value());
}

TEST_CASE("SessionManager marks a session failed when the launch fails", "[session]")
{
    auto f = Fixture {};
    f.launchError = Error { .code = ErrorCode::LaunchError, .message = "Executable not found: npx" };

    auto result = f.manager->discover("s1", filesystemServer());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::LaunchError);

    auto status = f.manager->status("s1");
    REQUIRE(status.has_value());
    CHECK(status->state == SessionState::Failed);
    REQUIRE(status->failure.has_value());
    CHECK(status->failure->code == ErrorCode::LaunchError);
    CHECK(f.manager->stats().failedSessions == 1);
    CHECK(f.manager->listActive().empty());

    auto again = f.manager->discover("s1", filesystemServer());
    REQUIRE(!again.has_value());
    CHECK(again.error().code == ErrorCode::SessionFailed);
    CHECK(f.launches() == 1);

    SECTION("failed sessions are reclaimed after the grace period")
    {
        f.clock.advance(29s);
        CHECK(f.manager->reclaimIdle() == 0);
        f.clock.advance(2s);
        CHECK(f.manager->reclaimIdle() == 1);

        f.launchError.reset();
        CHECK(f.manager->discover("s1", filesystemServer()).has_value());
        CHECK(f.launches() == 2);
    }

    SECTION("stop clears a failed session")
    {
        REQUIRE(f.manager->stop("s1").has_value());
        f.launchError.reset();
        CHECK(f.manager->discover("s1", filesystemServer()).has_value());
    }
}

TEST_CASE("SessionManager marks a session failed when the handshake fails", "[session]")
{
    auto f = Fixture {};
    f.configure = [](FakeServer& server) { server.protocolVersion = "1999-01-01"; };

    auto result = f.manager->discover("s1", filesystemServer());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::HandshakeError);
    CHECK(f.state("s1") == SessionState::Failed);
    CHECK(f.server()->isClosed());
}

TEST_CASE("SessionManager fails a session whose server goes away during a call", "[session]")
{
    auto f = Fixture {};
    REQUIRE(f.manager->discover("s1", filesystemServer()).has_value());
    CHECK(f.manager->cache().size() == 1);
    auto server = f.server();
    holdCalls(*server, true);

    auto call = std::async(std::launch::async, [&] {
        return f.manager->execute("s1", "read_file", { { "path", "/exists" } });
    });
    REQUIRE(server->waitForHeldCalls(1));
    server->hangUp();

    auto result = call.get();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConnectionClosed);

    CHECK(f.state("s1") == SessionState::Failed);
    CHECK(f.manager->cache().size() == 0);

    auto later = f.manager->execute("s1", "read_file", { { "path", "/exists" } });
    REQUIRE(!later.has_value());
    CHECK(later.error().code == ErrorCode::SessionFailed);
}

TEST_CASE("SessionManager notices a server that went away between calls", "[session]")
{
    auto f = Fixture {};
    REQUIRE(f.manager->discover("s1", filesystemServer()).has_value());
    CHECK(f.manager->cache().size() == 1);

    f.server()->hangUp();
    REQUIRE(eventually([&] { return f.state("s1") == SessionState::Failed; }));

    auto status = f.manager->status("s1");
    REQUIRE(status.has_value());
    REQUIRE(status->failure.has_value());
    CHECK(status->failure->code == ErrorCode::ConnectionClosed);
    CHECK(f.manager->listActive().empty());
    CHECK(f.manager->stats().failedSessions == 1);
    CHECK(f.manager->cache().size() == 0);

    // The cached tool list of a dead server is not served.
    auto discovery = f.manager->discover("s1", filesystemServer());
    REQUIRE(!discovery.has_value());
    CHECK(discovery.error().code == ErrorCode::SessionFailed);
    CHECK(f.launches() == 1);

    // Reclaimed after the failure grace, not the idle timeout.
    f.clock.advance(29s);
    CHECK(f.manager->reclaimIdle() == 0);
    f.clock.advance(2s);
    CHECK(f.manager->reclaimIdle() == 1);
    CHECK(f.state("s1") == SessionState::Stopped);

    REQUIRE(f.manager->discover("s1", filesystemServer()).has_value());
    CHECK(f.launches() == 2);
}

TEST_CASE("SessionManager reclamation detects a malformed frame between calls", "[session]")
{
    auto f = Fixture {};
    REQUIRE(f.manager->discover("s1", filesystemServer()).has_value());

    f.server()->pushMalformed();
    f.clock.advance(31s);

    // The first pass detects the failure, a later one reclaims it once the grace has passed.
    REQUIRE(eventually([&] {
        f.manager->reclaimIdle();
        auto status = f.manager->status("s1");
        return status && status->state != SessionState::Ready;
    }));
    auto status = f.manager->status("s1");
    REQUIRE(status.has_value());
    REQUIRE(status->state == SessionState::Failed);
    CHECK(status->failure->code == ErrorCode::ProtocolError);

    f.clock.advance(31s);
    CHECK(f.manager->reclaimIdle() == 1);
}

TEST_CASE("SessionManager reports the server capabilities", "[session]")
{
    auto f = Fixture {};
    f.configure = [](FakeServer& server) { server.instructions = "Paths must be absolute."; };
    REQUIRE(f.manager->discover("s1", filesystemServer()).has_value());

    auto status = f.manager->status("s1");
    REQUIRE(status.has_value());
    CHECK(status->server.serverInfo.name == "fake-server");
    CHECK(status->server.instructions == "Paths must be absolute.");

    REQUIRE(f.manager->stop("s1").has_value());
    auto stopped = f.manager->status("s1");
    REQUIRE(stopped.has_value());
    CHECK(stopped->server.instructions == "Paths must be absolute.");
}

TEST_CASE("SessionManager listActive and stats", "[session]")
{
    auto f = Fixture {};
    REQUIRE(f.manager->discover("a", filesystemServer("/tmp")).has_value());
    REQUIRE(f.manager->discover("b", filesystemServer("/var")).has_value());

    auto active = f.manager->listActive();
    REQUIRE(active.size() == 2);
    CHECK(active[0].sessionId == "a");
    CHECK(active[1].sessionId == "b");

    auto const stats = f.manager->stats();
    CHECK(stats.activeSessions == 2);
    CHECK(stats.failedSessions == 0);
    CHECK(stats.cacheEntries == 2);
    CHECK(stats.cacheEnabled);
    CHECK(stats.cacheTtl == 300s);
    CHECK(stats.idleTimeout == 600s);
    CHECK(stats.platform == platformName(currentPlatform()));
}

TEST_CASE("SessionManager shutdown stops every session", "[session]")
{
    auto f = Fixture {};
    REQUIRE(f.manager->discover("a", filesystemServer("/tmp")).has_value());
    REQUIRE(f.manager->discover("b", filesystemServer("/var")).has_value());

    f.manager->shutdown();

    CHECK(f.manager->listActive().empty());
    CHECK(f.server(0)->isClosed());
    CHECK(f.server(1)->isClosed());
    CHECK(f.state("a") == SessionState::Stopped);
}

TEST_CASE("stateName", "[session]")
{
    CHECK(stateName(SessionState::Creating) == "creating");
    CHECK(stateName(SessionState::Busy) == "busy");
    CHECK(stateName(SessionState::Failed) == "failed");
}
