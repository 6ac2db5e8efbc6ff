// SPDX-License-Identifier: Apache-2.0
#include <broadcast/StatusBroadcaster.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <sstream>
#include <thread>
#include <vector>

#include "TempDirectory.hpp"

using namespace mcprt;

namespace
{

/// @brief Listener recording every message; can be switched to fail.
class MockListener: public StatusListener
{
  public:
    bool failing = false;

    auto send(const nlohmann::json& message) -> VoidResult override
    {
        auto lock = std::lock_guard(_mutex);
        if (failing)
            return makeError(ErrorCode::TransportError, "connection closed");
        _messages.push_back(message);
        return {};
    }

    auto messages() const -> std::vector<nlohmann::json>
    {
        auto lock = std::lock_guard(_mutex);
        return _messages;
    }

    auto last() const -> nlohmann::json
    {
        auto lock = std::lock_guard(_mutex);
        return _messages.empty() ? nlohmann::json {} : _messages.back();
    }

  private:
    mutable std::mutex _mutex;
    std::vector<nlohmann::json> _messages;
};

struct Fixture
{
    TempDirectory dir;
    ConfigStore store;
    Supervisor supervisor;

    Fixture(): store(dir / "mcp_servers.json"), supervisor(store, fastConfig())
    {
        auto const saved = supervisor.replaceManifest(ServerManifest {
            { "srv", ServerDefinition { .id = "srv", .command = "cat", .args = {}, .env = {} } },
        });
        if (!saved)
            throw std::runtime_error(saved.error().message);
    }

    static auto fastConfig() -> SupervisorConfig
    {
        auto config = SupervisorConfig {};
        config.startupGrace = std::chrono::milliseconds(200);
        config.stopTimeout = std::chrono::milliseconds(2000);
        config.pollInterval = std::chrono::milliseconds(50);
        return config;
    }
};

} // namespace

TEST_CASE("StatusBroadcaster sends a snapshot on subscribe", "[broadcaster]")
{
    auto fixture = Fixture();
    auto broadcaster = StatusBroadcaster(fixture.supervisor);

    auto listener = std::make_shared<MockListener>();
    auto const id = broadcaster.subscribe(listener);

    CHECK(broadcaster.listenerCount() == 1);
    REQUIRE(listener->messages().size() == 1);

    auto const snapshot = listener->last();
    CHECK(snapshot["type"] == "server_status");
    CHECK(snapshot["timestamp"].is_string());
    REQUIRE(snapshot["servers"].size() == 1);
    CHECK(snapshot["servers"][0]["id"] == "srv");
    CHECK(snapshot["servers"][0]["running"] == false);
    CHECK(snapshot["servers"][0]["pid"].is_null());

    CHECK(broadcaster.unsubscribe(id));
    CHECK(!broadcaster.unsubscribe(id));
    CHECK(broadcaster.listenerCount() == 0);
}

TEST_CASE("StatusBroadcaster drops only failing listeners", "[broadcaster]")
{
    auto fixture = Fixture();
    auto broadcaster = StatusBroadcaster(fixture.supervisor);

    auto first = std::make_shared<MockListener>();
    auto second = std::make_shared<MockListener>();
    auto third = std::make_shared<MockListener>();
    (void) broadcaster.subscribe(first);
    (void) broadcaster.subscribe(second);
    (void) broadcaster.subscribe(third);
    REQUIRE(broadcaster.listenerCount() == 3);

    second->failing = true;
    broadcaster.broadcastNow();

    CHECK(broadcaster.listenerCount() == 2);
    CHECK(first->messages().size() == 2);
    CHECK(second->messages().size() == 1);
    CHECK(third->messages().size() == 2);
    CHECK(first->last() == third->last());

    second->failing = false;
    broadcaster.broadcastNow();
    CHECK(second->messages().size() == 1);
    CHECK(first->messages().size() == 3);
}

TEST_CASE("StatusBroadcaster answers refresh with a snapshot", "[broadcaster]")
{
    auto fixture = Fixture();
    auto broadcaster = StatusBroadcaster(fixture.supervisor);

    auto asking = std::make_shared<MockListener>();
    auto other = std::make_shared<MockListener>();
    auto const askingId = broadcaster.subscribe(asking);
    (void) broadcaster.subscribe(other);

    broadcaster.handleCommand(askingId, R"({"command": "refresh"})");

    CHECK(asking->messages().size() == 2);
    CHECK(asking->last()["type"] == "server_status");
    CHECK(other->messages().size() == 1);
}

TEST_CASE("StatusBroadcaster rejects bad commands", "[broadcaster]")
{
    auto fixture = Fixture();
    auto broadcaster = StatusBroadcaster(fixture.supervisor);
    auto listener = std::make_shared<MockListener>();
    auto const id = broadcaster.subscribe(listener);

    SECTION("invalid JSON is ignored")
    {
        broadcaster.handleCommand(id, "{ nope");
        CHECK(listener->messages().size() == 1);
    }

    SECTION("unknown command")
    {
        broadcaster.handleCommand(id, R"({"command": "explode", "server_id": "srv"})");
        auto const reply = listener->last();
        CHECK(reply["type"] == "command_result");
        CHECK(reply["command"] == "explode");
        CHECK(reply["success"] == false);
    }

    SECTION("missing server_id")
    {
        broadcaster.handleCommand(id, R"({"command": "start"})");
        auto const reply = listener->last();
        CHECK(reply["type"] == "command_result");
        CHECK(reply["server_id"].is_null());
        CHECK(reply["success"] == false);
    }

    SECTION("unknown server")
    {
        broadcaster.handleCommand(id, R"({"command": "stop", "server_id": "ghost"})");
        auto const messages = listener->messages();
        REQUIRE(messages.size() == 3);
        CHECK(messages[1]["type"] == "command_result");
        CHECK(messages[1]["success"] == false);
        CHECK(messages[1]["message"] == "Server 'ghost' not found");
        CHECK(messages[2]["type"] == "server_status");
    }
}

#ifndef _WIN32
TEST_CASE("StatusBroadcaster runs start and stop commands", "[broadcaster]")
{
    auto fixture = Fixture();
    auto broadcaster = StatusBroadcaster(fixture.supervisor);
    auto listener = std::make_shared<MockListener>();
    auto const id = broadcaster.subscribe(listener);

    broadcaster.handleCommand(id, R"({"command": "start", "server_id": "srv"})");
    auto messages = listener->messages();
    REQUIRE(messages.size() == 3);
    CHECK(messages[1]["success"] == true);
    CHECK(messages[1]["server_id"] == "srv");
    CHECK(messages[2]["servers"][0]["running"] == true);

    broadcaster.handleCommand(id, R"({"command": "stop", "server_id": "srv"})");
    messages = listener->messages();
    REQUIRE(messages.size() == 5);
    CHECK(messages[3]["message"] == "Server stopped");
    CHECK(messages[4]["servers"][0]["running"] == false);
}
#endif

TEST_CASE("StatusBroadcaster broadcasts periodically while started", "[broadcaster]")
{
    auto fixture = Fixture();
    auto broadcaster = StatusBroadcaster(fixture.supervisor, BroadcasterConfig { .interval = std::chrono::milliseconds(50) });
    auto listener = std::make_shared<MockListener>();
    (void) broadcaster.subscribe(listener);

    broadcaster.start();
    CHECK(broadcaster.isRunning());

    auto const deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (listener->messages().size() < 3 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

    broadcaster.stop();
    CHECK(!broadcaster.isRunning());
    CHECK(listener->messages().size() >= 3);
}

TEST_CASE("StreamListener writes one JSON document per line", "[broadcaster]")
{
    auto out = std::ostringstream {};
    auto listener = StreamListener(out);

    REQUIRE(listener.send(nlohmann::json { { "a", 1 } }).has_value());
    REQUIRE(listener.send(nlohmann::json { { "b", 2 } }).has_value());

    CHECK(out.str() == "{\"a\":1}\n{\"b\":2}\n");
}
