// SPDX-License-Identifier: Apache-2.0
#include <core/JsonUtils.hpp>
#include <mcprt/App.hpp>
#include <mcprt/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "TempDirectory.hpp"

using namespace mcprt;

namespace
{

auto splitLines(const std::string& text) -> std::vector<nlohmann::json>
{
    auto result = std::vector<nlohmann::json> {};
    auto in = std::istringstream(text);
    auto line = std::string {};
    while (std::getline(in, line))
    {
        if (!line.empty())
            result.push_back(nlohmann::json::parse(line));
    }
    return result;
}

/// @brief Config rooted in a scratch directory, with an empty manifest.
auto scratchConfig(const TempDirectory& dir) -> AppConfig
{
    auto const manifestPath = dir / "mcp_servers.json";
    {
        auto file = std::ofstream(manifestPath);
        file << R"({"mcpServers": {}})";
    }

    auto config = AppConfig {};
    config.storage.manifestPath = manifestPath.string();
    config.storage.contextDir = (dir / "data").string();
    config.storage.fileRoot = dir.path().string();
    config.dispatcher.workerThreads = 2;
    config.broadcaster.interval = std::chrono::milliseconds(60000);
    return config;
}

auto findReply(const std::vector<nlohmann::json>& lines, std::string_view requestId)
    -> std::vector<nlohmann::json>::const_iterator
{
    return std::ranges::find_if(lines, [&](const auto& line) {
        auto const it = line.find("request_id");
        return it != line.end() && it->is_string() && it->template get<std::string>() == requestId;
    });
}

/// @brief Listener recording every message, with a way to wait for a specific reply.
class RecordingListener: public StatusListener
{
  public:
    auto send(const nlohmann::json& message) -> VoidResult override
    {
        {
            auto lock = std::lock_guard(_mutex);
            _messages.push_back(message);
        }
        _cv.notify_all();
        return {};
    }

    auto messages() const -> std::vector<nlohmann::json>
    {
        auto lock = std::lock_guard(_mutex);
        return _messages;
    }

    auto waitForReply(std::string_view requestId) -> std::optional<nlohmann::json>
    {
        auto lock = std::unique_lock(_mutex);
        auto found = std::optional<nlohmann::json> {};
        _cv.wait_for(lock, std::chrono::seconds(10), [&] {
            if (auto const it = findReply(_messages, requestId); it != _messages.end())
                found = *it;
            return found.has_value();
        });
        return found;
    }

  private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::vector<nlohmann::json> _messages;
};

} // namespace

TEST_CASE("AppConfig has expected defaults", "[app]")
{
    auto const config = AppConfig {};
    CHECK(config.storage.manifestPath.empty());
    CHECK(config.supervisor.startupGrace == std::chrono::milliseconds(2000));
    CHECK(config.supervisor.stopTimeout == std::chrono::milliseconds(5000));
    CHECK(config.supervisor.stderrLines == 50);
    CHECK(config.dispatcher.workerThreads == 4);
    CHECK(config.dispatcher.queueLimit == 64);
    CHECK(config.broadcaster.interval == std::chrono::milliseconds(5000));
    CHECK(config.logLevel == "info");
}

TEST_CASE("defaultConfigPath ends with config.json", "[app]")
{
    auto const path = defaultConfigPath();
    REQUIRE(!path.empty());
    CHECK(path.ends_with("config.json"));
}

TEST_CASE("applyDefaultPaths only fills empty paths", "[app]")
{
    auto config = AppConfig {};
    config.storage.contextDir = "/tmp/contexts";
    applyDefaultPaths(config);

    CHECK(config.storage.manifestPath.ends_with("mcp_servers.json"));
    CHECK(config.storage.contextDir == "/tmp/contexts");
    CHECK(!config.storage.fileRoot.empty());
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[app]")
{
    auto const dir = TempDirectory();
    auto const path = dir / "config.json";
    {
        auto file = std::ofstream(path);
        file << R"({
            "storage": {
                "manifestPath": "/tmp/servers.json",
                "contextDir": "/tmp/ctx",
                "fileRoot": "/srv/files"
            },
            "supervisor": {
                "startupGraceSeconds": 0.5,
                "stopTimeoutSeconds": 3,
                "pollIntervalSeconds": 0.25,
                "stderrLines": 20
            },
            "dispatcher": {
                "workerThreads": 8,
                "queueLimit": 16
            },
            "broadcaster": {
                "intervalSeconds": 1
            },
            "logLevel": "debug"
        })";
    }

    auto const result = loadConfigFromFile(path.string());
    REQUIRE(result.has_value());
    auto const& config = *result;

    SECTION("Storage config")
    {
        CHECK(config.storage.manifestPath == "/tmp/servers.json");
        CHECK(config.storage.contextDir == "/tmp/ctx");
        CHECK(config.storage.fileRoot == "/srv/files");
    }

    SECTION("Supervisor config")
    {
        CHECK(config.supervisor.startupGrace == std::chrono::milliseconds(500));
        CHECK(config.supervisor.stopTimeout == std::chrono::milliseconds(3000));
        CHECK(config.supervisor.pollInterval == std::chrono::milliseconds(250));
        CHECK(config.supervisor.stderrLines == 20);
    }

    SECTION("Dispatcher and broadcaster config")
    {
        CHECK(config.dispatcher.workerThreads == 8);
        CHECK(config.dispatcher.queueLimit == 16);
        CHECK(config.broadcaster.interval == std::chrono::milliseconds(1000));
        CHECK(config.logLevel == "debug");
    }
}

TEST_CASE("loadConfigFromFile keeps defaults for missing and invalid values", "[app]")
{
    auto const dir = TempDirectory();
    auto const path = dir / "config.json";
    {
        auto file = std::ofstream(path);
        file << R"({ "supervisor": { "stopTimeoutSeconds": -1 } })";
    }

    auto const result = loadConfigFromFile(path.string());
    REQUIRE(result.has_value());
    CHECK(result->supervisor.stopTimeout == std::chrono::milliseconds(5000));
    CHECK(result->dispatcher.workerThreads == 4);
    CHECK(result->storage.manifestPath.empty());
}

TEST_CASE("loadConfigFromFile clamps out-of-range durations", "[app]")
{
    auto const dir = TempDirectory();
    auto const path = dir / "config.json";
    {
        auto file = std::ofstream(path);
        file << R"({
            "supervisor": {
                "startupGraceSeconds": 1e300,
                "stopTimeoutSeconds": 1e19,
                "pollIntervalSeconds": 0
            },
            "broadcaster": { "intervalSeconds": 0.001 }
        })";
    }

    auto const result = loadConfigFromFile(path.string());
    REQUIRE(result.has_value());
    CHECK(result->supervisor.startupGrace == std::chrono::hours(24));
    CHECK(result->supervisor.stopTimeout == std::chrono::hours(24));
    CHECK(result->supervisor.pollInterval == std::chrono::milliseconds(10));
    CHECK(result->broadcaster.interval == std::chrono::milliseconds(100));
}

TEST_CASE("loadConfigFromFile returns error for missing file", "[app]")
{
    auto const result = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("saveConfigToFile writes what loadConfigFromFile reads", "[app]")
{
    auto const dir = TempDirectory();
    auto const path = (dir / "config.json").string();

    auto config = AppConfig {};
    config.storage.contextDir = "/srv/mcprt";
    config.supervisor.startupGrace = std::chrono::milliseconds(1500);
    config.dispatcher.queueLimit = 7;
    config.logLevel = "warning";

    REQUIRE(saveConfigToFile(path, config).has_value());

    auto const loaded = loadConfigFromFile(path);
    REQUIRE(loaded.has_value());
    CHECK(loaded->storage.contextDir == "/srv/mcprt");
    CHECK(loaded->storage.manifestPath.empty());
    CHECK(loaded->supervisor.startupGrace == std::chrono::milliseconds(1500));
    CHECK(loaded->dispatcher.queueLimit == 7);
    CHECK(loaded->logLevel == "warning");
}

TEST_CASE("App registers the built-in functions", "[app]")
{
    auto const dir = TempDirectory();
    auto app = App(scratchConfig(dir));

    auto const names = app.dispatcher().functionNames();
    for (auto const* name: { "list_servers", "start_server", "stop_server", "create_context", "get_context" })
        CHECK(app.dispatcher().hasFunction(name));

    CHECK(app.contexts().getFunctionGroup("supervisor").has_value());
    CHECK(app.contexts().getFunctionGroup("context").has_value());
    CHECK(app.contexts().getFunctionGroup("filesystem").has_value());
    CHECK(app.dispatcher().hasFunction("edit_file"));
    CHECK(names.size() == 17);
}

TEST_CASE("App handles control channel lines", "[app]")
{
    auto const dir = TempDirectory();
    auto listener = std::make_shared<RecordingListener>();
    auto app = App(scratchConfig(dir));

    auto const listenerId = app.broadcaster().subscribe(listener);
    auto const initial = listener->messages().size();

    SECTION("function calls are dispatched")
    {
        app.handleLine(listenerId,
                       listener,
                       R"({"type": "function_call", "request_id": "r1",
                           "content": {"name": "create_context", "arguments": {"context_id": "c1", "data": {"k": 1}}}})");

        auto const reply = listener->waitForReply("r1");
        REQUIRE(reply.has_value());
        CHECK((*reply)["type"] == "function_response");
        CHECK((*reply)["content"]["result"]["context_id"] == "c1");
        CHECK(app.contexts().exists("c1"));
    }

    SECTION("invalid JSON yields an error envelope")
    {
        app.handleLine(listenerId, listener, "{ broken");

        auto const replies = listener->messages();
        REQUIRE(replies.size() == initial + 1);
        CHECK(replies.back()["type"] == "error");
        CHECK(replies.back()["content"]["code"] == "mcp_processing_error");
    }

    SECTION("blank lines are ignored")
    {
        app.handleLine(listenerId, listener, "   ");
        CHECK(listener->messages().size() == initial);
    }

    SECTION("commands go to the broadcaster")
    {
        app.handleLine(listenerId, listener, R"({"command": "refresh"})");

        auto const replies = listener->messages();
        REQUIRE(replies.size() == initial + 1);
        CHECK(replies.back()["type"] == "server_status");
    }

    CHECK(app.broadcaster().unsubscribe(listenerId));
}

TEST_CASE("App serve processes input until end of stream", "[app]")
{
    auto const dir = TempDirectory();
    auto app = App(scratchConfig(dir));

    auto in = std::istringstream(
        R"({"type": "function_call", "request_id": "r1", "content": {"name": "list_servers"}})"
        "\n"
        R"({"type": "bogus", "request_id": "r2"})"
        "\n");
    auto out = std::ostringstream {};
    auto const stopRequested = std::atomic<bool> { false };

    CHECK(app.serve(in, out, stopRequested) == 0);

    auto const lines = splitLines(out.str());
    REQUIRE(lines.size() == 3);
    CHECK(lines[0]["type"] == "server_status");

    auto const listed = findReply(lines, "r1");
    REQUIRE(listed != lines.end());
    CHECK((*listed)["type"] == "function_response");
    CHECK((*listed)["content"]["result"].is_array());

    auto const bogus = findReply(lines, "r2");
    REQUIRE(bogus != lines.end());
    CHECK((*bogus)["type"] == "error");
    CHECK(!app.broadcaster().isRunning());
}

TEST_CASE("App serve answers later lines while a slow function runs", "[app]")
{
    auto const dir = TempDirectory();
    auto app = App(scratchConfig(dir));

    auto fastCalled = std::promise<void> {};
    auto const fastDone = fastCalled.get_future().share();
    auto fastOnce = std::once_flag {};

    app.dispatcher().registerFunction("fast", SyncFunction { [&](const nlohmann::json&) -> Result<nlohmann::json> {
                                          std::call_once(fastOnce, [&] { fastCalled.set_value(); });
                                          return nlohmann::json { { "fast", true } };
                                      } });
    app.dispatcher().registerFunction(
        "slow", SyncFunction { [fastDone](const nlohmann::json&) -> Result<nlohmann::json> {
            // Runs past the fast call; a blocking channel would only get there after the timeout.
            auto const status = fastDone.wait_for(std::chrono::seconds(5));
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            return nlohmann::json { { "overtaken", status == std::future_status::ready } };
        } });

    auto in = std::istringstream(
        R"({"type": "function_call", "request_id": "r-slow", "content": {"name": "slow"}})"
        "\n"
        R"({"type": "function_call", "request_id": "r-fast", "content": {"name": "fast"}})"
        "\n");
    auto out = std::ostringstream {};
    auto const stopRequested = std::atomic<bool> { false };

    CHECK(app.serve(in, out, stopRequested) == 0);

    auto const lines = splitLines(out.str());
    auto const slow = findReply(lines, "r-slow");
    auto const fast = findReply(lines, "r-fast");
    REQUIRE(slow != lines.end());
    REQUIRE(fast != lines.end());
    CHECK(fast < slow);
    CHECK((*slow)["content"]["result"]["overtaken"] == true);
}
