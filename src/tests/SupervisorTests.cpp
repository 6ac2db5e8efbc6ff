// SPDX-License-Identifier: Apache-2.0
#include <process/ChildProcess.hpp>
#include <process/Supervisor.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <format>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <string>
#include <vector>

#include "TempDirectory.hpp"

using namespace mcprt;

namespace
{

auto fastConfig() -> SupervisorConfig
{
    return SupervisorConfig {
        .startupGrace = std::chrono::milliseconds(300),
        .stopTimeout = std::chrono::milliseconds(2000),
        .pollInterval = std::chrono::milliseconds(50),
        .stderrLines = 10,
    };
}

auto definition(std::string id, std::string command, std::vector<std::string> args = {}) -> ServerDefinition
{
    return ServerDefinition { .id = std::move(id), .command = std::move(command), .args = std::move(args), .env = {} };
}

/// @brief Writes a manifest to a scratch directory and opens a store on it.
struct Fixture
{
    TempDirectory dir;
    ConfigStore store;

    explicit Fixture(const std::vector<ServerDefinition>& definitions): store(dir / "mcp_servers.json")
    {
        auto manifest = ServerManifest {};
        for (const auto& def: definitions)
            manifest[def.id] = def;
        if (!store.save(manifest))
            throw std::runtime_error("cannot write test manifest");
    }
};

} // namespace

TEST_CASE("isSecretKey matches credential-like names", "[supervisor]")
{
    CHECK(isSecretKey("API_KEY"));
    CHECK(isSecretKey("github_token"));
    CHECK(isSecretKey("ClientSecret"));
    CHECK(isSecretKey("DB_PASSWORD"));
    CHECK(isSecretKey("AUTH_HEADER"));
    CHECK(!isSecretKey("PATH"));
    CHECK(!isSecretKey("LOG_LEVEL"));
}

TEST_CASE("Supervisor redacts secrets in the manifest view", "[supervisor]")
{
    auto def = definition("srv", "cat");
    def.env = { { "API_KEY", "s3cr3t" }, { "MODE", "fast" } };
    auto fixture = Fixture({ def });
    auto supervisor = Supervisor(fixture.store, fastConfig());

    auto const redacted = supervisor.redactedManifest();
    CHECK(redacted.at("srv").env.at("API_KEY") == "********");
    CHECK(redacted.at("srv").env.at("MODE") == "fast");
    CHECK(supervisor.manifest().at("srv").env.at("API_KEY") == "s3cr3t");
}

TEST_CASE("Supervisor definitions are persisted", "[supervisor]")
{
    auto fixture = Fixture({});
    auto supervisor = Supervisor(fixture.store, fastConfig());

    REQUIRE(supervisor.upsertDefinition(definition("a", "cat")).has_value());
    CHECK(fixture.store.load().contains("a"));

    auto const empty = supervisor.upsertDefinition(definition("", "cat"));
    REQUIRE(!empty.has_value());
    CHECK(empty.error().code == ErrorCode::InvalidArgument);

    CHECK(supervisor.removeDefinition("a"));
    CHECK(!supervisor.removeDefinition("a"));
    CHECK(fixture.store.load().empty());
}

TEST_CASE("Supervisor status of unknown and idle servers", "[supervisor]")
{
    auto fixture = Fixture({ definition("idle", "cat", { "-u" }) });
    auto supervisor = Supervisor(fixture.store, fastConfig());

    auto const unknown = supervisor.status("nope");
    CHECK(!unknown.exists);
    CHECK(!unknown.running);

    auto const idle = supervisor.status("idle");
    CHECK(idle.exists);
    CHECK(!idle.running);
    CHECK(!idle.pid.has_value());
    CHECK(idle.command == "cat");
    CHECK(idle.args == std::vector<std::string> { "-u" });

    REQUIRE(supervisor.list().size() == 1);
}

TEST_CASE("Supervisor rejects unknown ids and missing commands", "[supervisor]")
{
    auto fixture = Fixture({ definition("empty", "") });
    auto supervisor = Supervisor(fixture.store, fastConfig());

    auto const unknown = supervisor.start("nope");
    REQUIRE(!unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::ServerNotFound);
    CHECK(unknown.error().message == "Server 'nope' not found in configuration");

    auto const empty = supervisor.start("empty");
    REQUIRE(!empty.has_value());
    CHECK(empty.error().code == ErrorCode::InvalidArgument);
    CHECK(empty.error().message == "Invalid server configuration: command is missing");

    auto const stopUnknown = supervisor.stop("nope");
    REQUIRE(!stopUnknown.has_value());
    CHECK(stopUnknown.error().code == ErrorCode::ServerNotFound);

    auto const stopIdle = supervisor.stop("empty");
    REQUIRE(!stopIdle.has_value());
    CHECK(stopIdle.error().code == ErrorCode::ServerNotRunning);
}

TEST_CASE("Supervisor creates no operation locks for unknown ids", "[supervisor]")
{
    auto fixture = Fixture({ definition("empty", "") });
    auto supervisor = Supervisor(fixture.store, fastConfig());

    for (auto i = 0; i < 20; ++i)
    {
        auto const id = std::format("unknown-{}", i);
        CHECK(supervisor.start(id).error().code == ErrorCode::ServerNotFound);
        CHECK(supervisor.stop(id).error().code == ErrorCode::ServerNotFound);

        auto const restarted = supervisor.restart(id);
        REQUIRE(!restarted.has_value());
        CHECK(restarted.error().code == ErrorCode::ServerNotFound);
        CHECK(restarted.error().message == std::format("Failed to stop server: Server '{}' not found", id));
    }
    CHECK(supervisor.operationLockCount() == 0);

    CHECK(!supervisor.start("empty").has_value());
    CHECK(supervisor.operationLockCount() == 1);
}

#ifndef _WIN32
TEST_CASE("Supervisor starts and stops a long running server", "[supervisor]")
{
    auto fixture = Fixture({ definition("cat", "cat") });
    auto supervisor = Supervisor(fixture.store, fastConfig());

    auto const started = supervisor.start("cat");
    REQUIRE(started.has_value());
    REQUIRE(started->pid.has_value());
    CHECK(started->message == std::format("Server started (PID: {})", *started->pid));

    auto const state = supervisor.status("cat");
    CHECK(state.running);
    CHECK(state.pid == started->pid);

    auto const again = supervisor.start("cat");
    REQUIRE(again.has_value());
    CHECK(again->message == "Server already running");
    CHECK(again->pid == started->pid);

    auto const stopped = supervisor.stop("cat");
    REQUIRE(stopped.has_value());
    CHECK(stopped->message == "Server stopped");
    CHECK(!supervisor.status("cat").running);

    auto const stopAgain = supervisor.stop("cat");
    REQUIRE(!stopAgain.has_value());
    CHECK(stopAgain.error().code == ErrorCode::ServerNotRunning);
}

TEST_CASE("Supervisor reports servers that exit during the grace period", "[supervisor]")
{
    auto fixture = Fixture({ definition("crash", "sh", { "-c", "echo boom >&2; exit 3" }) });
    auto supervisor = Supervisor(fixture.store, fastConfig());

    auto const result = supervisor.start("crash");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::LaunchError);
    CHECK(result.error().message.starts_with("Server failed to start (exit code: 3)"));
    CHECK(result.error().message.contains("boom"));
    CHECK(!supervisor.status("crash").running);
}

TEST_CASE("Supervisor treats a one-shot command as a failed launch", "[supervisor]")
{
    auto fixture = Fixture({ definition("echo", "echo", { "hi" }) });
    auto supervisor = Supervisor(fixture.store, fastConfig());

    auto const result = supervisor.start("echo");
    REQUIRE(!result.has_value());
    CHECK(result.error().message == "Server failed to start (exit code: 0)");

    auto const state = supervisor.status("echo");
    CHECK(state.exists);
    CHECK(!state.running);
}

TEST_CASE("Supervisor reports servers that exited after starting", "[supervisor]")
{
    auto fixture = Fixture({ definition("short", "sh", { "-c", "sleep 0.6" }) });
    auto supervisor = Supervisor(fixture.store, fastConfig());

    REQUIRE(supervisor.start("short").has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds(1000));
    CHECK(!supervisor.status("short").running);

    auto const stopped = supervisor.stop("short");
    REQUIRE(stopped.has_value());
    CHECK(stopped->message == "Server already stopped (exit code: 0)");
}

TEST_CASE("Supervisor kills servers that ignore SIGTERM", "[supervisor]")
{
    auto fixture = Fixture({ definition("stubborn", "sh", { "-c", "trap '' TERM; while true; do sleep 1; done" }) });
    auto config = fastConfig();
    config.stopTimeout = std::chrono::milliseconds(300);
    auto supervisor = Supervisor(fixture.store, config);

    REQUIRE(supervisor.start("stubborn").has_value());
    auto const stopped = supervisor.stop("stubborn");
    REQUIRE(stopped.has_value());
    CHECK(stopped->message == "Server stopped");
    CHECK(!supervisor.status("stubborn").running);
}

TEST_CASE("Supervisor restart", "[supervisor]")
{
    auto fixture = Fixture({ definition("cat", "cat") });
    auto supervisor = Supervisor(fixture.store, fastConfig());

    SECTION("of a stopped server starts it")
    {
        auto const restarted = supervisor.restart("cat");
        REQUIRE(restarted.has_value());
        CHECK(supervisor.status("cat").running);
    }

    SECTION("of a running server replaces the process")
    {
        auto const first = supervisor.start("cat");
        REQUIRE(first.has_value());
        auto const restarted = supervisor.restart("cat");
        REQUIRE(restarted.has_value());
        CHECK(restarted->pid != first->pid);
        CHECK(supervisor.status("cat").running);
    }

    SECTION("of an unknown server fails")
    {
        auto const restarted = supervisor.restart("nope");
        REQUIRE(!restarted.has_value());
        CHECK(restarted.error().message.starts_with("Failed to stop server"));
    }

    supervisor.shutdown();
    CHECK(!supervisor.status("cat").running);
}

TEST_CASE("Supervisor holds one process per id under concurrent starts", "[supervisor]")
{
    auto fixture = Fixture({ definition("cat", "cat") });
    auto supervisor = Supervisor(fixture.store, fastConfig());

    auto mutex = std::mutex {};
    auto results = std::vector<Result<ActionOutcome>> {};
    {
        auto threads = std::vector<std::jthread> {};
        for (auto i = 0; i < 4; ++i)
        {
            threads.emplace_back([&] {
                auto result = supervisor.start("cat");
                auto lock = std::lock_guard(mutex);
                results.push_back(std::move(result));
            });
        }
    }

    REQUIRE(results.size() == 4);
    auto spawned = 0;
    for (const auto& result: results)
    {
        REQUIRE(result.has_value());
        REQUIRE(result->pid.has_value());
        CHECK(result->pid == results.front()->pid);
        if (result->message != "Server already running")
            ++spawned;
    }
    CHECK(spawned == 1);
    CHECK(supervisor.status("cat").pid == results.front()->pid);

    REQUIRE(supervisor.stop("cat").has_value());
    CHECK(supervisor.stop("cat").error().code == ErrorCode::ServerNotRunning);
}

TEST_CASE("Supervisor stops running servers before replacing the manifest", "[supervisor]")
{
    auto fixture = Fixture({ definition("cat", "cat") });
    auto supervisor = Supervisor(fixture.store, fastConfig());
    REQUIRE(supervisor.start("cat").has_value());

    REQUIRE(supervisor.replaceManifest(ServerManifest { { "other", definition("", "cat") } }).has_value());

    CHECK(!supervisor.status("cat").running);
    CHECK(!supervisor.status("cat").exists);
    CHECK(supervisor.manifest().at("other").id == "other");

    auto const stopped = supervisor.stop("cat");
    REQUIRE(!stopped.has_value());
    CHECK(stopped.error().code == ErrorCode::ServerNotFound);
}

TEST_CASE("Supervisor startAll and stopAll", "[supervisor]")
{
    auto fixture = Fixture({ definition("a", "cat"), definition("b", "cat"), definition("broken", "") });
    auto supervisor = Supervisor(fixture.store, fastConfig());

    auto const started = supervisor.startAll();
    REQUIRE(started.size() == 3);
    CHECK(started.at("a").has_value());
    CHECK(started.at("b").has_value());
    CHECK(!started.at("broken").has_value());

    auto const stopped = supervisor.stopAll();
    REQUIRE(stopped.size() == 3);
    CHECK(stopped.at("a").has_value());
    CHECK(stopped.at("b").has_value());
    REQUIRE(!stopped.at("broken").has_value());
    CHECK(stopped.at("broken").error().code == ErrorCode::ServerNotRunning);
}

TEST_CASE("Supervisor keeps controlling a server whose definition was removed", "[supervisor]")
{
    auto fixture = Fixture({ definition("cat", "cat") });
    auto supervisor = Supervisor(fixture.store, fastConfig());

    REQUIRE(supervisor.start("cat").has_value());
    REQUIRE(supervisor.removeDefinition("cat"));

    auto const state = supervisor.status("cat");
    CHECK(!state.exists);
    CHECK(state.running);

    auto const stopped = supervisor.stopAll();
    REQUIRE(stopped.contains("cat"));
    CHECK(stopped.at("cat").has_value());
    CHECK(!supervisor.status("cat").running);
}

TEST_CASE("Supervisor passes the environment overlay to the server", "[supervisor]")
{
    auto def = definition("env", "sh", { "-c", "echo \"value=$MCPRT_TEST_VALUE\" >&2; exit 7" });
    def.env = { { "MCPRT_TEST_VALUE", "hello" } };
    auto fixture = Fixture({ def });
    auto supervisor = Supervisor(fixture.store, fastConfig());

    auto const result = supervisor.start("env");
    REQUIRE(!result.has_value());
    CHECK(result.error().message.contains("value=hello"));
}

TEST_CASE("ChildProcess collects recent stderr lines", "[supervisor]")
{
    auto process = ChildProcess();
    auto const started = process.start(ChildProcessConfig {
        .name = "lines",
        .command = "sh",
        .args = { "-c", "for i in 1 2 3 4 5; do echo line$i >&2; done" },
        .env = {},
        .stderrHistory = 3,
    });
    REQUIRE(started.has_value());
    REQUIRE(process.waitForExit(std::chrono::milliseconds(5000)));
    REQUIRE(process.waitForReaders(std::chrono::milliseconds(2000)));

    CHECK(process.exitCode() == 0);
    CHECK(process.recentStderr() == std::vector<std::string> { "line3", "line4", "line5" });
}

TEST_CASE("ChildProcess waitForExit accepts a zero poll interval", "[supervisor]")
{
    auto process = ChildProcess();
    REQUIRE(process
                .start(ChildProcessConfig {
                    .name = "sleeper", .command = "sh", .args = { "-c", "sleep 0.2" }, .env = {}, .stderrHistory = 1 })
                .has_value());

    CHECK(!process.waitForExit(std::chrono::milliseconds(20), std::chrono::milliseconds(0)));
    CHECK(process.waitForExit(std::chrono::milliseconds(5000), std::chrono::milliseconds(0)));
    CHECK(process.exitCode() == 0);
}

TEST_CASE("resolveExecutable searches PATH", "[supervisor]")
{
    CHECK(resolveExecutable("sh").has_value());
    CHECK(!resolveExecutable("mcprt-no-such-command-xyz").has_value());
    CHECK(!resolveExecutable("/nonexistent/path/to/binary").has_value());
}

TEST_CASE("mergedEnvironment overrides inherited variables", "[supervisor]")
{
    auto const env = mergedEnvironment({ { "PATH", "/custom" }, { "MCPRT_EXTRA", "1" } });
    CHECK(env.at("PATH") == "/custom");
    CHECK(env.at("MCPRT_EXTRA") == "1");
}
#endif
