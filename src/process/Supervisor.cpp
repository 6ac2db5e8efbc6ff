// SPDX-License-Identifier: Apache-2.0
#include "Supervisor.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <format>

namespace mcprt
{

namespace
{

    constexpr auto RedactedValue = std::string_view { "********" };
    constexpr auto StderrDrainTimeout = std::chrono::milliseconds(500);

    auto joinLines(const std::vector<std::string>& lines, std::string_view separator) -> std::string
    {
        auto result = std::string {};
        for (const auto& line: lines)
        {
            if (!result.empty())
                result += separator;
            result += line;
        }
        return result;
    }

} // namespace

auto isSecretKey(std::string_view key) -> bool
{
    static constexpr auto Markers = std::array<std::string_view, 5> { "key", "token", "secret", "password", "auth" };

    auto lower = std::string(key);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::ranges::any_of(Markers, [&](std::string_view marker) { return lower.contains(marker); });
}

Supervisor::Supervisor(ConfigStore& store, SupervisorConfig config):
    _store(store), _config(config), _manifest(_store.load())
{
    log::debug("Supervisor loaded {} server definition(s)", _manifest.size());
}

Supervisor::~Supervisor()
{
    shutdown();
}

auto Supervisor::isKnown(const std::string& id) const -> bool
{
    auto lock = std::lock_guard(_stateMutex);
    return _manifest.contains(id) || _processes.contains(id);
}

auto Supervisor::operationLockCount() const -> size_t
{
    auto lock = std::lock_guard(_operationsMutex);
    return _operationLocks.size();
}

auto Supervisor::operationMutex(std::string_view id) -> std::mutex&
{
    auto lock = std::lock_guard(_operationsMutex);
    auto it = _operationLocks.find(id);
    if (it == _operationLocks.end())
        it = _operationLocks.emplace(std::string(id), std::make_unique<std::mutex>()).first;
    return *it->second;
}

auto Supervisor::findProcess(std::string_view id) const -> std::shared_ptr<ChildProcess>
{
    auto lock = std::lock_guard(_stateMutex);
    auto const it = _processes.find(std::string(id));
    return it != _processes.end() ? it->second : nullptr;
}

void Supervisor::releaseProcess(const std::string& id, const std::shared_ptr<ChildProcess>& process)
{
    auto lock = std::lock_guard(_stateMutex);
    if (auto it = _processes.find(id); it != _processes.end() && it->second == process)
        _processes.erase(it);
}

// Definitions

auto Supervisor::upsertDefinition(ServerDefinition definition) -> VoidResult
{
    if (definition.id.empty())
        return makeError(ErrorCode::InvalidArgument, "Server id must not be empty");

    auto lock = std::lock_guard(_stateMutex);
    auto const id = definition.id;
    _manifest[id] = std::move(definition);
    if (auto saved = _store.save(_manifest); !saved)
        return saved;

    log::info("Saved definition of MCP server '{}'", id);
    return {};
}

auto Supervisor::removeDefinition(std::string_view id) -> bool
{
    auto lock = std::lock_guard(_stateMutex);
    auto const it = _manifest.find(std::string(id));
    if (it == _manifest.end())
        return false;

    _manifest.erase(it);
    if (auto saved = _store.save(_manifest); !saved)
    {
        log::error("{}", saved.error().message);
        return false;
    }

    if (_processes.contains(std::string(id)))
        log::info("Removed definition of MCP server '{}'; its process keeps running", id);
    else
        log::info("Removed definition of MCP server '{}'", id);
    return true;
}

auto Supervisor::manifest() const -> ServerManifest
{
    auto lock = std::lock_guard(_stateMutex);
    return _manifest;
}

auto Supervisor::replaceManifest(ServerManifest manifest) -> VoidResult
{
    for (auto& [id, definition]: manifest)
        definition.id = id;

    for (const auto& [id, outcome]: stopAll())
    {
        if (!outcome && outcome.error().code != ErrorCode::ServerNotRunning)
            log::warning("Failed to stop MCP server '{}' before replacing the manifest: {}",
                         id,
                         outcome.error().message);
    }

    auto lock = std::lock_guard(_stateMutex);
    if (auto saved = _store.save(manifest); !saved)
        return saved;

    _manifest = std::move(manifest);
    log::info("Replaced MCP manifest ({} server(s))", _manifest.size());
    return {};
}

auto Supervisor::redactedManifest() const -> ServerManifest
{
    auto result = manifest();
    for (auto& [id, definition]: result)
    {
        for (auto& [key, value]: definition.env)
        {
            if (isSecretKey(key))
                value = RedactedValue;
        }
    }
    return result;
}

// Process control

auto Supervisor::start(std::string_view id) -> Result<ActionOutcome>
{
    auto const key = std::string(id);
    if (!isKnown(key))
        return makeError(ErrorCode::ServerNotFound, std::format("Server '{}' not found in configuration", id));

    auto lock = std::lock_guard(operationMutex(key));
    return startLocked(key);
}

auto Supervisor::startLocked(const std::string& id) -> Result<ActionOutcome>
{
    auto existing = findProcess(id);
    if (existing && existing->isRunning())
        return ActionOutcome { .message = "Server already running", .pid = existing->pid() };

    if (existing)
    {
        log::debug("Releasing exited process of MCP server '{}' (exit code: {})",
                   id,
                   existing->exitCode().value_or(-1));
        releaseProcess(id, existing);
        existing.reset();
    }

    auto definition = ServerDefinition {};
    {
        auto stateLock = std::lock_guard(_stateMutex);
        auto const it = _manifest.find(id);
        if (it == _manifest.end())
            return makeError(ErrorCode::ServerNotFound, std::format("Server '{}' not found in configuration", id));
        definition = it->second;
    }

    if (definition.command.empty())
        return makeError(ErrorCode::InvalidArgument, "Invalid server configuration: command is missing");

    if (!resolveExecutable(definition.command))
        log::warning("Command '{}' not found in PATH", definition.command);

    log::info("Starting MCP server '{}'", id);

    auto process = std::make_shared<ChildProcess>();
    auto started = process->start(ChildProcessConfig {
        .name = id,
        .command = definition.command,
        .args = definition.args,
        .env = definition.env,
        .stderrHistory = _config.stderrLines,
    });
    if (!started)
    {
        log::error("Error starting MCP server '{}': {}", id, started.error().message);
        return makeError(ErrorCode::LaunchError, std::format("Error starting server: {}", started.error().message));
    }

    if (process->waitForExit(_config.startupGrace))
    {
        // Let the readers pick up whatever the process printed before dying.
        if (!process->waitForReaders(StderrDrainTimeout))
            log::debug("Output of MCP server '{}' still open after exit", id);

        auto message = std::format("Server failed to start (exit code: {})", process->exitCode().value_or(-1));
        if (auto const details = process->recentStderr(); !details.empty())
            message += std::format("\nError details: {}", joinLines(details, " "));

        log::error("{}", message);
        return makeError(ErrorCode::LaunchError, std::move(message));
    }

    auto const pid = process->pid();
    {
        auto stateLock = std::lock_guard(_stateMutex);
        _processes[id] = std::move(process);
    }

    log::info("Started MCP server '{}' (PID: {})", id, pid);
    return ActionOutcome { .message = std::format("Server started (PID: {})", pid), .pid = pid };
}

auto Supervisor::stop(std::string_view id) -> Result<ActionOutcome>
{
    auto const key = std::string(id);
    if (!isKnown(key))
        return makeError(ErrorCode::ServerNotFound, std::format("Server '{}' not found", id));

    auto lock = std::lock_guard(operationMutex(key));
    return stopLocked(key);
}

auto Supervisor::stopLocked(const std::string& id) -> Result<ActionOutcome>
{
    auto process = findProcess(id);
    if (!process)
    {
        auto stateLock = std::lock_guard(_stateMutex);
        if (_manifest.contains(id))
            return makeError(ErrorCode::ServerNotRunning, std::format("Server '{}' not running", id));
        return makeError(ErrorCode::ServerNotFound, std::format("Server '{}' not found", id));
    }

    if (!process->isRunning())
    {
        auto const code = process->exitCode().value_or(-1);
        releaseProcess(id, process);
        return ActionOutcome { .message = std::format("Server already stopped (exit code: {})", code) };
    }

    if (auto terminated = process->terminate(); !terminated)
    {
        log::error("Error stopping MCP server '{}': {}", id, terminated.error().message);
        return makeError(ErrorCode::StopError, std::format("Error stopping server: {}", terminated.error().message));
    }

    if (!process->waitForExit(_config.stopTimeout, _config.pollInterval))
    {
        log::warning("MCP server '{}' did not exit within {}, killing it", id, _config.stopTimeout);
        if (auto killed = process->kill(); !killed)
        {
            log::error("Error stopping MCP server '{}': {}", id, killed.error().message);
            return makeError(ErrorCode::StopError, std::format("Error stopping server: {}", killed.error().message));
        }
        process->wait();
    }

    releaseProcess(id, process);
    log::info("Stopped MCP server '{}'", id);
    return ActionOutcome { .message = "Server stopped" };
}

auto Supervisor::restart(std::string_view id) -> Result<ActionOutcome>
{
    auto const key = std::string(id);
    if (!isKnown(key))
        return makeError(ErrorCode::ServerNotFound, std::format("Failed to stop server: Server '{}' not found", id));

    auto lock = std::lock_guard(operationMutex(key));

    if (auto stopped = stopLocked(key); !stopped && stopped.error().code != ErrorCode::ServerNotRunning)
        return makeError(stopped.error().code, std::format("Failed to stop server: {}", stopped.error().message));

    return startLocked(key);
}

auto Supervisor::startAll() -> BulkOutcome
{
    auto results = BulkOutcome {};
    for (const auto& [id, definition]: manifest())
        results.emplace(id, start(id));
    return results;
}

auto Supervisor::stopAll() -> BulkOutcome
{
    auto ids = std::vector<std::string> {};
    {
        auto lock = std::lock_guard(_stateMutex);
        for (const auto& [id, definition]: _manifest)
            ids.push_back(id);
        for (const auto& [id, process]: _processes)
        {
            if (!_manifest.contains(id))
                ids.push_back(id);
        }
    }

    auto results = BulkOutcome {};
    for (const auto& id: ids)
        results.emplace(id, stop(id));
    return results;
}

// Queries

auto Supervisor::status(std::string_view id) const -> ServerRuntimeState
{
    auto state = ServerRuntimeState { .id = std::string(id) };
    auto process = std::shared_ptr<ChildProcess> {};
    {
        auto lock = std::lock_guard(_stateMutex);
        if (auto const it = _manifest.find(state.id); it != _manifest.end())
        {
            state.exists = true;
            state.command = it->second.command;
            state.args = it->second.args;
        }
        if (auto const it = _processes.find(state.id); it != _processes.end())
            process = it->second;
    }

    if (process && process->isRunning())
    {
        state.running = true;
        state.pid = process->pid();
    }
    return state;
}

auto Supervisor::list() const -> std::vector<ServerRuntimeState>
{
    auto result = std::vector<ServerRuntimeState> {};
    for (const auto& [id, definition]: manifest())
        result.push_back(status(id));
    return result;
}

void Supervisor::shutdown()
{
    auto ids = std::vector<std::string> {};
    {
        auto lock = std::lock_guard(_stateMutex);
        for (const auto& [id, process]: _processes)
            ids.push_back(id);
    }

    for (const auto& id: ids)
    {
        if (auto stopped = stop(id); !stopped)
            log::warning("Failed to stop MCP server '{}' during shutdown: {}", id, stopped.error().message);
    }
}

} // namespace mcprt
