// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <process/ChildProcess.hpp>
#include <store/ConfigStore.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mcprt
{

/// @brief Timing and capture settings of the supervisor.
struct SupervisorConfig
{
    /// Time a freshly launched process must survive to count as started.
    std::chrono::milliseconds startupGrace { 2000 };
    /// Time granted after SIGTERM before the process is killed.
    std::chrono::milliseconds stopTimeout { 5000 };
    /// Liveness polling interval while waiting for a stopped process.
    std::chrono::milliseconds pollInterval { 1000 };
    size_t stderrLines = 50;
};

/// @brief Results of a bulk operation, keyed by server id.
using BulkOutcome = std::map<std::string, Result<ActionOutcome>>;

/// @brief Launches, monitors and stops the MCP server processes of a manifest.
///
/// The manifest is loaded from the ConfigStore on construction and written back on
/// every mutation. At most one process is held per server id.
///
/// All methods are thread-safe. Operations on the same id are serialized; operations
/// on different ids run concurrently.
class Supervisor
{
  public:
    explicit Supervisor(ConfigStore& store, SupervisorConfig config = {});
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /// @brief Adds or replaces a server definition and persists the manifest.
    [[nodiscard]] auto upsertDefinition(ServerDefinition definition) -> VoidResult;

    /// @brief Removes a server definition and persists the manifest.
    ///
    /// A running process is left alone and can still be stopped by id.
    /// @return false if no definition with @p id exists.
    [[nodiscard]] auto removeDefinition(std::string_view id) -> bool;

    /// @brief Starts the server @p id.
    ///
    /// Fails with ServerNotFound for unknown ids, InvalidArgument for an empty command,
    /// and LaunchError when the process cannot be spawned or dies within the startup
    /// grace period.
    [[nodiscard]] auto start(std::string_view id) -> Result<ActionOutcome>;

    /// @brief Stops the server @p id, escalating from SIGTERM to SIGKILL.
    ///
    /// Fails with ServerNotRunning (defined id) or ServerNotFound (unknown id) when no
    /// process is held.
    [[nodiscard]] auto stop(std::string_view id) -> Result<ActionOutcome>;

    /// @brief Stops (if running) and starts the server @p id.
    [[nodiscard]] auto restart(std::string_view id) -> Result<ActionOutcome>;

    /// @brief Starts every defined server.
    [[nodiscard]] auto startAll() -> BulkOutcome;

    /// @brief Stops every defined server and every process whose definition was removed.
    [[nodiscard]] auto stopAll() -> BulkOutcome;

    [[nodiscard]] auto status(std::string_view id) const -> ServerRuntimeState;

    /// @brief Returns the state of every defined server, ordered by id.
    [[nodiscard]] auto list() const -> std::vector<ServerRuntimeState>;

    [[nodiscard]] auto manifest() const -> ServerManifest;

    /// @brief Stops every running server, then replaces all definitions and persists the manifest.
    [[nodiscard]] auto replaceManifest(ServerManifest manifest) -> VoidResult;

    /// @brief Returns the manifest with secret-looking environment values masked.
    [[nodiscard]] auto redactedManifest() const -> ServerManifest;

    /// @brief Stops every held process.
    void shutdown();

    /// @brief Number of ids for which a per-id operation lock has been created.
    [[nodiscard]] auto operationLockCount() const -> size_t;

  private:
    [[nodiscard]] auto isKnown(const std::string& id) const -> bool;
    [[nodiscard]] auto operationMutex(std::string_view id) -> std::mutex&;
    [[nodiscard]] auto findProcess(std::string_view id) const -> std::shared_ptr<ChildProcess>;
    [[nodiscard]] auto startLocked(const std::string& id) -> Result<ActionOutcome>;
    [[nodiscard]] auto stopLocked(const std::string& id) -> Result<ActionOutcome>;
    void releaseProcess(const std::string& id, const std::shared_ptr<ChildProcess>& process);

    ConfigStore& _store;
    SupervisorConfig _config;

    // Guards _manifest and _processes. Never held while waiting on a process.
    mutable std::mutex _stateMutex;
    ServerManifest _manifest;
    std::map<std::string, std::shared_ptr<ChildProcess>> _processes;

    // Entries are only created for ids that are defined or held.
    mutable std::mutex _operationsMutex;
    std::map<std::string, std::unique_ptr<std::mutex>, std::less<>> _operationLocks;
};

/// @brief Returns true if an environment variable name looks like it holds a credential.
[[nodiscard]] auto isSecretKey(std::string_view key) -> bool;

} // namespace mcprt
