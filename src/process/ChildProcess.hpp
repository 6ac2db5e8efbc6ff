// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcprt
{

/// @brief Configuration for spawning a supervised child process.
struct ChildProcessConfig
{
    /// Tag used when logging the child's output, usually the server id.
    std::string name;
    std::string command;
    std::vector<std::string> args;
    /// Overlaid onto the parent environment.
    std::map<std::string, std::string> env;
    /// Number of most recent stderr lines kept for diagnostics.
    size_t stderrHistory = 50;
};

/// @brief Looks up an executable the way the platform shell would.
///
/// Commands containing a path separator are checked directly; bare names are searched
/// in PATH (and, on Windows, with each PATHEXT extension).
/// @return The resolved path, or std::nullopt if nothing executable was found.
[[nodiscard]] auto resolveExecutable(std::string_view command) -> std::optional<std::filesystem::path>;

/// @brief Merges the current process environment with @p overrides (overrides win).
[[nodiscard]] auto mergedEnvironment(const std::map<std::string, std::string>& overrides)
    -> std::map<std::string, std::string>;

/// @brief A child process whose stdout and stderr are drained by background reader threads.
///
/// Each output line is logged at debug level, tagged with the configured name and the
/// stream name. Readers end by themselves when the child closes its output (normally on
/// exit). The child's stdin is a pipe kept open for the lifetime of this object.
///
/// Destroying a ChildProcess kills a still running child and joins the readers.
class ChildProcess
{
  public:
    ChildProcess();
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /// @brief Spawns the child process and starts the output readers.
    /// @param config The process configuration.
    /// @return Success or a LaunchError.
    [[nodiscard]] auto start(const ChildProcessConfig& config) -> VoidResult;

    /// @brief Returns the OS process id (or -1 before start()).
    [[nodiscard]] auto pid() const -> int;

    /// @brief Returns true if the child has been started and has not exited yet.
    ///
    /// Reaps the child when it has exited, after which exitCode() is available.
    [[nodiscard]] auto isRunning() -> bool;

    /// @brief Returns the exit code once the child has been reaped.
    ///
    /// A child killed by a signal reports the negated signal number.
    [[nodiscard]] auto exitCode() const -> std::optional<int>;

    /// @brief Asks the child to terminate (SIGTERM to its process group on POSIX).
    [[nodiscard]] auto terminate() -> VoidResult;

    /// @brief Forcefully kills the child (SIGKILL to its process group on POSIX).
    [[nodiscard]] auto kill() -> VoidResult;

    /// @brief Polls for exit until @p timeout elapses.
    /// @param timeout Maximum time to wait.
    /// @param interval Time between liveness checks.
    /// @return true if the child exited within the timeout.
    [[nodiscard]] auto waitForExit(std::chrono::milliseconds timeout,
                                   std::chrono::milliseconds interval = std::chrono::milliseconds(100))
        -> bool;

    /// @brief Blocks until the child exits.
    void wait();

    /// @brief Waits up to @p timeout for both output readers to reach end of stream.
    /// @return true if both readers finished.
    [[nodiscard]] auto waitForReaders(std::chrono::milliseconds timeout) -> bool;

    /// @brief Returns the most recent stderr lines, oldest first.
    [[nodiscard]] auto recentStderr() const -> std::vector<std::string>;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcprt
