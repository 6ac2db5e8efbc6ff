// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <broadcast/StatusBroadcaster.hpp>
#include <core/Error.hpp>
#include <mcp/Dispatcher.hpp>
#include <mcprt/Config.hpp>
#include <process/Supervisor.hpp>
#include <store/ContextStore.hpp>

#include <atomic>
#include <istream>
#include <memory>
#include <ostream>
#include <string_view>

namespace mcprt
{

/// @brief Owns and wires the stores, the supervisor, the dispatcher and the broadcaster.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    ///
    /// Opens the stores, loads the manifest and registers the built-in functions.
    /// No server is started.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    [[nodiscard]] auto config() const -> const AppConfig&;
    [[nodiscard]] auto supervisor() -> Supervisor&;
    [[nodiscard]] auto contexts() -> ContextStore&;
    [[nodiscard]] auto dispatcher() -> Dispatcher&;
    [[nodiscard]] auto broadcaster() -> StatusBroadcaster&;

    /// @brief Runs the line-delimited JSON control channel.
    ///
    /// Starts every server, subscribes @p out to status broadcasts and processes one
    /// message per input line: objects with a "command" member are broadcaster
    /// commands, everything else is a dispatcher envelope. Returns when @p in ends
    /// or @p stopRequested is set, after shutting everything down.
    /// @return Process exit code.
    [[nodiscard]] auto serve(std::istream& in, std::ostream& out, const std::atomic<bool>& stopRequested) -> int;

    /// @brief Processes a single input line of the control channel, writing replies to @p listener.
    ///
    /// Function calls are answered once they finish, possibly from a worker thread and
    /// after replies to later lines.
    void handleLine(ListenerId listenerId, std::shared_ptr<StatusListener> listener, std::string_view line);

    /// @brief Stops broadcasting, drains the dispatcher and stops every server.
    void shutdown();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcprt
