// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <broadcast/StatusListener.hpp>
#include <core/Error.hpp>
#include <process/Supervisor.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string_view>

namespace mcprt
{

using ListenerId = std::uint64_t;

struct BroadcasterConfig
{
    std::chrono::milliseconds interval { 5000 };
};

/// @brief Periodically pushes the supervisor's server states to subscribed listeners.
///
/// Listeners can also issue commands (refresh, start, stop, restart); state changing
/// commands trigger an immediate broadcast to everyone.
class StatusBroadcaster
{
  public:
    explicit StatusBroadcaster(Supervisor& supervisor, BroadcasterConfig config = {});
    ~StatusBroadcaster();

    StatusBroadcaster(const StatusBroadcaster&) = delete;
    StatusBroadcaster& operator=(const StatusBroadcaster&) = delete;

    /// @brief Adds a listener and sends it an initial snapshot.
    /// @return The id used to unsubscribe and to issue commands.
    [[nodiscard]] auto subscribe(std::shared_ptr<StatusListener> listener) -> ListenerId;

    /// @return false if no listener with @p id is subscribed.
    [[nodiscard]] auto unsubscribe(ListenerId id) -> bool;

    [[nodiscard]] auto listenerCount() const -> size_t;

    /// @brief Handles one command message received from listener @p id.
    ///
    /// Messages that are not valid JSON are logged and ignored.
    void handleCommand(ListenerId id, std::string_view message);

    /// @brief Sends a snapshot to all listeners right away.
    void broadcastNow();

    /// @brief Builds a {"type": "server_status", "timestamp", "servers"} snapshot.
    [[nodiscard]] auto snapshot() const -> nlohmann::json;

    /// @brief Starts the periodic broadcast thread. Does nothing if already running.
    void start();

    /// @brief Stops the periodic broadcast thread.
    void stop();

    [[nodiscard]] auto isRunning() const -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcprt
