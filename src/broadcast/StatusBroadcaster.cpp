// SPDX-License-Identifier: Apache-2.0
#include "StatusBroadcaster.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Time.hpp>

#include <condition_variable>
#include <format>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace mcprt
{

struct StatusBroadcaster::Impl
{
    Supervisor& supervisor;
    BroadcasterConfig config;

    mutable std::mutex listenersMutex;
    std::map<ListenerId, std::shared_ptr<StatusListener>> listeners;
    ListenerId nextId = 1;

    std::mutex wakeMutex;
    std::condition_variable_any cv;
    std::jthread worker;

    Impl(Supervisor& supervisor, BroadcasterConfig config): supervisor(supervisor), config(config) {}

    auto listener(ListenerId id) const -> std::shared_ptr<StatusListener>
    {
        auto lock = std::lock_guard(listenersMutex);
        auto const it = listeners.find(id);
        return it != listeners.end() ? it->second : nullptr;
    }

    void drop(ListenerId id, const Error& error)
    {
        log::warning("Dropping status listener {}: {}", id, error.message);
        auto lock = std::lock_guard(listenersMutex);
        listeners.erase(id);
    }

    /// Sends to a single listener, dropping it on failure.
    void sendTo(ListenerId id, const nlohmann::json& message)
    {
        auto target = listener(id);
        if (!target)
            return;
        if (auto sent = target->send(message); !sent)
            drop(id, sent.error());
    }

    void run(const std::stop_token& stopToken, StatusBroadcaster& self)
    {
        log::debug("Status broadcaster started (interval {})", config.interval);
        while (true)
        {
            {
                auto lock = std::unique_lock(wakeMutex);
                (void) cv.wait_for(lock, stopToken, config.interval, [] { return false; });
            }
            if (stopToken.stop_requested())
                break;
            self.broadcastNow();
        }
        log::debug("Status broadcaster stopped");
    }
};

StatusBroadcaster::StatusBroadcaster(Supervisor& supervisor, BroadcasterConfig config):
    _impl(std::make_unique<Impl>(supervisor, config))
{
}

StatusBroadcaster::~StatusBroadcaster()
{
    stop();
}

auto StatusBroadcaster::subscribe(std::shared_ptr<StatusListener> listener) -> ListenerId
{
    auto id = ListenerId {};
    {
        auto lock = std::lock_guard(_impl->listenersMutex);
        id = _impl->nextId++;
        _impl->listeners.emplace(id, std::move(listener));
    }
    log::debug("Status listener {} subscribed", id);
    _impl->sendTo(id, snapshot());
    return id;
}

auto StatusBroadcaster::unsubscribe(ListenerId id) -> bool
{
    auto lock = std::lock_guard(_impl->listenersMutex);
    return _impl->listeners.erase(id) > 0;
}

auto StatusBroadcaster::listenerCount() const -> size_t
{
    auto lock = std::lock_guard(_impl->listenersMutex);
    return _impl->listeners.size();
}

auto StatusBroadcaster::snapshot() const -> nlohmann::json
{
    return nlohmann::json {
        { "type", "server_status" },
        { "timestamp", currentTimestamp() },
        { "servers", toJson(_impl->supervisor.list()) },
    };
}

void StatusBroadcaster::broadcastNow()
{
    auto targets = std::vector<std::pair<ListenerId, std::shared_ptr<StatusListener>>> {};
    {
        auto lock = std::lock_guard(_impl->listenersMutex);
        targets.assign(_impl->listeners.begin(), _impl->listeners.end());
    }
    if (targets.empty())
        return;

    auto const message = snapshot();
    for (const auto& [id, target]: targets)
    {
        if (auto sent = target->send(message); !sent)
        {
            log::error("Error broadcasting to listener {}: {}", id, sent.error().message);
            _impl->drop(id, sent.error());
        }
    }
}

void StatusBroadcaster::handleCommand(ListenerId id, std::string_view message)
{
    auto parsed = json::parse(message);
    if (!parsed || !parsed->is_object())
    {
        log::error("Invalid JSON received: {}", message);
        return;
    }

    auto const command = json::getStringOr(*parsed, "command", "");
    if (command == "refresh")
    {
        _impl->sendTo(id, snapshot());
        return;
    }

    auto const serverId = json::getString(*parsed, "server_id");
    auto reply = nlohmann::json {
        { "type", "command_result" },
        { "command", command },
        { "server_id", serverId ? nlohmann::json(*serverId) : nlohmann::json(nullptr) },
    };

    if (command != "start" && command != "stop" && command != "restart")
    {
        reply["success"] = false;
        reply["message"] = std::format("Unknown command: '{}'", command);
        _impl->sendTo(id, reply);
        return;
    }

    if (!serverId)
    {
        reply["success"] = false;
        reply["message"] = std::format("Command '{}' requires a server_id", command);
        _impl->sendTo(id, reply);
        return;
    }

    auto& supervisor = _impl->supervisor;
    auto const outcome = command == "start"  ? supervisor.start(*serverId)
                         : command == "stop" ? supervisor.stop(*serverId)
                                             : supervisor.restart(*serverId);

    reply["success"] = outcome.has_value();
    reply["message"] = outcome ? outcome->message : outcome.error().message;
    _impl->sendTo(id, reply);

    broadcastNow();
}

void StatusBroadcaster::start()
{
    if (_impl->worker.joinable())
        return;
    _impl->worker = std::jthread([this](const std::stop_token& token) { _impl->run(token, *this); });
}

void StatusBroadcaster::stop()
{
    if (!_impl->worker.joinable())
        return;
    _impl->worker.request_stop();
    _impl->cv.notify_all();
    _impl->worker.join();
    _impl->worker = std::jthread {};
}

auto StatusBroadcaster::isRunning() const -> bool
{
    return _impl->worker.joinable();
}

} // namespace mcprt
