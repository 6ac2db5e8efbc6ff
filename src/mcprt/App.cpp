// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/Bindings.hpp>
#include <mcp/Protocol.hpp>
#include <store/ConfigStore.hpp>

#include <string>

namespace mcprt
{

namespace
{

    auto trimmed(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    void deliver(StatusListener& listener, const nlohmann::json& reply)
    {
        if (auto sent = listener.send(reply); !sent)
            log::error("Failed to write reply: {}", sent.error().message);
    }

    auto prepared(AppConfig config) -> AppConfig
    {
        applyDefaultPaths(config);
        if (auto const level = log::levelFromString(config.logLevel))
            log::setLevel(*level);
        return config;
    }

} // namespace

// Members are destroyed in reverse order: broadcaster, dispatcher, supervisor, file tools, stores.
struct App::Impl
{
    AppConfig config;
    ConfigStore manifestStore;
    ContextStore contexts;
    FileTools files;
    Supervisor supervisor;
    Dispatcher dispatcher;
    StatusBroadcaster broadcaster;

    explicit Impl(AppConfig cfg):
        config(prepared(std::move(cfg))),
        manifestStore(config.storage.manifestPath),
        contexts(config.storage.contextDir),
        files(config.storage.fileRoot),
        supervisor(manifestStore, config.supervisor),
        dispatcher(contexts, config.dispatcher),
        broadcaster(supervisor, config.broadcaster)
    {
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
    registerBuiltinFunctions(_impl->dispatcher, _impl->supervisor, _impl->contexts);
    registerFileFunctions(_impl->dispatcher, _impl->contexts, _impl->files);
    log::debug("Manifest: {}, context store: {}", _impl->config.storage.manifestPath, _impl->config.storage.contextDir);
}

App::~App()
{
    shutdown();
}

auto App::config() const -> const AppConfig&
{
    return _impl->config;
}

auto App::supervisor() -> Supervisor&
{
    return _impl->supervisor;
}

auto App::contexts() -> ContextStore&
{
    return _impl->contexts;
}

auto App::dispatcher() -> Dispatcher&
{
    return _impl->dispatcher;
}

auto App::broadcaster() -> StatusBroadcaster&
{
    return _impl->broadcaster;
}

void App::handleLine(ListenerId listenerId, std::shared_ptr<StatusListener> listener, std::string_view line)
{
    line = trimmed(line);
    if (line.empty())
        return;

    auto message = json::parse(line);
    if (!message)
    {
        log::error("Invalid JSON received: {}", line);
        deliver(*listener, protocol::makeErrorEnvelope(message.error().message, "mcp_processing_error", std::nullopt));
        return;
    }

    if (message->is_object() && message->contains("command"))
    {
        _impl->broadcaster.handleCommand(listenerId, line);
        return;
    }

    _impl->dispatcher.dispatch(*message, [listener](nlohmann::json reply) { deliver(*listener, reply); });
}

auto App::serve(std::istream& in, std::ostream& out, const std::atomic<bool>& stopRequested) -> int
{
    for (const auto& [id, outcome]: _impl->supervisor.startAll())
    {
        if (outcome)
            log::info("MCP server '{}': {}", id, outcome->message);
        else
            log::warning("MCP server '{}': {}", id, outcome.error().message);
    }

    auto listener = std::make_shared<StreamListener>(out);
    auto const listenerId = _impl->broadcaster.subscribe(listener);
    _impl->broadcaster.start();

    log::info("Serving control channel on stdin/stdout");

    auto line = std::string {};
    while (!stopRequested.load() && std::getline(in, line))
        handleLine(listenerId, listener, line);

    log::info("Shutting down");
    if (!_impl->broadcaster.unsubscribe(listenerId))
        log::debug("Output listener was already dropped");
    shutdown();
    return 0;
}

void App::shutdown()
{
    _impl->broadcaster.stop();
    _impl->dispatcher.shutdown();
    _impl->supervisor.shutdown();
}

} // namespace mcprt
