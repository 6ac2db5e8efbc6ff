// SPDX-License-Identifier: Apache-2.0
#include "ConfigStore.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>

namespace mcprt
{

auto defaultManifest() -> ServerManifest
{
    auto manifest = ServerManifest {};
    manifest["example"] = ServerDefinition {
        .id = "example",
        .command = "npx",
        .args = { "-y", "@modelcontextprotocol/server-memory" },
        .env = {},
    };
    return manifest;
}

auto manifestFromJson(const nlohmann::json& root) -> Result<ServerManifest>
{
    if (!root.is_object() || !root.contains("mcpServers") || !root["mcpServers"].is_object())
        return makeError(ErrorCode::ConfigError, "Manifest has no \"mcpServers\" object");

    auto manifest = ServerManifest {};
    for (const auto& [id, serverJson]: root["mcpServers"].items())
    {
        if (!serverJson.is_object())
        {
            log::warning("Skipping server '{}': definition is not an object", id);
            continue;
        }

        manifest[id] = ServerDefinition {
            .id = id,
            .command = json::getStringOr(serverJson, "command", ""),
            .args = json::getStringList(serverJson, "args"),
            .env = json::getStringMap(serverJson, "env"),
        };
    }
    return manifest;
}

auto definitionToJson(const ServerDefinition& definition) -> nlohmann::json
{
    auto env = nlohmann::json::object();
    for (const auto& [key, value]: definition.env)
        env[key] = value;

    return nlohmann::json {
        { "command", definition.command },
        { "args", definition.args },
        { "env", std::move(env) },
    };
}

auto manifestToJson(const ServerManifest& manifest) -> nlohmann::json
{
    auto servers = nlohmann::json::object();
    for (const auto& [id, definition]: manifest)
        servers[id] = definitionToJson(definition);

    return nlohmann::json { { "mcpServers", std::move(servers) } };
}

ConfigStore::ConfigStore(std::filesystem::path path): _path(std::move(path))
{
}

auto ConfigStore::load() -> ServerManifest
{
    if (!std::filesystem::exists(_path))
    {
        log::info("No MCP manifest found at {}, writing example manifest", _path.string());
        auto manifest = defaultManifest();
        if (auto saved = save(manifest); !saved)
            log::error("Failed to write example manifest: {}", saved.error().message);
        return manifest;
    }

    auto document = json::readFile(_path);
    if (!document)
    {
        log::error("Error loading MCP manifest {}: {}", _path.string(), document.error().message);
        return {};
    }

    auto manifest = manifestFromJson(*document);
    if (!manifest)
    {
        log::error("Error loading MCP manifest {}: {}", _path.string(), manifest.error().message);
        return {};
    }

    log::debug("Loaded {} server definition(s) from {}", manifest->size(), _path.string());
    return std::move(*manifest);
}

auto ConfigStore::save(const ServerManifest& manifest) -> VoidResult
{
    auto result = json::writeFile(_path, manifestToJson(manifest));
    if (!result)
        return makeError(ErrorCode::ConfigError,
                         std::format("Error saving MCP manifest: {}", result.error().message));
    return {};
}

} // namespace mcprt
