// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcprt
{

/// @brief Launch description of one MCP server, as stored in the manifest.
struct ServerDefinition
{
    std::string id;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

/// @brief All server definitions, keyed by server id.
using ServerManifest = std::map<std::string, ServerDefinition>;

/// @brief Point-in-time view of a server, derived at query time.
struct ServerRuntimeState
{
    std::string id;
    bool exists = false;
    bool running = false;
    std::optional<int> pid;
    std::string command;
    std::vector<std::string> args;
};

/// @brief Successful outcome of a process control operation.
struct ActionOutcome
{
    std::string message;
    std::optional<int> pid;
};

/// @brief Serializes a runtime state into its status-snapshot JSON shape.
[[nodiscard]] inline auto toJson(const ServerRuntimeState& state) -> nlohmann::json
{
    return nlohmann::json {
        { "id", state.id },
        { "exists", state.exists },
        { "running", state.running },
        { "pid", state.pid ? nlohmann::json(*state.pid) : nlohmann::json(nullptr) },
        { "command", state.command },
        { "args", state.args },
    };
}

/// @brief Serializes a list of runtime states into a JSON array.
[[nodiscard]] inline auto toJson(const std::vector<ServerRuntimeState>& states) -> nlohmann::json
{
    auto array = nlohmann::json::array();
    for (const auto& state: states)
        array.push_back(toJson(state));
    return array;
}

} // namespace mcprt
