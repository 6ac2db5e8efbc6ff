// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <files/FileTools.hpp>
#include <mcp/Dispatcher.hpp>
#include <process/Supervisor.hpp>
#include <store/ContextStore.hpp>

#include <nlohmann/json.hpp>

namespace mcprt
{

/// @brief Serializes the outcome of a process control operation as
/// {"success", "message", "pid"?, "code"?}.
[[nodiscard]] auto outcomeToJson(const Result<ActionOutcome>& outcome) -> nlohmann::json;

/// @brief Serializes the outcome of startAll()/stopAll() as {id: outcome}.
[[nodiscard]] auto outcomeToJson(const BulkOutcome& outcomes) -> nlohmann::json;

/// @brief Registers the supervisor and context store functions with the dispatcher.
///
/// Their descriptors are also stored in @p contexts as the function groups
/// "supervisor" and "context".
void registerBuiltinFunctions(Dispatcher& dispatcher, Supervisor& supervisor, ContextStore& contexts);

/// @brief Registers list_directory, search_files and edit_file as the function group "filesystem".
///
/// @p files must outlive the dispatcher's use of the functions.
void registerFileFunctions(Dispatcher& dispatcher, ContextStore& contexts, const FileTools& files);

} // namespace mcprt
