// SPDX-License-Identifier: Apache-2.0
#include "Bindings.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>
#include <string>
#include <tuple>
#include <vector>

namespace mcprt
{

namespace
{

    /// Builds a descriptor in JSON schema style: {description, parameters: {type, properties, required}}.
    auto describe(std::string_view description,
                  nlohmann::json properties = nlohmann::json::object(),
                  std::vector<std::string> required = {}) -> nlohmann::json
    {
        return nlohmann::json {
            { "description", description },
            { "parameters",
              {
                  { "type", "object" },
                  { "properties", std::move(properties) },
                  { "required", std::move(required) },
              } },
        };
    }

    auto stringProperty(std::string_view description) -> nlohmann::json
    {
        return nlohmann::json { { "type", "string" }, { "description", description } };
    }

    auto serverIdProperties() -> nlohmann::json
    {
        return nlohmann::json { { "server_id", stringProperty("Id of the server in the manifest") } };
    }

    auto contextIdProperties() -> nlohmann::json
    {
        return nlohmann::json { { "context_id", stringProperty("Id of the context") } };
    }

    /// Wraps a single-server supervisor operation.
    template <typename Operation>
    auto serverAction(Operation operation) -> SyncFunction
    {
        return [operation](const nlohmann::json& arguments) -> Result<nlohmann::json> {
            auto id = json::getString(arguments, "server_id");
            if (!id)
                return std::unexpected(id.error());

            auto outcome = operation(*id);
            if (!outcome)
                return std::unexpected(outcome.error());
            return outcomeToJson(outcome);
        };
    }

    void registerGroup(Dispatcher& dispatcher,
                       ContextStore& contexts,
                       std::string_view group,
                       std::vector<std::tuple<std::string, FunctionHandler, nlohmann::json>> functions)
    {
        auto descriptors = nlohmann::json::object();
        for (auto& [name, handler, descriptor]: functions)
        {
            descriptors[name] = descriptor;
            dispatcher.registerFunction(name, std::move(handler), std::move(descriptor));
        }

        if (!contexts.saveFunctionGroup(group, descriptors))
            log::warning("Could not store function group '{}'", group);
    }

} // namespace

auto outcomeToJson(const Result<ActionOutcome>& outcome) -> nlohmann::json
{
    if (!outcome)
    {
        return nlohmann::json {
            { "success", false },
            { "message", outcome.error().message },
            { "code", errorCodeName(outcome.error().code) },
        };
    }

    auto result = nlohmann::json {
        { "success", true },
        { "message", outcome->message },
    };
    if (outcome->pid)
        result["pid"] = *outcome->pid;
    return result;
}

auto outcomeToJson(const BulkOutcome& outcomes) -> nlohmann::json
{
    auto result = nlohmann::json::object();
    for (const auto& [id, outcome]: outcomes)
        result[id] = outcomeToJson(outcome);
    return result;
}

void registerBuiltinFunctions(Dispatcher& dispatcher, Supervisor& supervisor, ContextStore& contexts)
{
    registerGroup(
        dispatcher,
        contexts,
        "supervisor",
        {
            { "list_servers",
              SyncFunction { [&supervisor](const nlohmann::json&) -> Result<nlohmann::json> {
                  return toJson(supervisor.list());
              } },
              describe("List all configured MCP servers with their runtime state") },
            { "server_status",
              SyncFunction { [&supervisor](const nlohmann::json& arguments) -> Result<nlohmann::json> {
                  auto id = json::getString(arguments, "server_id");
                  if (!id)
                      return std::unexpected(id.error());
                  return toJson(supervisor.status(*id));
              } },
              describe("Get the runtime state of one server", serverIdProperties(), { "server_id" }) },
            { "start_server",
              serverAction([&supervisor](const std::string& id) { return supervisor.start(id); }),
              describe("Start a configured server", serverIdProperties(), { "server_id" }) },
            { "stop_server",
              serverAction([&supervisor](const std::string& id) { return supervisor.stop(id); }),
              describe("Stop a running server", serverIdProperties(), { "server_id" }) },
            { "restart_server",
              serverAction([&supervisor](const std::string& id) { return supervisor.restart(id); }),
              describe("Restart a server", serverIdProperties(), { "server_id" }) },
            { "start_all_servers",
              SyncFunction { [&supervisor](const nlohmann::json&) -> Result<nlohmann::json> {
                  return outcomeToJson(supervisor.startAll());
              } },
              describe("Start every configured server") },
            { "stop_all_servers",
              SyncFunction { [&supervisor](const nlohmann::json&) -> Result<nlohmann::json> {
                  return outcomeToJson(supervisor.stopAll());
              } },
              describe("Stop every running server") },
        });

    registerGroup(
        dispatcher,
        contexts,
        "context",
        {
            { "create_context",
              SyncFunction { [&contexts](const nlohmann::json& arguments) -> Result<nlohmann::json> {
                  auto data = arguments.value("data", nlohmann::json::object());
                  auto id = std::optional<std::string> {};
                  if (auto const given = json::getStringOr(arguments, "context_id", ""); !given.empty())
                      id = given;

                  auto created = contexts.create(std::move(data), std::move(id));
                  if (!created)
                      return std::unexpected(created.error());
                  return nlohmann::json { { "context_id", *created } };
              } },
              describe("Create a new context",
                       nlohmann::json {
                           { "context_id", stringProperty("Id to use; generated when omitted") },
                           { "data", { { "type", "object" }, { "description", "Initial context data" } } },
                       }) },
            { "get_context",
              SyncFunction { [&contexts](const nlohmann::json& arguments) -> Result<nlohmann::json> {
                  auto id = json::getString(arguments, "context_id");
                  if (!id)
                      return std::unexpected(id.error());

                  auto data = contexts.get(*id);
                  if (!data)
                      return makeError(ErrorCode::NotFound, std::format("Context '{}' not found", *id));
                  return std::move(*data);
              } },
              describe("Get the data of a context", contextIdProperties(), { "context_id" }) },
            { "save_context",
              SyncFunction { [&contexts](const nlohmann::json& arguments) -> Result<nlohmann::json> {
                  auto id = json::getString(arguments, "context_id");
                  if (!id)
                      return std::unexpected(id.error());

                  auto const saved = contexts.save(*id,
                                                   arguments.value("data", nlohmann::json::object()),
                                                   json::getBoolOr(arguments, "merge", true));
                  return nlohmann::json { { "success", saved } };
              } },
              describe("Write context data, deep-merging unless merge is false",
                       nlohmann::json {
                           { "context_id", stringProperty("Id of the context") },
                           { "data", { { "type", "object" }, { "description", "Data to write" } } },
                           { "merge", { { "type", "boolean" }, { "description", "Merge with stored data" } } },
                       },
                       { "context_id", "data" }) },
            { "delete_context",
              SyncFunction { [&contexts](const nlohmann::json& arguments) -> Result<nlohmann::json> {
                  auto id = json::getString(arguments, "context_id");
                  if (!id)
                      return std::unexpected(id.error());
                  return nlohmann::json { { "success", contexts.remove(*id) } };
              } },
              describe("Delete a context", contextIdProperties(), { "context_id" }) },
            { "list_contexts",
              SyncFunction { [&contexts](const nlohmann::json&) -> Result<nlohmann::json> {
                  return nlohmann::json(contexts.list());
              } },
              describe("List the ids of all contexts") },
            { "list_function_groups",
              SyncFunction { [&contexts](const nlohmann::json&) -> Result<nlohmann::json> {
                  return nlohmann::json(contexts.listFunctionGroups());
              } },
              describe("List the names of all function groups") },
            { "get_function_group",
              SyncFunction { [&contexts](const nlohmann::json& arguments) -> Result<nlohmann::json> {
                  auto name = json::getString(arguments, "name");
                  if (!name)
                      return std::unexpected(name.error());

                  auto group = contexts.getFunctionGroup(*name);
                  if (!group)
                      return makeError(ErrorCode::NotFound, std::format("Function group '{}' not found", *name));
                  return std::move(*group);
              } },
              describe("Get the function descriptors of a group",
                       nlohmann::json { { "name", stringProperty("Name of the function group") } },
                       { "name" }) },
        });
}

void registerFileFunctions(Dispatcher& dispatcher, ContextStore& contexts, const FileTools& files)
{
    registerGroup(
        dispatcher,
        contexts,
        "filesystem",
        {
            { "list_directory",
              SyncFunction { [&files](const nlohmann::json& arguments) -> Result<nlohmann::json> {
                  auto path = json::getString(arguments, "path");
                  if (!path)
                      return std::unexpected(path.error());
                  return files.listDirectory(*path);
              } },
              describe("List the files and directories of a directory",
                       nlohmann::json { { "path", stringProperty("Directory to list") } },
                       { "path" }) },
            { "search_files",
              SyncFunction { [&files](const nlohmann::json& arguments) -> Result<nlohmann::json> {
                  auto path = json::getString(arguments, "path");
                  if (!path)
                      return std::unexpected(path.error());
                  auto pattern = json::getString(arguments, "pattern");
                  if (!pattern)
                      return std::unexpected(pattern.error());
                  return files.searchFiles(*path, *pattern, json::getBoolOr(arguments, "recursive", true));
              } },
              describe("Find files and directories whose name contains a pattern, ignoring case",
                       nlohmann::json {
                           { "path", stringProperty("Directory to start the search in") },
                           { "pattern", stringProperty("Text the name must contain") },
                           { "recursive", { { "type", "boolean" }, { "description", "Descend into subdirectories" } } },
                       },
                       { "path", "pattern" }) },
            { "edit_file",
              SyncFunction { [&files](const nlohmann::json& arguments) -> Result<nlohmann::json> {
                  auto path = json::getString(arguments, "path");
                  if (!path)
                      return std::unexpected(path.error());
                  auto oldText = json::getString(arguments, "old_text");
                  if (!oldText)
                      return std::unexpected(oldText.error());
                  auto newText = json::getString(arguments, "new_text");
                  if (!newText)
                      return std::unexpected(newText.error());
                  return files.editFile(*path, *oldText, *newText);
              } },
              describe("Replace text in a file and return the resulting diff",
                       nlohmann::json {
                           { "path", stringProperty("File to edit") },
                           { "old_text", stringProperty("Text to replace; every occurrence is replaced") },
                           { "new_text", stringProperty("Replacement text") },
                       },
                       { "path", "old_text", "new_text" }) },
        });
}

} // namespace mcprt
