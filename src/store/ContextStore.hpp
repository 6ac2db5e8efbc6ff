// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcprt
{

/// @brief Bookkeeping stored under "_metadata" in every context file.
struct ContextMetadata
{
    std::string id;
    std::string createdAt;
    std::string updatedAt;
};

/// @brief A named, mergeable JSON document.
struct ContextRecord
{
    std::string id;
    nlohmann::json data;
    ContextMetadata metadata;
};

/// @brief Returns true if @p name can be used as a context, function group or schema name.
///
/// Names map to file names, so empty names, "." and "..", and names containing a path
/// separator are rejected.
[[nodiscard]] auto isValidDocumentName(std::string_view name) -> bool;

/// @brief File-backed store for contexts, function groups and schemas.
///
/// Layout under the root directory:
///   contexts/<id>.json     context data plus "_metadata"
///   functions/<name>.json  function descriptors plus "_metadata"
///   schemas/<name>.json    schema documents, stored verbatim
///
/// All methods are safe to call from multiple threads of one process.
/// Multiple writer processes are not supported.
class ContextStore
{
  public:
    /// @brief Opens (and creates, if needed) a store rooted at @p rootDir.
    explicit ContextStore(std::filesystem::path rootDir);

    ContextStore(const ContextStore&) = delete;
    ContextStore& operator=(const ContextStore&) = delete;

    // Contexts

    /// @brief Creates a new context.
    /// @param data Initial data, must be an object.
    /// @param id Context id; a UUID is generated when not given.
    /// @return The id of the created context.
    [[nodiscard]] auto create(nlohmann::json data = nlohmann::json::object(),
                              std::optional<std::string> id = std::nullopt) -> Result<std::string>;

    /// @brief Returns the context data (without metadata), or std::nullopt if unknown.
    [[nodiscard]] auto get(std::string_view id) const -> std::optional<nlohmann::json>;

    /// @brief Returns the context data together with its metadata.
    [[nodiscard]] auto getRecord(std::string_view id) const -> std::optional<ContextRecord>;

    /// @brief Writes context data, creating the context if it does not exist.
    ///
    /// With @p merge the data is deep-merged onto the stored data. Without it the stored
    /// data is replaced, but the creation time is kept.
    /// @return true on success; failures are logged.
    [[nodiscard]] auto save(std::string_view id, const nlohmann::json& data, bool merge = true) -> bool;

    /// @brief Deletes a context. Returns false if it does not exist.
    [[nodiscard]] auto remove(std::string_view id) -> bool;

    /// @brief Returns the ids of all stored contexts, sorted.
    [[nodiscard]] auto list() const -> std::vector<std::string>;

    /// @brief Returns true if a context with @p id exists.
    [[nodiscard]] auto exists(std::string_view id) const -> bool;

    // Function groups

    /// @brief Stores a function group, replacing any previous one of the same name.
    /// @param functions Mapping of function name to descriptor; must be an object.
    [[nodiscard]] auto saveFunctionGroup(std::string_view name, const nlohmann::json& functions) -> bool;

    /// @brief Returns the function descriptors of a group, or std::nullopt if unknown.
    [[nodiscard]] auto getFunctionGroup(std::string_view name) const -> std::optional<nlohmann::json>;

    [[nodiscard]] auto removeFunctionGroup(std::string_view name) -> bool;
    [[nodiscard]] auto listFunctionGroups() const -> std::vector<std::string>;

    // Schemas

    [[nodiscard]] auto saveSchema(std::string_view name, const nlohmann::json& schema) -> bool;
    [[nodiscard]] auto getSchema(std::string_view name) const -> std::optional<nlohmann::json>;
    [[nodiscard]] auto removeSchema(std::string_view name) -> bool;
    [[nodiscard]] auto listSchemas() const -> std::vector<std::string>;

    /// @brief Writes every context, function group and schema into a single document.
    ///
    /// Shape: {"contexts": {...}, "functions": {...}, "schemas": {...}}, each entry holding
    /// the stored document verbatim.
    [[nodiscard]] auto exportAll(const std::filesystem::path& file) const -> bool;

    /// @brief Restores documents written by exportAll().
    /// @param overwrite Replace existing entries; otherwise existing names are skipped.
    [[nodiscard]] auto importAll(const std::filesystem::path& file, bool overwrite = false) -> bool;

    /// @brief Returns the root directory of the store.
    [[nodiscard]] auto rootDir() const -> const std::filesystem::path& { return _rootDir; }

  private:
    enum class Kind
    {
        Context,
        FunctionGroup,
        Schema,
    };

    [[nodiscard]] auto directory(Kind kind) const -> std::filesystem::path;
    [[nodiscard]] auto documentPath(Kind kind, std::string_view name) const
        -> Result<std::filesystem::path>;
    [[nodiscard]] auto readDocument(Kind kind, std::string_view name) const -> std::optional<nlohmann::json>;
    [[nodiscard]] auto writeDocument(Kind kind, std::string_view name, const nlohmann::json& document)
        -> bool;
    [[nodiscard]] auto removeDocument(Kind kind, std::string_view name) -> bool;
    [[nodiscard]] auto listDocuments(Kind kind) const -> std::vector<std::string>;

    std::filesystem::path _rootDir;
    mutable std::mutex _mutex;
};

} // namespace mcprt
