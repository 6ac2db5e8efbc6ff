// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace mcprt
{

/// @brief Builds the example manifest written when no manifest file exists yet.
[[nodiscard]] auto defaultManifest() -> ServerManifest;

/// @brief Parses a manifest document of the shape {"mcpServers": {"<id>": {...}}}.
/// @param root The manifest document.
/// @return The manifest, or a ConfigError if "mcpServers" is missing or not an object.
[[nodiscard]] auto manifestFromJson(const nlohmann::json& root) -> Result<ServerManifest>;

/// @brief Serializes a manifest to its on-disk JSON shape.
[[nodiscard]] auto manifestToJson(const ServerManifest& manifest) -> nlohmann::json;

/// @brief Serializes a single server definition (without its id).
[[nodiscard]] auto definitionToJson(const ServerDefinition& definition) -> nlohmann::json;

/// @brief Loads and persists the server manifest file.
///
/// The store assumes a single writer process; the whole file is rewritten on every save.
class ConfigStore
{
  public:
    /// @brief Constructs a store backed by the given manifest path.
    explicit ConfigStore(std::filesystem::path path);

    /// @brief Loads the manifest.
    ///
    /// A missing file is created with the example manifest, which is returned.
    /// An unreadable or malformed file is logged and yields an empty manifest;
    /// the file itself is left untouched.
    [[nodiscard]] auto load() -> ServerManifest;

    /// @brief Writes the whole manifest to disk.
    [[nodiscard]] auto save(const ServerManifest& manifest) -> VoidResult;

    /// @brief Returns the manifest file path.
    [[nodiscard]] auto path() const -> const std::filesystem::path& { return _path; }

  private:
    std::filesystem::path _path;
};

} // namespace mcprt
