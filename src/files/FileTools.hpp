// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string_view>

namespace mcprt
{

/// @brief Directory listing, file search and text replacement below a fixed root directory.
///
/// Every path argument is resolved against the root; relative paths are taken relative
/// to it. Paths that resolve outside the root, including through symbolic links, are
/// rejected with InvalidArgument.
class FileTools
{
  public:
    explicit FileTools(const std::filesystem::path& root);

    [[nodiscard]] auto root() const noexcept -> const std::filesystem::path& { return _root; }

    /// @brief Resolves @p path to a normalized absolute path below the root.
    [[nodiscard]] auto resolve(std::string_view path) const -> Result<std::filesystem::path>;

    /// @brief Lists the entries of a directory.
    /// @return {"success", "path", "directories": [{name, type, path}], "files": [{name, type, path, size}],
    ///          "total_items"}
    [[nodiscard]] auto listDirectory(std::string_view path) const -> Result<nlohmann::json>;

    /// @brief Finds files and directories whose name contains @p pattern, ignoring case.
    /// @return {"success", "path", "pattern", "recursive", "results", "total_matches"}
    [[nodiscard]] auto searchFiles(std::string_view path, std::string_view pattern, bool recursive) const
        -> Result<nlohmann::json>;

    /// @brief Replaces every occurrence of @p oldText in a UTF-8 text file.
    /// @return {"success", "path", "diff", "replacements", "changes": {"old_text", "new_text"}}
    [[nodiscard]] auto editFile(std::string_view path, std::string_view oldText, std::string_view newText) const
        -> Result<nlohmann::json>;

  private:
    std::filesystem::path _root;
};

} // namespace mcprt
