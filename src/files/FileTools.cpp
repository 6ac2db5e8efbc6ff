// SPDX-License-Identifier: Apache-2.0
#include "FileTools.hpp"

#include <core/Log.hpp>
#include <files/TextDiff.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace mcprt
{

namespace fs = std::filesystem;

namespace
{

    auto lowercase(std::string_view text) -> std::string
    {
        auto result = std::string(text);
        std::ranges::transform(
            result, result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    auto isValidUtf8(std::string_view text) -> bool
    {
        auto remaining = 0;
        for (auto const ch: text)
        {
            auto const c = static_cast<unsigned char>(ch);
            if (remaining > 0)
            {
                if ((c & 0xC0) != 0x80)
                    return false;
                --remaining;
            }
            else if ((c & 0x80) == 0)
                continue;
            else if ((c & 0xE0) == 0xC0)
                remaining = 1;
            else if ((c & 0xF0) == 0xE0)
                remaining = 2;
            else if ((c & 0xF8) == 0xF0)
                remaining = 3;
            else
                return false;
        }
        return remaining == 0;
    }

    auto fileEntry(const fs::directory_entry& entry) -> nlohmann::json
    {
        auto ec = std::error_code {};
        auto const size = entry.file_size(ec);
        return nlohmann::json {
            { "name", entry.path().filename().string() },
            { "type", "file" },
            { "path", entry.path().generic_string() },
            { "size", ec ? 0 : size },
        };
    }

    auto directoryEntry(const fs::directory_entry& entry) -> nlohmann::json
    {
        return nlohmann::json {
            { "name", entry.path().filename().string() },
            { "type", "directory" },
            { "path", entry.path().generic_string() },
        };
    }

    auto entryJson(const fs::directory_entry& entry) -> nlohmann::json
    {
        auto ec = std::error_code {};
        return entry.is_directory(ec) ? directoryEntry(entry) : fileEntry(entry);
    }

    auto byPath(const nlohmann::json& a, const nlohmann::json& b) -> bool
    {
        return a["path"].get<std::string>() < b["path"].get<std::string>();
    }

} // namespace

FileTools::FileTools(const fs::path& root)
{
    auto ec = std::error_code {};
    _root = fs::weakly_canonical(fs::absolute(root, ec), ec);
    if (ec)
    {
        log::warning("Cannot resolve file root '{}': {}", root.string(), ec.message());
        _root = root.lexically_normal();
    }
    log::debug("Filesystem functions are confined to {}", _root.string());
}

auto FileTools::resolve(std::string_view path) const -> Result<fs::path>
{
    if (path.empty())
        return makeError(ErrorCode::InvalidArgument, "Path must not be empty");

    auto candidate = fs::path(std::string(path));
    if (candidate.is_relative())
        candidate = _root / candidate;

    auto ec = std::error_code {};
    auto resolved = fs::weakly_canonical(candidate, ec);
    if (ec)
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid path '{}': {}", path, ec.message()));

    auto const relative = resolved.lexically_relative(_root);
    if (relative.empty() || *relative.begin() == "..")
        return makeError(ErrorCode::InvalidArgument, std::format("Path is outside of {}: {}", _root.string(), path));

    return resolved;
}

auto FileTools::listDirectory(std::string_view path) const -> Result<nlohmann::json>
{
    auto directory = resolve(path);
    if (!directory)
        return std::unexpected(directory.error());

    auto ec = std::error_code {};
    if (!fs::exists(*directory, ec))
        return makeError(ErrorCode::NotFound, std::format("Path not found: {}", path));
    if (!fs::is_directory(*directory, ec))
        return makeError(ErrorCode::InvalidArgument, std::format("Not a directory: {}", path));

    auto directories = nlohmann::json::array();
    auto files = nlohmann::json::array();
    auto it = fs::directory_iterator(*directory, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec))
    {
        auto entry = entryJson(*it);
        if (entry["type"] == "directory")
            directories.push_back(std::move(entry));
        else
            files.push_back(std::move(entry));
    }
    if (ec)
        return makeError(ErrorCode::IoError, std::format("Cannot list {}: {}", path, ec.message()));

    std::sort(directories.begin(), directories.end(), byPath);
    std::sort(files.begin(), files.end(), byPath);

    auto const total = directories.size() + files.size();
    return nlohmann::json {
        { "success", true },
        { "path", directory->generic_string() },
        { "directories", std::move(directories) },
        { "files", std::move(files) },
        { "total_items", total },
    };
}

auto FileTools::searchFiles(std::string_view path, std::string_view pattern, bool recursive) const
    -> Result<nlohmann::json>
{
    auto directory = resolve(path);
    if (!directory)
        return std::unexpected(directory.error());

    auto ec = std::error_code {};
    if (!fs::exists(*directory, ec))
        return makeError(ErrorCode::NotFound, std::format("Path not found: {}", path));
    if (!fs::is_directory(*directory, ec))
        return makeError(ErrorCode::InvalidArgument, std::format("Not a directory: {}", path));

    auto const needle = lowercase(pattern);
    auto results = nlohmann::json::array();
    auto const collect = [&](const fs::directory_entry& entry) {
        if (lowercase(entry.path().filename().string()).contains(needle))
            results.push_back(entryJson(entry));
    };

    if (recursive)
    {
        auto it = fs::recursive_directory_iterator(*directory, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
            collect(*it);
    }
    else
    {
        auto it = fs::directory_iterator(*directory, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec))
            collect(*it);
    }
    if (ec)
        return makeError(ErrorCode::IoError, std::format("Cannot search {}: {}", path, ec.message()));

    std::sort(results.begin(), results.end(), byPath);

    auto const total = results.size();
    return nlohmann::json {
        { "success", true },
        { "path", directory->generic_string() },
        { "pattern", needle },
        { "recursive", recursive },
        { "results", std::move(results) },
        { "total_matches", total },
    };
}

auto FileTools::editFile(std::string_view path, std::string_view oldText, std::string_view newText) const
    -> Result<nlohmann::json>
{
    if (oldText.empty())
        return makeError(ErrorCode::InvalidArgument, "Text to replace must not be empty");

    auto file = resolve(path);
    if (!file)
        return std::unexpected(file.error());

    auto ec = std::error_code {};
    if (!fs::exists(*file, ec))
        return makeError(ErrorCode::NotFound, std::format("File not found: {}", path));
    if (!fs::is_regular_file(*file, ec))
        return makeError(ErrorCode::InvalidArgument, std::format("Not a file: {}", path));

    auto content = std::string {};
    {
        auto in = std::ifstream(*file, std::ios::binary);
        if (!in)
            return makeError(ErrorCode::IoError, std::format("Cannot open file: {}", path));
        auto ss = std::stringstream {};
        ss << in.rdbuf();
        content = ss.str();
    }

    if (!isValidUtf8(content))
        return makeError(ErrorCode::InvalidArgument, std::format("Not a text file: {}", path));

    auto edited = std::string {};
    auto replacements = size_t { 0 };
    for (auto pos = size_t { 0 };;)
    {
        auto const found = content.find(oldText, pos);
        if (found == std::string::npos)
        {
            edited.append(content, pos);
            break;
        }
        edited.append(content, pos, found - pos);
        edited.append(newText);
        pos = found + oldText.size();
        ++replacements;
    }

    if (replacements == 0)
        return makeError(ErrorCode::NotFound, "Text to replace not found in file");

    auto const name = file->filename().string();
    auto diff = unifiedDiff(content, edited, "a/" + name, "b/" + name);

    {
        auto out = std::ofstream(*file, std::ios::binary | std::ios::trunc);
        out << edited;
        if (!out.good())
            return makeError(ErrorCode::IoError, std::format("Cannot write file: {}", path));
    }

    log::info("Edited {} ({} replacement(s))", file->string(), replacements);
    return nlohmann::json {
        { "success", true },
        { "path", file->generic_string() },
        { "diff", std::move(diff) },
        { "replacements", replacements },
        { "changes", { { "old_text", oldText }, { "new_text", newText } } },
    };
}

} // namespace mcprt
