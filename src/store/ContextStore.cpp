// SPDX-License-Identifier: Apache-2.0
#include "ContextStore.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Time.hpp>
#include <core/Uuid.hpp>

#include <algorithm>
#include <format>

namespace mcprt
{

namespace
{

    auto const MetadataKey = std::string { "_metadata" };
    constexpr auto FileExtension = std::string_view { ".json" };

    auto kindLabel(std::string_view directoryName) -> std::string_view
    {
        if (directoryName == "contexts")
            return "context";
        if (directoryName == "functions")
            return "function group";
        return "schema";
    }

    /// Splits a stored document into its data and its "_metadata" member.
    auto stripMetadata(nlohmann::json document) -> std::pair<nlohmann::json, nlohmann::json>
    {
        auto metadata = nlohmann::json::object();
        if (document.is_object())
        {
            if (auto it = document.find(MetadataKey); it != document.end())
            {
                if (it->is_object())
                    metadata = *it;
                document.erase(it);
            }
        }
        return { std::move(document), std::move(metadata) };
    }

} // namespace

auto isValidDocumentName(std::string_view name) -> bool
{
    if (name.empty() || name == "." || name == "..")
        return false;
    return std::ranges::none_of(name, [](char c) { return c == '/' || c == '\\' || c == '\0'; });
}

ContextStore::ContextStore(std::filesystem::path rootDir): _rootDir(std::move(rootDir))
{
    for (auto const kind: { Kind::Context, Kind::FunctionGroup, Kind::Schema })
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(directory(kind), ec);
        if (ec)
            log::error("Failed to create directory '{}': {}", directory(kind).string(), ec.message());
    }
    log::debug("Context store opened at {}", _rootDir.string());
}

auto ContextStore::directory(Kind kind) const -> std::filesystem::path
{
    switch (kind)
    {
        case Kind::Context: return _rootDir / "contexts";
        case Kind::FunctionGroup: return _rootDir / "functions";
        case Kind::Schema: return _rootDir / "schemas";
    }
    return _rootDir;
}

auto ContextStore::documentPath(Kind kind, std::string_view name) const -> Result<std::filesystem::path>
{
    if (!isValidDocumentName(name))
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid document name: '{}'", name));
    return directory(kind) / (std::string(name) + std::string(FileExtension));
}

auto ContextStore::readDocument(Kind kind, std::string_view name) const -> std::optional<nlohmann::json>
{
    auto path = documentPath(kind, name);
    if (!path || !std::filesystem::exists(*path))
        return std::nullopt;

    auto document = json::readFile(*path);
    if (!document)
    {
        log::error("Error reading {} {}: {}",
                   kindLabel(directory(kind).filename().string()),
                   name,
                   document.error().message);
        return std::nullopt;
    }
    return std::move(*document);
}

auto ContextStore::writeDocument(Kind kind, std::string_view name, const nlohmann::json& document) -> bool
{
    auto const label = kindLabel(directory(kind).filename().string());

    auto path = documentPath(kind, name);
    if (!path)
    {
        log::error("Error saving {}: {}", label, path.error().message);
        return false;
    }

    if (auto written = json::writeFile(*path, document); !written)
    {
        log::error("Error saving {} {}: {}", label, name, written.error().message);
        return false;
    }

    log::debug("Saved {} {}", label, name);
    return true;
}

auto ContextStore::removeDocument(Kind kind, std::string_view name) -> bool
{
    auto path = documentPath(kind, name);
    if (!path || !std::filesystem::exists(*path))
        return false;

    auto ec = std::error_code {};
    if (!std::filesystem::remove(*path, ec) || ec)
    {
        log::error("Error deleting {} {}: {}", kindLabel(directory(kind).filename().string()), name, ec.message());
        return false;
    }

    log::info("Deleted {} {}", kindLabel(directory(kind).filename().string()), name);
    return true;
}

auto ContextStore::listDocuments(Kind kind) const -> std::vector<std::string>
{
    auto names = std::vector<std::string> {};

    auto ec = std::error_code {};
    for (auto it = std::filesystem::directory_iterator(directory(kind), ec);
         !ec && it != std::filesystem::directory_iterator();
         it.increment(ec))
    {
        auto const& path = it->path();
        if (it->is_regular_file() && path.extension() == FileExtension)
            names.push_back(path.stem().string());
    }

    if (ec)
        log::warning("Failed to list {}: {}", directory(kind).string(), ec.message());

    std::ranges::sort(names);
    return names;
}

// Contexts

auto ContextStore::create(nlohmann::json data, std::optional<std::string> id) -> Result<std::string>
{
    if (data.is_null())
        data = nlohmann::json::object();
    if (!data.is_object())
        return makeError(ErrorCode::InvalidArgument, "Context data must be a JSON object");

    auto contextId = id.value_or(generateUuid());
    if (!isValidDocumentName(contextId))
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid context id: '{}'", contextId));

    auto const now = currentTimestamp();
    data.erase(MetadataKey);
    data[MetadataKey] = nlohmann::json {
        { "created_at", now },
        { "updated_at", now },
        { "id", contextId },
    };

    auto lock = std::lock_guard(_mutex);
    if (!writeDocument(Kind::Context, contextId, data))
        return makeError(ErrorCode::IoError, std::format("Failed to write context {}", contextId));

    log::info("Created new context with ID: {}", contextId);
    return contextId;
}

auto ContextStore::get(std::string_view id) const -> std::optional<nlohmann::json>
{
    auto lock = std::lock_guard(_mutex);
    auto document = readDocument(Kind::Context, id);
    if (!document)
        return std::nullopt;
    return stripMetadata(std::move(*document)).first;
}

auto ContextStore::getRecord(std::string_view id) const -> std::optional<ContextRecord>
{
    auto lock = std::lock_guard(_mutex);
    auto document = readDocument(Kind::Context, id);
    if (!document)
        return std::nullopt;

    auto [data, metadata] = stripMetadata(std::move(*document));
    return ContextRecord {
        .id = std::string(id),
        .data = std::move(data),
        .metadata =
            ContextMetadata {
                .id = json::getStringOr(metadata, "id", id),
                .createdAt = json::getStringOr(metadata, "created_at", ""),
                .updatedAt = json::getStringOr(metadata, "updated_at", ""),
            },
    };
}

auto ContextStore::save(std::string_view id, const nlohmann::json& data, bool merge) -> bool
{
    if (!data.is_object())
    {
        log::error("Error saving context {}: data must be a JSON object", id);
        return false;
    }

    auto lock = std::lock_guard(_mutex);

    auto const now = currentTimestamp();
    auto existing = readDocument(Kind::Context, id);
    auto [document, metadata] =
        existing ? stripMetadata(std::move(*existing))
                 : std::pair { nlohmann::json::object(), nlohmann::json::object() };

    auto overlay = data;
    overlay.erase(MetadataKey);

    if (merge)
        json::deepMerge(document, overlay);
    else
        document = std::move(overlay);

    if (!metadata.contains("created_at"))
        metadata["created_at"] = now;
    metadata["updated_at"] = now;
    metadata["id"] = std::string(id);
    document[MetadataKey] = std::move(metadata);

    if (!writeDocument(Kind::Context, id, document))
        return false;

    log::info("Saved context {}", id);
    return true;
}

auto ContextStore::remove(std::string_view id) -> bool
{
    auto lock = std::lock_guard(_mutex);
    return removeDocument(Kind::Context, id);
}

auto ContextStore::list() const -> std::vector<std::string>
{
    auto lock = std::lock_guard(_mutex);
    return listDocuments(Kind::Context);
}

auto ContextStore::exists(std::string_view id) const -> bool
{
    auto lock = std::lock_guard(_mutex);
    auto path = documentPath(Kind::Context, id);
    return path && std::filesystem::exists(*path);
}

// Function groups

auto ContextStore::saveFunctionGroup(std::string_view name, const nlohmann::json& functions) -> bool
{
    if (!functions.is_object())
    {
        log::error("Error saving function group {}: functions must be a JSON object", name);
        return false;
    }

    auto document = functions;
    document[MetadataKey] = nlohmann::json { { "updated_at", currentTimestamp() } };

    auto lock = std::lock_guard(_mutex);
    if (!writeDocument(Kind::FunctionGroup, name, document))
        return false;

    log::info("Saved function group {}", name);
    return true;
}

auto ContextStore::getFunctionGroup(std::string_view name) const -> std::optional<nlohmann::json>
{
    auto lock = std::lock_guard(_mutex);
    auto document = readDocument(Kind::FunctionGroup, name);
    if (!document)
        return std::nullopt;
    return stripMetadata(std::move(*document)).first;
}

auto ContextStore::removeFunctionGroup(std::string_view name) -> bool
{
    auto lock = std::lock_guard(_mutex);
    return removeDocument(Kind::FunctionGroup, name);
}

auto ContextStore::listFunctionGroups() const -> std::vector<std::string>
{
    auto lock = std::lock_guard(_mutex);
    return listDocuments(Kind::FunctionGroup);
}

// Schemas

auto ContextStore::saveSchema(std::string_view name, const nlohmann::json& schema) -> bool
{
    auto lock = std::lock_guard(_mutex);
    return writeDocument(Kind::Schema, name, schema);
}

auto ContextStore::getSchema(std::string_view name) const -> std::optional<nlohmann::json>
{
    auto lock = std::lock_guard(_mutex);
    return readDocument(Kind::Schema, name);
}

auto ContextStore::removeSchema(std::string_view name) -> bool
{
    auto lock = std::lock_guard(_mutex);
    return removeDocument(Kind::Schema, name);
}

auto ContextStore::listSchemas() const -> std::vector<std::string>
{
    auto lock = std::lock_guard(_mutex);
    return listDocuments(Kind::Schema);
}

// Export / import

auto ContextStore::exportAll(const std::filesystem::path& file) const -> bool
{
    auto lock = std::lock_guard(_mutex);

    auto exportSection = [this](Kind kind) {
        auto section = nlohmann::json::object();
        for (const auto& name: listDocuments(kind))
        {
            if (auto document = readDocument(kind, name))
                section[name] = std::move(*document);
        }
        return section;
    };

    auto const document = nlohmann::json {
        { "contexts", exportSection(Kind::Context) },
        { "functions", exportSection(Kind::FunctionGroup) },
        { "schemas", exportSection(Kind::Schema) },
    };

    if (auto written = json::writeFile(file, document); !written)
    {
        log::error("Error exporting configurations: {}", written.error().message);
        return false;
    }

    log::info("Exported all configurations to {}", file.string());
    return true;
}

auto ContextStore::importAll(const std::filesystem::path& file, bool overwrite) -> bool
{
    if (!std::filesystem::exists(file))
    {
        log::error("Import file not found: {}", file.string());
        return false;
    }

    auto document = json::readFile(file);
    if (!document)
    {
        log::error("Error importing configurations: {}", document.error().message);
        return false;
    }
    if (!document->is_object())
    {
        log::error("Error importing configurations: {} is not a JSON object", file.string());
        return false;
    }

    auto lock = std::lock_guard(_mutex);

    auto success = true;
    auto importSection = [&](std::string_view key, Kind kind) {
        auto const it = document->find(std::string(key));
        if (it == document->end() || !it->is_object())
            return;

        auto const existing = listDocuments(kind);
        for (const auto& [name, entry]: it->items())
        {
            if (!overwrite && std::ranges::binary_search(existing, name))
            {
                log::debug("Skipping existing {} {}", kindLabel(key), name);
                continue;
            }
            if (!writeDocument(kind, name, entry))
                success = false;
        }
    };

    importSection("contexts", Kind::Context);
    importSection("functions", Kind::FunctionGroup);
    importSection("schemas", Kind::Schema);

    log::info("Imported configurations from {}", file.string());
    return success;
}

} // namespace mcprt
