// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>

namespace mcprt
{

namespace
{

    // Durations above one day are clamped; seconds * 1000 then always fits into milliseconds.
    constexpr auto MaxDuration = std::chrono::milliseconds(std::chrono::hours(24));
    constexpr auto MinPollInterval = std::chrono::milliseconds(10);
    constexpr auto MinBroadcastInterval = std::chrono::milliseconds(100);

    auto secondsOr(const nlohmann::json& obj,
                   std::string_view key,
                   std::chrono::milliseconds defaultValue,
                   std::chrono::milliseconds minimum = std::chrono::milliseconds(0)) -> std::chrono::milliseconds
    {
        auto const seconds = json::getDoubleOr(obj, key, static_cast<double>(defaultValue.count()) / 1000.0);
        if (!std::isfinite(seconds) || seconds < 0)
        {
            log::warning("Ignoring invalid value for '{}'", key);
            return defaultValue;
        }

        auto const maxSeconds = static_cast<double>(MaxDuration.count()) / 1000.0;
        if (seconds > maxSeconds)
        {
            log::warning("Value of '{}' is too large, using {}", key, MaxDuration);
            return MaxDuration;
        }

        auto const value = std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000.0));
        if (value < minimum)
        {
            log::warning("Value of '{}' is too small, using {}", key, minimum);
            return minimum;
        }
        return value;
    }

    auto toSeconds(std::chrono::milliseconds value) -> double
    {
        return static_cast<double>(value.count()) / 1000.0;
    }

    auto sizeOr(const nlohmann::json& obj, std::string_view key, size_t defaultValue) -> size_t
    {
        return static_cast<size_t>(std::max(0, json::getIntOr(obj, key, static_cast<int>(defaultValue))));
    }

} // namespace

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\mcprt";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/mcprt";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/mcprt";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcprt";
    return ".";
#endif
}

auto defaultDataDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\mcprt\\data";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/mcprt/data";
    return ".";
#else
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData)
        return std::string(xdgData) + "/mcprt";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/mcprt";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return (std::filesystem::path(defaultConfigDir()) / "config.json").string();
}

void applyDefaultPaths(AppConfig& config)
{
    if (config.storage.manifestPath.empty())
        config.storage.manifestPath = (std::filesystem::path(defaultConfigDir()) / "mcp_servers.json").string();
    if (config.storage.contextDir.empty())
        config.storage.contextDir = defaultDataDir();
    if (config.storage.fileRoot.empty())
    {
        auto ec = std::error_code {};
        auto const cwd = std::filesystem::current_path(ec);
        config.storage.fileRoot = ec ? std::string(".") : cwd.string();
    }
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto document = json::readFile(std::filesystem::path(path));
    if (!document)
    {
        if (document.error().code == ErrorCode::IoError)
            return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));
        return std::unexpected(document.error());
    }

    auto const& root = *document;
    auto config = AppConfig {};

    // Storage section
    if (root.contains("storage"))
    {
        auto const& storage = root["storage"];
        config.storage.manifestPath = json::getStringOr(storage, "manifestPath", "");
        config.storage.contextDir = json::getStringOr(storage, "contextDir", "");
        config.storage.fileRoot = json::getStringOr(storage, "fileRoot", "");
    }

    // Supervisor section
    if (root.contains("supervisor"))
    {
        auto const& supervisor = root["supervisor"];
        config.supervisor.startupGrace =
            secondsOr(supervisor, "startupGraceSeconds", config.supervisor.startupGrace);
        config.supervisor.stopTimeout = secondsOr(supervisor, "stopTimeoutSeconds", config.supervisor.stopTimeout);
        config.supervisor.pollInterval =
            secondsOr(supervisor, "pollIntervalSeconds", config.supervisor.pollInterval, MinPollInterval);
        config.supervisor.stderrLines = sizeOr(supervisor, "stderrLines", config.supervisor.stderrLines);
    }

    // Dispatcher section
    if (root.contains("dispatcher"))
    {
        auto const& dispatcher = root["dispatcher"];
        config.dispatcher.workerThreads = sizeOr(dispatcher, "workerThreads", config.dispatcher.workerThreads);
        config.dispatcher.queueLimit = sizeOr(dispatcher, "queueLimit", config.dispatcher.queueLimit);
    }

    // Broadcaster section
    if (root.contains("broadcaster"))
        config.broadcaster.interval =
            secondsOr(root["broadcaster"], "intervalSeconds", config.broadcaster.interval, MinBroadcastInterval);

    config.logLevel = json::getStringOr(root, "logLevel", config.logLevel);
    if (!log::levelFromString(config.logLevel))
        log::warning("Unknown log level '{}' in {}", config.logLevel, path);

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    // Storage section
    auto storage = nlohmann::json::object();
    if (!config.storage.manifestPath.empty())
        storage["manifestPath"] = config.storage.manifestPath;
    if (!config.storage.contextDir.empty())
        storage["contextDir"] = config.storage.contextDir;
    if (!config.storage.fileRoot.empty())
        storage["fileRoot"] = config.storage.fileRoot;
    root["storage"] = std::move(storage);

    root["supervisor"] = nlohmann::json {
        { "startupGraceSeconds", toSeconds(config.supervisor.startupGrace) },
        { "stopTimeoutSeconds", toSeconds(config.supervisor.stopTimeout) },
        { "pollIntervalSeconds", toSeconds(config.supervisor.pollInterval) },
        { "stderrLines", config.supervisor.stderrLines },
    };

    root["dispatcher"] = nlohmann::json {
        { "workerThreads", config.dispatcher.workerThreads },
        { "queueLimit", config.dispatcher.queueLimit },
    };

    root["broadcaster"] = nlohmann::json { { "intervalSeconds", toSeconds(config.broadcaster.interval) } };
    root["logLevel"] = config.logLevel;

    if (auto written = json::writeFile(std::filesystem::path(path), root); !written)
        return makeError(ErrorCode::ConfigError, written.error().message);
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::debug("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace mcprt
