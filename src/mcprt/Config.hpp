// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <broadcast/StatusBroadcaster.hpp>
#include <core/Error.hpp>
#include <mcp/Dispatcher.hpp>
#include <process/Supervisor.hpp>

#include <string>
#include <string_view>

namespace mcprt
{

/// @brief Storage locations section.
struct StorageConfig
{
    /// Path of the server manifest. Defaults to <config dir>/mcp_servers.json.
    std::string manifestPath;

    /// Root directory of the context store. Defaults to the platform data directory.
    std::string contextDir;

    /// Directory the filesystem functions are confined to. Defaults to the working directory.
    std::string fileRoot;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    StorageConfig storage;
    SupervisorConfig supervisor;
    DispatcherConfig dispatcher;
    BroadcasterConfig broadcaster;
    std::string logLevel = "info";
};

/// @brief Loads the application configuration from the default config path.
///
/// A missing file yields the defaults.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Fills empty storage paths with the platform defaults.
void applyDefaultPaths(AppConfig& config);

/// @brief Returns the default config directory path for the current platform.
/// On Linux: $XDG_CONFIG_HOME/mcprt or ~/.config/mcprt
/// On macOS: ~/Library/Application Support/mcprt
/// On Windows: %APPDATA%\mcprt
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default data directory path for the current platform.
/// On Linux: $XDG_DATA_HOME/mcprt or ~/.local/share/mcprt
[[nodiscard]] auto defaultDataDir() -> std::string;

} // namespace mcprt
