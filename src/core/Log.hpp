// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace mcprt::log
{

/// @brief Verbosity level, ordered from most to least severe.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Returns the lowercase name of a level, as accepted by levelFromString().
[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Parses a level name ("error", "warning" or "warn", "info", "debug", "trace").
/// @return The level, or std::nullopt for an unknown name.
[[nodiscard]] auto levelFromString(std::string_view name) -> std::optional<Level>;

/// @brief Receives every message that passes the level filter.
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Routes messages to @p callback instead of stderr; an empty callback restores stderr.
///
/// The callback runs with the log mutex held and must not log itself.
void setCallback(LogCallback callback);

void setLevel(Level level);
[[nodiscard]] auto getLevel() -> Level;

/// @brief Returns true if messages of @p level are currently emitted.
[[nodiscard]] inline auto enabled(Level level) -> bool
{
    return level <= getLevel();
}

/// @brief Emits an already formatted message.
///
/// Thread safe; child process readers, workers and the broadcaster all log concurrently.
/// The stderr sink prefixes each line with a UTC timestamp and the level.
void write(Level level, std::string_view message);

namespace detail
{
    template <typename... Args>
    void emit(Level level, std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(level))
            write(level, std::format(fmt, std::forward<Args>(args)...));
    }
} // namespace detail

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    detail::emit(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    detail::emit(Level::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    detail::emit(Level::Info, fmt, std::forward<Args>(args)...);
}

/// @brief Debug output; child process stdout/stderr lines are logged here.
template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    detail::emit(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    detail::emit(Level::Trace, fmt, std::forward<Args>(args)...);
}

} // namespace mcprt::log
