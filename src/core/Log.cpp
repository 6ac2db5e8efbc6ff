// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <core/Time.hpp>

#include <array>
#include <atomic>
#include <mutex>
#include <print>

namespace mcprt::log
{

namespace
{
    constexpr auto Levels = std::array { Level::Error, Level::Warning, Level::Info, Level::Debug, Level::Trace };

    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto globalMutex = std::mutex {};
} // namespace

auto levelName(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "error";
        case Level::Warning: return "warning";
        case Level::Info: return "info";
        case Level::Debug: return "debug";
        case Level::Trace: return "trace";
    }
    return "info";
}

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    if (name == "warn")
        return Level::Warning;
    for (auto const level: Levels)
    {
        if (levelName(level) == name)
            return level;
    }
    return std::nullopt;
}

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(globalMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

void write(Level level, std::string_view message)
{
    if (!enabled(level))
        return;

    auto lock = std::lock_guard(globalMutex);
    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    std::println(stderr, "{} {:<7} {}", currentTimestamp(), levelName(level), message);
}

} // namespace mcprt::log
