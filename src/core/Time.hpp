// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <format>
#include <string>

namespace mcprt
{

/// @brief Returns the current UTC time as an ISO-8601 string with microsecond precision,
/// e.g. "2024-05-01T12:34:56.123456".
[[nodiscard]] inline auto currentTimestamp() -> std::string
{
    auto const now = std::chrono::floor<std::chrono::microseconds>(std::chrono::system_clock::now());
    return std::format("{:%FT%T}", now);
}

} // namespace mcprt
