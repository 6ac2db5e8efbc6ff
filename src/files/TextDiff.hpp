// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace mcprt
{

/// @brief Splits text into lines without their terminators; a trailing newline adds no empty line.
[[nodiscard]] auto splitTextLines(std::string_view text) -> std::vector<std::string_view>;

/// @brief Produces a unified diff between two texts, compared line by line.
///
/// The output starts with "--- @p fromFile" and "+++ @p toFile" header lines followed by
/// "@@ -a,b +c,d @@" hunks with @p context unchanged lines around each change. Lines are
/// joined with '\n' and the result has no trailing newline. Identical texts yield an
/// empty string.
[[nodiscard]] auto unifiedDiff(std::string_view before,
                               std::string_view after,
                               std::string_view fromFile,
                               std::string_view toFile,
                               size_t context = 3) -> std::string;

} // namespace mcprt
