// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>

namespace mcprt
{

/// @brief Generates a random (version 4) UUID in canonical lowercase text form.
[[nodiscard]] auto generateUuid() -> std::string;

} // namespace mcprt
