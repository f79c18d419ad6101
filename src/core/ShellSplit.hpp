// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace agentloop
{

/// @brief Splits a command line into arguments using shell-like rules.
///
/// Whitespace separates arguments, single and double quotes group text,
/// and a backslash escapes the next character (also inside quotes).
/// No variable expansion or globbing is performed.
[[nodiscard]] auto shellSplit(std::string_view command) -> std::vector<std::string>;

} // namespace agentloop
