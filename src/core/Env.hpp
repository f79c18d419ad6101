// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace agentloop::env
{

/// @brief Reads an environment variable, trimmed. Empty values count as unset.
[[nodiscard]] auto getString(std::string_view key) -> std::optional<std::string>;

/// @brief Reads a finite numeric environment variable.
[[nodiscard]] auto getNumber(std::string_view key) -> std::optional<double>;

/// @brief Reads a boolean environment variable (1/true/yes/y/on, 0/false/no/n/off).
/// @return The parsed value, or @p defaultValue when unset or unrecognized.
[[nodiscard]] auto getBool(std::string_view key, bool defaultValue) -> bool;

/// @brief Sets an environment variable of this process, replacing any previous value.
void set(std::string_view key, std::string_view value);

/// @brief Removes an environment variable from this process.
void unset(std::string_view key);

} // namespace agentloop::env
