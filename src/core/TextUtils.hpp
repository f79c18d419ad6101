// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace agentloop::text
{

/// @brief Returns @p text without leading and trailing whitespace.
[[nodiscard]] auto trim(std::string_view text) -> std::string_view;

/// @brief Returns an ASCII lower-cased copy of @p text.
[[nodiscard]] auto toLower(std::string_view text) -> std::string;

/// @brief Splits text into alternating word and whitespace-run tokens.
///
/// Concatenating the tokens reproduces @p text exactly.
[[nodiscard]] auto splitKeepingWhitespace(std::string_view text) -> std::vector<std::string>;

/// @brief Splits text into lines on '\n', removing a trailing '\r' from each line.
[[nodiscard]] auto splitLines(std::string_view text) -> std::vector<std::string_view>;

/// @brief Counts whitespace-separated words.
[[nodiscard]] auto countWords(std::string_view text) -> std::size_t;

} // namespace agentloop::text
