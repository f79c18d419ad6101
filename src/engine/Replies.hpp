// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>

namespace agentloop
{

/// @brief Reply when images were attached but no vision backend is usable.
[[nodiscard]] auto visionUnavailableReply() -> std::string;

/// @brief Reply when the text LLM request failed with @p error.
[[nodiscard]] auto llmFailedReply(std::string_view error) -> std::string;

/// @brief Reply when no text LLM is usable; echoes the user's @p content.
[[nodiscard]] auto noLlmReply(std::string_view content) -> std::string;

/// @brief True for short single-turn chat that does not need the tool loop.
///
/// Empty text is simple; text starting with `TOOL_CALL:` is not; otherwise
/// at most 220 characters and 60 words.
[[nodiscard]] auto isSimpleMessage(std::string_view content) -> bool;

} // namespace agentloop
