// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/AgentPack.hpp>
#include <core/Types.hpp>

#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace agentloop
{

/// @brief System prompt shared by every agent.
extern const std::string_view CoreSystemPrompt;

/// @brief Joins the trimmed, non-empty parts with @p separator.
[[nodiscard]] auto joinNonEmpty(std::initializer_list<std::string_view> parts, std::string_view separator = "\n\n")
    -> std::string;

/// @brief Layers core prompt, agent prompt, workspace prompt and session prompt.
[[nodiscard]] auto composeSystemPrompt(const AgentPack& agent,
                                       std::string_view workspacePrompt,
                                       std::string_view sessionPrompt,
                                       bool includeCore = true) -> std::string;

/// @brief Builds the request messages: the system prompt, then the last
///        `maxHistoryTurns * 2` user/assistant messages of the transcript.
[[nodiscard]] auto buildChatMessages(std::string_view system, std::span<const Message> transcript, int maxHistoryTurns)
    -> std::vector<ChatMessage>;

} // namespace agentloop
