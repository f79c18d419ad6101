// SPDX-License-Identifier: Apache-2.0
#include "PromptStack.hpp"

#include <core/TextUtils.hpp>

#include <algorithm>

namespace agentloop
{

const std::string_view CoreSystemPrompt = "You are AgentLoop, a local-first agent for builders and thinkers.\n"
                                          "\n"
                                          "Style:\n"
                                          "- Be concise and information-dense by default.\n"
                                          "- Ask 1–2 clarifying questions when requirements are ambiguous.\n"
                                          "- Prefer actionable steps and concrete commands when relevant.\n"
                                          "- Do not spam background/status chatter into the conversation.\n"
                                          "\n"
                                          "Safety + local-first:\n"
                                          "- Prefer local tools/services over network calls.\n"
                                          "- Ask before destructive actions (delete/reset/overwrite).\n"
                                          "\n"
                                          "Tool protocol:\n"
                                          "- Only call tools when needed.\n"
                                          "- Never include TOOL_CALL/TOOL_RESULT in user-facing output.";

auto joinNonEmpty(std::initializer_list<std::string_view> parts, std::string_view separator) -> std::string
{
    auto result = std::string {};
    for (auto const part: parts)
    {
        auto const trimmed = text::trim(part);
        if (trimmed.empty())
            continue;
        if (!result.empty())
            result.append(separator);
        result.append(trimmed);
    }
    return result;
}

auto composeSystemPrompt(const AgentPack& agent,
                         std::string_view workspacePrompt,
                         std::string_view sessionPrompt,
                         bool includeCore) -> std::string
{
    return joinNonEmpty({ includeCore ? CoreSystemPrompt : std::string_view {}, agent.prompt, workspacePrompt, sessionPrompt });
}

auto buildChatMessages(std::string_view system, std::span<const Message> transcript, int maxHistoryTurns)
    -> std::vector<ChatMessage>
{
    auto history = std::vector<const Message*> {};
    for (auto const& message: transcript)
    {
        if (message.role == Role::User || message.role == Role::Assistant)
            history.push_back(&message);
    }

    auto const keep = static_cast<std::size_t>(std::max(0, maxHistoryTurns)) * 2;
    auto const skip = history.size() > keep ? history.size() - keep : 0;

    auto messages = std::vector<ChatMessage> {};
    messages.reserve(history.size() - skip + 1);
    messages.push_back(ChatMessage { .role = Role::System, .content = std::string(text::trim(system)), .imageUrls = {} });
    for (auto i = skip; i < history.size(); ++i)
        messages.push_back(ChatMessage { .role = history[i]->role, .content = history[i]->content, .imageUrls = {} });
    return messages;
}

} // namespace agentloop
