// SPDX-License-Identifier: Apache-2.0
#include "ToolLoop.hpp"

#include <core/Ids.hpp>
#include <core/Log.hpp>
#include <core/TextUtils.hpp>

#include <algorithm>
#include <ranges>

namespace agentloop
{

ToolLoop::ToolLoop(ChatClient& client, const Toolbox& toolbox, ToolLoopConfig config):
    _client(client), _toolbox(toolbox), _config(std::move(config))
{
}

auto ToolLoop::seedMessages(std::span<const Message> transcript) const -> std::vector<ChatMessage>
{
    auto messages = std::vector<ChatMessage> {};

    auto const system = text::trim(_config.systemPrompt);
    if (!system.empty())
        messages.push_back(ChatMessage { .role = Role::System, .content = std::string(system) });
    messages.push_back(ChatMessage {
        .role = Role::System,
        .content = toolSystemPrompt(_toolbox.root(), _config.allowedTools),
    });

    auto history = std::vector<const Message*> {};
    for (auto const& message: transcript)
    {
        if (message.role == Role::User || message.role == Role::Assistant)
            history.push_back(&message);
    }
    auto const skip = history.size() > ToolLoopHistoryLimit ? history.size() - ToolLoopHistoryLimit : 0;
    for (auto const* message: history | std::views::drop(skip))
        messages.push_back(ChatMessage { .role = message->role, .content = message->content });

    return messages;
}

auto ToolLoop::run(std::span<const Message> transcript, const ToolLoopCallbacks& callbacks) -> Result<std::string>
{
    auto messages = seedMessages(transcript);
    auto lastReply = std::string {};
    auto const rounds = std::max(_config.maxToolCalls, 0) + 1;

    for (auto round = 0; round < rounds; ++round)
    {
        log::debug("Tool loop round {}/{}", round + 1, rounds);

        auto completion = _client.complete(messages, _config.chat);
        if (!completion)
            return std::unexpected(completion.error());
        lastReply = std::move(completion->content);

        auto request = parseToolCall(lastReply, _config.allowedTools);
        if (!request)
        {
            auto cleaned = stripToolProtocol(lastReply);
            return cleaned.empty() ? std::string("…") : cleaned;
        }

        auto call = ToolCall {
            .id = createId(),
            .name = request->name,
            .arguments = request->args,
            .status = ToolCallStatus::Running,
            .result = std::nullopt,
        };
        log::info("Executing tool: {} (id: {})", call.name, call.id);
        if (callbacks.onToolCall)
            callbacks.onToolCall(call);

        auto const outcome = _toolbox.run(*request);
        call.status = outcome.ok ? ToolCallStatus::Completed : ToolCallStatus::Failed;
        call.result = outcome.toJson();
        if (callbacks.onToolResult)
            callbacks.onToolResult(call);

        messages.push_back(ChatMessage { .role = Role::Assistant, .content = lastReply });
        messages.push_back(ChatMessage { .role = Role::System, .content = formatToolResult(call.name, outcome) });
    }

    log::warning("Tool loop exhausted its budget of {} tool call(s)", _config.maxToolCalls);
    auto cleaned = stripToolProtocol(lastReply);
    return cleaned.empty() ? std::string("No response.") : cleaned;
}

} // namespace agentloop
