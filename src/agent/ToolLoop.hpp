// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/Toolbox.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <llm/ChatClient.hpp>

#include <functional>
#include <span>
#include <string>
#include <vector>

namespace agentloop
{

/// @brief Configuration for one run of the tool-call loop.
struct ToolLoopConfig
{
    std::string systemPrompt;
    std::vector<std::string> allowedTools;
    int maxToolCalls = 3;
    ChatOptions chat;
};

/// @brief Observers of tool activity during a run.
struct ToolLoopCallbacks
{
    /// @brief A validated call is about to run (status Running).
    std::function<void(const ToolCall& call)> onToolCall;

    /// @brief A call finished; @p call carries the final status and result.
    std::function<void(const ToolCall& call)> onToolResult;
};

/// @brief Number of transcript messages the loop seeds its request with.
inline constexpr auto ToolLoopHistoryLimit = std::size_t { 20 };

/// @brief Implements the bounded text-protocol tool loop.
///
/// The model is asked to complete the conversation. When its reply contains a
/// `TOOL_CALL:` line naming an allowed tool, the tool runs synchronously and
/// its `TOOL_RESULT:` is fed back as a system message; the loop repeats for at
/// most `maxToolCalls + 1` model round trips.
class ToolLoop
{
  public:
    /// @param client Backend used for every round trip.
    /// @param toolbox Executes validated tool calls.
    /// @param config Prompts, allow-list and budget.
    ToolLoop(ChatClient& client, const Toolbox& toolbox, ToolLoopConfig config);

    /// @brief Runs the loop over the session transcript.
    /// @return The final assistant text with protocol lines removed, or the
    ///         backend error of the failing round trip.
    [[nodiscard]] auto run(std::span<const Message> transcript, const ToolLoopCallbacks& callbacks = {})
        -> Result<std::string>;

    [[nodiscard]] auto config() const noexcept -> const ToolLoopConfig& { return _config; }

  private:
    [[nodiscard]] auto seedMessages(std::span<const Message> transcript) const -> std::vector<ChatMessage>;

    ChatClient& _client;
    const Toolbox& _toolbox;
    ToolLoopConfig _config;
};

} // namespace agentloop
