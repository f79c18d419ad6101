// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace agentloop
{

/// @brief Per-request parameters of an OpenAI-compatible chat completion.
struct ChatOptions
{
    std::string baseUrl = "http://127.0.0.1:12345";
    std::string model = "mlx-community/Llama-3.2-3B-Instruct-4bit";
    std::chrono::milliseconds timeout { 120'000 };
    int maxTokens = 256;
    double temperature = 0.2;
    double topP = 0.9;
};

/// @brief The result of a completed chat request.
struct Completion
{
    std::string model;   // model name reported by the backend, or the requested one
    std::string content; // full assistant text
};

/// @brief Callback for streaming assistant text deltas.
using TokenCallback = std::function<void(std::string_view token)>;

/// @brief Abstract interface to a chat-completion backend.
class ChatClient
{
  public:
    virtual ~ChatClient() = default;

    /// @brief Sends the messages and waits for the full reply.
    /// @return The completion, or an error (TimeoutError, BackendError, EmptyCompletion, ...).
    [[nodiscard]] virtual auto complete(std::span<const ChatMessage> messages, const ChatOptions& options)
        -> Result<Completion> = 0;

    /// @brief Sends the messages and delivers the reply incrementally.
    ///
    /// The concatenation of all tokens passed to @p onToken equals the
    /// returned content.
    [[nodiscard]] virtual auto completeStreaming(std::span<const ChatMessage> messages,
                                                 TokenCallback onToken,
                                                 const ChatOptions& options) -> Result<Completion> = 0;
};

} // namespace agentloop
