// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <llm/ChatClient.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace agentloop
{

/// @brief ChatClient talking to an OpenAI-compatible `/v1/chat/completions` endpoint.
class HttpChatClient: public ChatClient
{
  public:
    /// @param label Backend name used in error messages (e.g. "MLX", "VLM").
    explicit HttpChatClient(std::string label);

    [[nodiscard]] auto complete(std::span<const ChatMessage> messages, const ChatOptions& options)
        -> Result<Completion> override;

    [[nodiscard]] auto completeStreaming(std::span<const ChatMessage> messages,
                                         TokenCallback onToken,
                                         const ChatOptions& options) -> Result<Completion> override;

  private:
    std::string _label;
};

/// @brief Builds the JSON request body for a chat completion.
///
/// Messages with image URLs are encoded as `text` and `image_url` content blocks.
[[nodiscard]] auto buildRequestBody(std::span<const ChatMessage> messages, const ChatOptions& options, bool stream)
    -> nlohmann::json;

} // namespace agentloop
