// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace agentloop
{

/// @brief Incremental decoder for a chat-completion `text/event-stream` body.
///
/// Bytes may arrive split at arbitrary positions. Only `data:` lines carry
/// payload; `[DONE]` and malformed JSON are ignored.
class EventStreamDecoder
{
  public:
    using DeltaCallback = std::function<void(std::string_view delta)>;

    explicit EventStreamDecoder(DeltaCallback onDelta);

    /// @brief Consumes a chunk of the response body.
    void feed(std::string_view bytes);

    /// @brief Flushes a trailing line that was not terminated by a newline.
    void finish();

  private:
    void processLine(std::string_view line);

    DeltaCallback _onDelta;
    std::string _buffer;
};

/// @brief Extracts the text delta of one streamed chunk.
///
/// Reads `choices[0].delta.content`, falling back to
/// `choices[0].message.content` and then `choices[0].text`.
[[nodiscard]] auto extractDelta(const nlohmann::json& chunk) -> std::optional<std::string>;

/// @brief Extracts the assistant text of a buffered (non-streamed) response.
[[nodiscard]] auto extractContent(const nlohmann::json& response) -> std::string;

} // namespace agentloop
