// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>

namespace agentloop
{

/// @brief System-prompt suffix asking small models for plain, brief text.
extern const std::string_view QuickOutputGuidance;

/// @brief Result of scrubbing one streamed token.
struct ScrubbedToken
{
    std::string text; // text that may be forwarded to clients
    bool stop = false; // true once tool-call syntax appeared; drop all later tokens
};

/// @brief Removes control tokens from a streamed token and cuts it at tool-call syntax.
[[nodiscard]] auto scrubToken(std::string_view token) -> ScrubbedToken;

/// @brief Cleans up a complete quick-path reply.
///
/// Text from the first tool-call marker on is dropped and control tokens are
/// removed. If nothing remains, the trimmed input is returned unchanged.
[[nodiscard]] auto sanitizeOutput(std::string_view text) -> std::string;

} // namespace agentloop
