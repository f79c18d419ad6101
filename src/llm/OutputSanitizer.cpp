// SPDX-License-Identifier: Apache-2.0
#include "OutputSanitizer.hpp"

#include <core/TextUtils.hpp>

#include <algorithm>
#include <array>

namespace agentloop
{

const std::string_view QuickOutputGuidance = "Respond in plain text only.\n"
                                             "Never emit tool-call syntax or special tokens.\n"
                                             "Assume benign intent; avoid refusals unless unsafe.\n"
                                             "If you must refuse, keep it to one short sentence.\n"
                                             "Keep it brief unless explicitly asked for more.";

namespace
{
    constexpr auto Blockers = std::array<std::string_view, 4> {
        "<start_function_call>",
        "<tool_call>",
        "<|tool_call|>",
        "TOOL_CALL:",
    };

    constexpr auto StripTokens = std::array<std::string_view, 4> {
        "<end_of_turn>",
        "<start_of_turn>",
        "<eos>",
        "<|endoftext|>",
    };

    /// @brief Cuts @p text at the earliest blocker. Returns true if a cut happened.
    auto cutAtBlocker(std::string& text) -> bool
    {
        auto cut = std::string::npos;
        for (auto const marker: Blockers)
            cut = std::min(cut, text.find(marker));
        if (cut == std::string::npos)
            return false;
        text.erase(cut);
        return true;
    }

    void removeStripTokens(std::string& text)
    {
        for (auto const token: StripTokens)
        {
            for (auto pos = text.find(token); pos != std::string::npos; pos = text.find(token, pos))
                text.erase(pos, token.size());
        }
    }
} // namespace

auto scrubToken(std::string_view token) -> ScrubbedToken
{
    auto result = ScrubbedToken { .text = std::string(token), .stop = false };
    result.stop = cutAtBlocker(result.text);
    removeStripTokens(result.text);
    return result;
}

auto sanitizeOutput(std::string_view text) -> std::string
{
    auto out = std::string(text);
    cutAtBlocker(out);
    removeStripTokens(out);

    auto const trimmed = text::trim(out);
    if (!trimmed.empty())
        return std::string(trimmed);
    return std::string(text::trim(text));
}

} // namespace agentloop
