// SPDX-License-Identifier: Apache-2.0
#include "Replies.hpp"

#include <core/TextUtils.hpp>

#include <format>

namespace agentloop
{

auto visionUnavailableReply() -> std::string
{
    return "Image input requires the VLM service.\n"
           "\n"
           "Fix:\n"
           "  scripts/services/vlm/install.sh\n"
           "  or set VLM_CMD / VLM_CMD_JSON to your own server command\n"
           "\n"
           "Then start it:\n"
           "  {\"type\":\"service.start\",\"payload\":{\"name\":\"vlm\"}}";
}

auto llmFailedReply(std::string_view error) -> std::string
{
    return std::format("Local MLX LLM failed.\n"
                       "\n"
                       "{}\n"
                       "\n"
                       "Fix:\n"
                       "  scripts/services/mlx/install.sh\n"
                       "  or set MLX_CMD / MLX_CMD_JSON to your own server command\n"
                       "\n"
                       "Then start it:\n"
                       "  {{\"type\":\"service.start\",\"payload\":{{\"name\":\"mlx\"}}}}",
                       error);
}

auto noLlmReply(std::string_view content) -> std::string
{
    return std::format("I understand you said: \"{}\"\n"
                       "\n"
                       "This engine is currently running without an LLM.\n"
                       "\n"
                       "To use a local MLX model:\n"
                       "  scripts/services/mlx/install.sh\n"
                       "  or set MLX_CMD / MLX_CMD_JSON to your own server command\n"
                       "\n"
                       "Then start it:\n"
                       "  {{\"type\":\"service.start\",\"payload\":{{\"name\":\"mlx\"}}}}\n"
                       "\n"
                       "Tip: set AGENTLOOP_LLM=mlx to always try MLX.",
                       content);
}

auto isSimpleMessage(std::string_view content) -> bool
{
    auto const trimmed = text::trim(content);
    if (trimmed.empty())
        return true;
    if (trimmed.starts_with("TOOL_CALL:"))
        return false;
    return trimmed.size() <= 220 && text::countWords(trimmed) <= 60;
}

} // namespace agentloop
