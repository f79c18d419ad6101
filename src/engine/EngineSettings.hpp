// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace agentloop
{

/// @brief A workbench preset replaying a quick-path prompt.
enum class WorkbenchStrategyId
{
    Quick,
    Balanced,
    Full,
};

/// @brief Text LLM (mlx) request parameters of the three response paths.
struct LlmSettings
{
    std::string baseUrl = "http://127.0.0.1:12345";
    std::string quickBaseUrl; // empty: use baseUrl
    std::string model = "mlx-community/Llama-3.2-3B-Instruct-4bit";
    std::string quickModel = "mlx-community/Llama-3.2-1B-Instruct-4bit";
    std::string followupModel; // empty: use model
    std::chrono::milliseconds timeout { 120'000 };
    int maxTokens = 256;
    int quickMaxTokens = 128;
    int followupMaxTokens = 256;
    double temperature = 0.2;
    std::optional<double> quickTemperature;    // else the agent's, else temperature
    std::optional<double> followupTemperature; // else the agent's, else temperature
    double topP = 0.9;

    /// @brief Try the LLM even when the backend looks unavailable.
    bool prefer = false;
};

/// @brief Vision-language model request parameters.
struct VlmSettings
{
    std::string baseUrl = "http://127.0.0.1:12346";
    std::string model = "mlx-community/Qwen2-VL-2B-Instruct-4bit";
    std::chrono::milliseconds timeout { 120'000 };
    int maxTokens = 256;
    double temperature = 0.2;
};

/// @brief Behaviour of the session pipeline.
struct EngineSettings
{
    LlmSettings llm;
    VlmSettings vlm;

    bool quickFollowup = true;
    int followupMinChars = 140;
    int followupMinPromptChars = 12;

    std::vector<WorkbenchStrategyId> workbench; // empty: disabled

    /// @brief Extra system prompt appended after all other layers.
    std::string systemPrompt;
};

} // namespace agentloop
