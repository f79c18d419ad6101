// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <engine/EngineSettings.hpp>
#include <llm/ChatClient.hpp>

#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace agentloop
{

struct PerfMetricEvent;

[[nodiscard]] auto workbenchStrategyToString(WorkbenchStrategyId id) -> std::string_view;

/// @brief Parses a workbench selection.
///
/// "", "0" and "false" disable the workbench; "1" and "true" select every
/// preset; otherwise a comma-separated list of preset names, unknown names
/// ignored.
[[nodiscard]] auto parseWorkbenchStrategies(std::string_view text) -> std::vector<WorkbenchStrategyId>;

/// @brief Model parameters of one preset.
struct WorkbenchStrategy
{
    WorkbenchStrategyId id = WorkbenchStrategyId::Quick;
    std::string model;
    int maxTokens = 0;
    double temperature = 0.2;
    int maxHistoryTurns = 0;
};

/// @brief The presets selected by @p ids, in quick, balanced, full order.
[[nodiscard]] auto buildWorkbenchStrategies(const LlmSettings& llm, std::span<const WorkbenchStrategyId> ids)
    -> std::vector<WorkbenchStrategy>;

/// @brief Lower-cased alphanumeric words of @p text.
[[nodiscard]] auto normalizeForCompare(std::string_view text) -> std::vector<std::string>;

/// @brief Jaccard overlap of the word sets of two texts; 0 when either is empty.
[[nodiscard]] auto jaccardSimilarity(std::string_view a, std::string_view b) -> double;

/// @brief Shorter over longer trimmed length; 0 when either is empty.
[[nodiscard]] auto lengthRatio(std::string_view a, std::string_view b) -> double;

/// @brief Everything a workbench run needs, captured after the quick path.
struct WorkbenchPlan
{
    std::string sessionId;
    std::string agent;
    std::string system;
    std::string primaryResponse;
    std::string primaryModel;
    std::vector<Message> messages;
};

/// @brief Replays a quick-path prompt at each preset and reports one metric per preset.
///
/// Emits `workbench.strategy` or `workbench.error` perf metrics through
/// @p report. Never modifies any transcript.
void runWorkbench(ChatClient& client,
                  const LlmSettings& llm,
                  const WorkbenchPlan& plan,
                  std::span<const WorkbenchStrategy> strategies,
                  const std::function<void(PerfMetricEvent)>& report);

} // namespace agentloop
