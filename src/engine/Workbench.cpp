// SPDX-License-Identifier: Apache-2.0
#include "Workbench.hpp"

#include <agent/PromptStack.hpp>
#include <core/Ids.hpp>
#include <core/Log.hpp>
#include <core/TextUtils.hpp>
#include <engine/Protocol.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <set>

namespace agentloop
{

auto workbenchStrategyToString(WorkbenchStrategyId id) -> std::string_view
{
    switch (id)
    {
        case WorkbenchStrategyId::Quick: return "quick";
        case WorkbenchStrategyId::Balanced: return "balanced";
        case WorkbenchStrategyId::Full: return "full";
    }
    return "quick";
}

auto parseWorkbenchStrategies(std::string_view text) -> std::vector<WorkbenchStrategyId>
{
    auto const value = text::toLower(text::trim(text));
    if (value.empty() || value == "0" || value == "false")
        return {};
    if (value == "1" || value == "true")
        return { WorkbenchStrategyId::Quick, WorkbenchStrategyId::Balanced, WorkbenchStrategyId::Full };

    auto ids = std::vector<WorkbenchStrategyId> {};
    auto rest = std::string_view(value);
    while (!rest.empty())
    {
        auto const comma = rest.find(',');
        auto const part = text::trim(rest.substr(0, comma));
        rest = comma == std::string_view::npos ? std::string_view {} : rest.substr(comma + 1);

        if (part == "quick")
            ids.push_back(WorkbenchStrategyId::Quick);
        else if (part == "balanced")
            ids.push_back(WorkbenchStrategyId::Balanced);
        else if (part == "full")
            ids.push_back(WorkbenchStrategyId::Full);
    }
    return ids;
}

auto buildWorkbenchStrategies(const LlmSettings& llm, std::span<const WorkbenchStrategyId> ids)
    -> std::vector<WorkbenchStrategy>
{
    auto const presets = std::vector<WorkbenchStrategy> {
        { WorkbenchStrategyId::Quick,
          llm.quickModel,
          llm.quickMaxTokens,
          llm.quickTemperature.value_or(llm.temperature),
          4 },
        { WorkbenchStrategyId::Balanced, llm.model, std::min(192, llm.maxTokens), llm.temperature, 8 },
        { WorkbenchStrategyId::Full, llm.model, llm.maxTokens, llm.temperature, 12 },
    };

    auto selected = std::vector<WorkbenchStrategy> {};
    for (auto const& preset: presets)
    {
        if (std::ranges::find(ids, preset.id) != ids.end())
            selected.push_back(preset);
    }
    return selected;
}

auto normalizeForCompare(std::string_view text) -> std::vector<std::string>
{
    auto words = std::vector<std::string> {};
    auto current = std::string {};
    for (auto const ch: text)
    {
        auto const lower = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        if ((lower >= 'a' && lower <= 'z') || (lower >= '0' && lower <= '9'))
        {
            current += lower;
        }
        else if (!current.empty())
        {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty())
        words.push_back(std::move(current));
    return words;
}

auto jaccardSimilarity(std::string_view a, std::string_view b) -> double
{
    auto const wordsA = normalizeForCompare(a);
    auto const wordsB = normalizeForCompare(b);
    if (wordsA.empty() || wordsB.empty())
        return 0.0;

    auto const setA = std::set<std::string>(wordsA.begin(), wordsA.end());
    auto const setB = std::set<std::string>(wordsB.begin(), wordsB.end());
    auto const intersection = std::ranges::count_if(setA, [&](const std::string& word) { return setB.contains(word); });
    auto const unionSize = setA.size() + setB.size() - static_cast<std::size_t>(intersection);
    return unionSize == 0 ? 0.0 : static_cast<double>(intersection) / static_cast<double>(unionSize);
}

auto lengthRatio(std::string_view a, std::string_view b) -> double
{
    auto const lenA = text::trim(a).size();
    auto const lenB = text::trim(b).size();
    if (lenA == 0 || lenB == 0)
        return 0.0;
    return static_cast<double>(std::min(lenA, lenB)) / static_cast<double>(std::max(lenA, lenB));
}

void runWorkbench(ChatClient& client,
                  const LlmSettings& llm,
                  const WorkbenchPlan& plan,
                  std::span<const WorkbenchStrategy> strategies,
                  const std::function<void(PerfMetricEvent)>& report)
{
    for (auto const& strategy: strategies)
    {
        auto const start = std::chrono::steady_clock::now();
        auto const messages = buildChatMessages(plan.system, plan.messages, strategy.maxHistoryTurns);
        auto const options = ChatOptions {
            .baseUrl = llm.baseUrl,
            .model = strategy.model,
            .timeout = llm.timeout,
            .maxTokens = strategy.maxTokens,
            .temperature = strategy.temperature,
            .topP = llm.topP,
        };

        auto completion = client.complete(messages, options);
        if (!completion)
        {
            log::debug("Workbench strategy {} failed: {}", workbenchStrategyToString(strategy.id), completion.error());
            report(PerfMetricEvent {
                .sessionId = plan.sessionId,
                .name = "workbench.error",
                .durationMs = millisSince(start),
                .meta = {
                    { "strategy", workbenchStrategyToString(strategy.id) },
                    { "model", strategy.model },
                    { "error", completion.error().message },
                },
            });
            continue;
        }

        report(PerfMetricEvent {
            .sessionId = plan.sessionId,
            .name = "workbench.strategy",
            .durationMs = millisSince(start),
            .meta = {
                { "agent", plan.agent },
                { "strategy", workbenchStrategyToString(strategy.id) },
                { "model", completion->model },
                { "primaryModel", plan.primaryModel },
                { "maxTokens", strategy.maxTokens },
                { "temperature", strategy.temperature },
                { "maxHistoryTurns", strategy.maxHistoryTurns },
                { "responseLength", completion->content.size() },
                { "primaryLength", plan.primaryResponse.size() },
                { "jaccard", jaccardSimilarity(plan.primaryResponse, completion->content) },
                { "lengthRatio", lengthRatio(plan.primaryResponse, completion->content) },
            },
        });
    }
}

} // namespace agentloop
