// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace agentloop
{

/// @brief Name of the agent used for plain conversation and as routing fallback.
inline constexpr auto DefaultAgentName = std::string_view { "chat.quick" };

/// @brief A named agent configuration: prompt fragment, tool allow-list and budgets.
struct AgentPack
{
    std::string name;
    std::string description;
    std::string prompt;
    std::vector<std::string> tools;
    int maxToolCalls = 3;
    int maxHistoryTurns = 20;
    std::optional<double> temperature;
};

/// @brief User-supplied changes to an agent pack. Present fields win over the built-in.
struct AgentOverride
{
    std::optional<std::string> description;
    std::optional<std::string> prompt;
    std::optional<std::vector<std::string>> tools;
    std::optional<int> maxToolCalls;
    std::optional<int> maxHistoryTurns;
    std::optional<double> temperature;
};

/// @brief Returns the built-in agents (chat.quick, debug.triage, code.arch, code.change, tool.use).
[[nodiscard]] auto builtInAgents() -> std::vector<AgentPack>;

/// @brief Merges overrides into the built-ins by name, field by field.
///
/// Unknown tool names in an override are dropped; an override naming no
/// built-in defines a new agent. The result is sorted by name.
[[nodiscard]] auto mergeAgentPacks(std::vector<AgentPack> builtIns,
                                   const std::map<std::string, AgentOverride>& overrides) -> std::vector<AgentPack>;

/// @brief Finds an agent by name.
/// @return The agent, or nullptr when absent.
[[nodiscard]] auto findAgent(std::span<const AgentPack> agents, std::string_view name) -> const AgentPack*;

/// @brief Finds an agent by name, falling back to the first agent of the list.
///
/// @p agents must not be empty.
[[nodiscard]] auto findAgentOrFirst(std::span<const AgentPack> agents, std::string_view name) -> const AgentPack&;

} // namespace agentloop
