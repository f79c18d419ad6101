// SPDX-License-Identifier: Apache-2.0
#include "AgentPack.hpp"

#include <agent/Toolbox.hpp>
#include <core/TextUtils.hpp>

#include <algorithm>

namespace agentloop
{

auto builtInAgents() -> std::vector<AgentPack>
{
    return {
        AgentPack {
            .name = "chat.quick",
            .description = "Fast, conversational replies (no tools).",
            .prompt = "You are in `chat.quick` mode.\n"
                      "Answer directly and briefly. Do not plan unless asked.\n"
                      "Do not call tools.",
            .tools = {},
            .maxToolCalls = 0,
            .maxHistoryTurns = 10,
            .temperature = 0.2,
        },
        AgentPack {
            .name = "debug.triage",
            .description = "Debugging triage (ask for evidence, minimal changes).",
            .prompt = "You are in `debug.triage` mode.\n"
                      "Ask for logs/errors/repro steps, then propose the smallest next action.\n"
                      "Keep the conversation clean; details belong in logs.",
            .tools = { "fs.read", "fs.list", "service.status" },
            .maxToolCalls = 3,
            .maxHistoryTurns = 20,
            .temperature = 0.1,
        },
        AgentPack {
            .name = "code.arch",
            .description = "Architecture discussion and planning (tools optional).",
            .prompt = "You are in `code.arch` mode.\n"
                      "Focus on architecture, tradeoffs, and a clear plan.\n"
                      "Avoid making changes unless explicitly asked.",
            .tools = { "fs.read", "fs.list" },
            .maxToolCalls = 2,
            .maxHistoryTurns = 20,
            .temperature = 0.2,
        },
        AgentPack {
            .name = "code.change",
            .description = "Small, surgical code changes (tools enabled).",
            .prompt = "You are in `code.change` mode.\n"
                      "Prefer small, focused patches and verify with typecheck if relevant.\n"
                      "Avoid unrelated refactors and keep output concise.",
            .tools = { "fs.read", "fs.list", "service.status", "logo.fetch" },
            .maxToolCalls = 4,
            .maxHistoryTurns = 30,
            .temperature = 0.1,
        },
        AgentPack {
            .name = "tool.use",
            .description = "Explicit tool loop for multi-step tasks.",
            .prompt = "You are in `tool.use` mode.\n"
                      "Use tools when necessary; otherwise respond normally.\n"
                      "Be deliberate: one tool call at a time, then proceed.",
            .tools = { "time.now", "fs.read", "fs.list", "service.status", "logo.fetch" },
            .maxToolCalls = 6,
            .maxHistoryTurns = 30,
            .temperature = 0.2,
        },
    };
}

auto mergeAgentPacks(std::vector<AgentPack> builtIns, const std::map<std::string, AgentOverride>& overrides)
    -> std::vector<AgentPack>
{
    auto byName = std::map<std::string, AgentPack> {};
    for (auto& agent: builtIns)
        byName[agent.name] = std::move(agent);

    for (auto const& [rawName, change]: overrides)
    {
        auto const name = std::string(text::trim(rawName));
        if (name.empty())
            continue;

        auto const it = byName.find(name);
        auto const* base = it != byName.end() ? &it->second : nullptr;

        auto merged = AgentPack {
            .name = name,
            .description = base ? base->description : "Custom agent pack.",
            .prompt = base ? base->prompt : std::string {},
            .tools = base ? base->tools : std::vector<std::string> {},
            .maxToolCalls = base ? base->maxToolCalls : 3,
            .maxHistoryTurns = base ? base->maxHistoryTurns : 20,
            .temperature = base ? base->temperature : std::nullopt,
        };

        if (change.description && !text::trim(*change.description).empty())
            merged.description = std::string(text::trim(*change.description));
        if (change.prompt && !text::trim(*change.prompt).empty())
            merged.prompt = std::string(text::trim(*change.prompt));
        if (change.tools)
        {
            auto known = std::vector<std::string> {};
            std::ranges::copy_if(*change.tools, std::back_inserter(known), isKnownToolName);
            if (!known.empty())
                merged.tools = std::move(known);
        }
        if (change.maxToolCalls)
            merged.maxToolCalls = *change.maxToolCalls;
        if (change.maxHistoryTurns)
            merged.maxHistoryTurns = *change.maxHistoryTurns;
        if (change.temperature)
            merged.temperature = change.temperature;

        byName[name] = std::move(merged);
    }

    auto result = std::vector<AgentPack> {};
    result.reserve(byName.size());
    for (auto& [name, agent]: byName)
        result.push_back(std::move(agent));
    return result; // std::map keeps names sorted
}

auto findAgent(std::span<const AgentPack> agents, std::string_view name) -> const AgentPack*
{
    auto const it = std::ranges::find(agents, name, &AgentPack::name);
    return it != agents.end() ? &*it : nullptr;
}

auto findAgentOrFirst(std::span<const AgentPack> agents, std::string_view name) -> const AgentPack&
{
    if (auto const* agent = findAgent(agents, name))
        return *agent;
    return agents.front();
}

} // namespace agentloop
