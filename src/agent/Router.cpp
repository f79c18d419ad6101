// SPDX-License-Identifier: Apache-2.0
#include "Router.hpp"

#include <core/TextUtils.hpp>

#include <algorithm>
#include <array>

namespace agentloop
{

namespace
{
    constexpr auto DebugKeywords = std::array<std::string_view, 12> {
        "stack trace", "traceback", "exception", "panic",       "segfault",     "hang",
        "stuck",       "timeout",   "not working", "doesn't work", "error:", "failed",
    };

    constexpr auto ArchKeywords = std::array<std::string_view, 8> {
        "architecture", "design", "tradeoffs", "roadmap", "plan", "milestones", "spec", "strategy",
    };

    constexpr auto ChangeVerbs = std::array<std::string_view, 8> {
        "implement", "refactor", "fix", "add", "remove", "rename", "update", "change",
    };

    constexpr auto ChangeScopes = std::array<std::string_view, 10> {
        "file", "repo", "package", "function", "type", "test", "tui", "engine", "docs", "readme",
    };

    template <std::size_t N>
    auto containsAny(std::string_view text, const std::array<std::string_view, N>& needles) -> bool
    {
        return std::ranges::any_of(needles, [text](std::string_view needle) { return text.find(needle) != std::string_view::npos; });
    }
} // namespace

auto routeHeuristic(std::string_view message, std::span<const AgentPack> agents) -> RoutingDecision
{
    auto const pick = [agents](std::string_view name, std::string_view reason) {
        auto const& agent = findAgentOrFirst(agents, name);
        return RoutingDecision { .agent = agent.name, .toolsAllowed = agent.tools, .reason = std::string(reason) };
    };

    auto const lowered = text::toLower(text::trim(message));
    if (lowered.empty())
        return pick(DefaultAgentName, "empty");

    if (containsAny(lowered, DebugKeywords))
        return pick("debug.triage", "debug_keywords");

    if (containsAny(lowered, ArchKeywords))
        return pick("code.arch", "arch_keywords");

    if (containsAny(lowered, ChangeVerbs) && containsAny(lowered, ChangeScopes))
        return pick("code.change", "edit_keywords");

    return pick(DefaultAgentName, "default");
}

} // namespace agentloop
