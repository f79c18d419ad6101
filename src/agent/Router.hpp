// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/AgentPack.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace agentloop
{

/// @brief Which agent handles a message, and why. Computed per message.
struct RoutingDecision
{
    std::string agent;
    std::vector<std::string> toolsAllowed;
    std::string reason; // empty, debug_keywords, arch_keywords, edit_keywords, default, pinned
};

/// @brief Picks an agent from keywords in the message.
///
/// Debug words select debug.triage, planning words code.arch, a change verb
/// together with a code-scope noun code.change, and anything else
/// chat.quick. Agents missing from @p agents resolve to its first entry.
/// @param agents Must not be empty.
[[nodiscard]] auto routeHeuristic(std::string_view message, std::span<const AgentPack> agents) -> RoutingDecision;

} // namespace agentloop
