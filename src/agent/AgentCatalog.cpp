// SPDX-License-Identifier: Apache-2.0
#include "AgentCatalog.hpp"

#include <agent/PromptStack.hpp>
#include <core/Log.hpp>

#include <fstream>
#include <sstream>

namespace agentloop
{

namespace
{
    auto readOptionalText(const std::filesystem::path& path) -> std::string
    {
        auto ec = std::error_code {};
        if (!std::filesystem::is_regular_file(path, ec))
            return {};

        auto file = std::ifstream(path, std::ios::binary);
        if (!file)
        {
            log::warning("Cannot read {}", path.string());
            return {};
        }
        auto buffer = std::stringstream {};
        buffer << file.rdbuf();
        return buffer.str();
    }
} // namespace

auto loadWorkspacePrompt(const std::filesystem::path& root) -> std::string
{
    auto const shared = readOptionalText(root / ".agentloop" / "workspace.md");
    auto const local = readOptionalText(root / ".agentloop" / "workspace.local.md");
    return joinNonEmpty({ shared, local });
}

AgentCatalog::AgentCatalog(std::filesystem::path root,
                           std::map<std::string, AgentOverride> overrides,
                           std::chrono::milliseconds ttl):
    _root(std::move(root)), _overrides(std::move(overrides)), _ttl(ttl)
{
}

auto AgentCatalog::snapshot() -> AgentSnapshot
{
    auto lock = std::lock_guard(_mutex);
    auto const now = std::chrono::steady_clock::now();
    if (!_cached || now - _loadedAt > _ttl)
    {
        _cached = AgentSnapshot {
            .agents = mergeAgentPacks(builtInAgents(), _overrides),
            .workspacePrompt = loadWorkspacePrompt(_root),
        };
        _loadedAt = now;
        log::trace("Agent catalog reloaded ({} agents)", _cached->agents.size());
    }
    return *_cached;
}

} // namespace agentloop
