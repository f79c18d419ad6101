// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/AgentPack.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentloop
{

/// @brief Agents and workspace prompt as seen by one request.
struct AgentSnapshot
{
    std::vector<AgentPack> agents; // sorted by name, never empty
    std::string workspacePrompt;
};

/// @brief Reads `.agentloop/workspace.md` and `.agentloop/workspace.local.md` under @p root.
///
/// Missing files contribute nothing; both parts are trimmed and joined with a blank line.
[[nodiscard]] auto loadWorkspacePrompt(const std::filesystem::path& root) -> std::string;

/// @brief Time-bounded cache of agent packs and the workspace prompt.
///
/// Constructed once and shared by reference. Thread-safe.
class AgentCatalog
{
  public:
    AgentCatalog(std::filesystem::path root,
                 std::map<std::string, AgentOverride> overrides,
                 std::chrono::milliseconds ttl = std::chrono::milliseconds(2'000));

    /// @brief Returns the cached snapshot, reloading it when older than the TTL.
    [[nodiscard]] auto snapshot() -> AgentSnapshot;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return _root; }

  private:
    std::filesystem::path _root;
    std::map<std::string, AgentOverride> _overrides;
    std::chrono::milliseconds _ttl;

    std::mutex _mutex;
    std::optional<AgentSnapshot> _cached;
    std::chrono::steady_clock::time_point _loadedAt;
};

} // namespace agentloop
