// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace agentloop
{

class ServiceRegistry;

/// @brief A validated tool invocation parsed from model output.
struct ToolRequest
{
    std::string name;
    nlohmann::json args = nlohmann::json::object();
};

/// @brief Outcome of running a tool. Failures are values, never exceptions.
struct ToolOutcome
{
    bool ok = false;
    nlohmann::json result; // set when ok
    std::string error;     // set when !ok

    [[nodiscard]] static auto success(nlohmann::json value) -> ToolOutcome { return { true, std::move(value), {} }; }
    [[nodiscard]] static auto failure(std::string message) -> ToolOutcome { return { false, nullptr, std::move(message) }; }

    /// @brief `{"ok":true,"result":...}` or `{"ok":false,"error":"..."}`.
    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/// @brief True for time.now, fs.read, fs.list, service.status and logo.fetch.
[[nodiscard]] auto isKnownToolName(std::string_view name) -> bool;

/// @brief The tool-protocol instructions, listing only @p allowedTools.
[[nodiscard]] auto toolSystemPrompt(const std::filesystem::path& root, std::span<const std::string> allowedTools)
    -> std::string;

/// @brief Finds the first `TOOL_CALL:` line and validates it.
///
/// The call must name a tool in @p allowedTools and its arguments must have
/// the shape the tool expects.
/// @return The request, or std::nullopt when the text holds no valid call.
[[nodiscard]] auto parseToolCall(std::string_view text, std::span<const std::string> allowedTools)
    -> std::optional<ToolRequest>;

/// @brief Formats the line fed back to the model: `TOOL_RESULT: {"name":...,"ok":...}`.
[[nodiscard]] auto formatToolResult(std::string_view name, const ToolOutcome& outcome) -> std::string;

/// @brief Removes TOOL_CALL and TOOL_RESULT lines and trims the remainder.
[[nodiscard]] auto stripToolProtocol(std::string_view text) -> std::string;

/// @brief Resolves a workspace-relative path, refusing anything that leaves @p root.
/// @return The absolute path, or a PathEscape error.
[[nodiscard]] auto resolveWorkspacePath(const std::filesystem::path& root, std::string_view relative)
    -> Result<std::filesystem::path>;

/// @brief Lower-cases and validates a domain name (`[a-z0-9.-]+\.[a-z]{2,}`).
[[nodiscard]] auto validateDomain(std::string_view domain) -> Result<std::string>;

/// @brief Executes the built-in tools against a workspace root.
class Toolbox
{
  public:
    /// @param root Workspace root that confines fs.* tools and hosts the logo cache.
    /// @param services Source of service.status answers; may be null.
    Toolbox(std::filesystem::path root, const ServiceRegistry* services);

    /// @brief Runs a tool synchronously.
    [[nodiscard]] auto run(const ToolRequest& request) const -> ToolOutcome;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return _root; }

  private:
    [[nodiscard]] auto timeNow() const -> Result<nlohmann::json>;
    [[nodiscard]] auto readFile(const nlohmann::json& args) const -> Result<nlohmann::json>;
    [[nodiscard]] auto listDirectory(const nlohmann::json& args) const -> Result<nlohmann::json>;
    [[nodiscard]] auto serviceStatus(const nlohmann::json& args) const -> Result<nlohmann::json>;
    [[nodiscard]] auto fetchLogo(const nlohmann::json& args) const -> Result<nlohmann::json>;

    std::filesystem::path _root;
    const ServiceRegistry* _services;
};

} // namespace agentloop
