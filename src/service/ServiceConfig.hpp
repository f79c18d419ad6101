// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <service/ServiceTypes.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace agentloop
{

/// @brief Per-backend settings from the config file. Unset fields fall back to env and defaults.
struct ServiceSettings
{
    std::optional<std::vector<std::string>> command;
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<std::string> healthUrl;
    std::optional<int> readyTimeoutMs;
    std::optional<bool> autoStart;
};

/// @brief Effective launch configuration of a backend, resolved at start time.
struct ServiceConfig
{
    std::vector<std::string> command; // empty when the backend is not configured
    std::string healthUrl;            // empty when readiness cannot be probed
    std::chrono::milliseconds readyTimeout { 30'000 };
    bool autoStart = false;
};

/// @brief Returns the upper-case environment prefix of a backend ("mlx" -> "MLX").
[[nodiscard]] auto serviceEnvPrefix(const ServiceDescriptor& descriptor) -> std::string;

/// @brief Path of the conventional wrapper script `scripts/services/<name>/run-server.sh`.
[[nodiscard]] auto wrapperScriptPath(const std::filesystem::path& root, const ServiceDescriptor& descriptor)
    -> std::filesystem::path;

/// @brief Resolves the launch configuration of a backend.
///
/// The command comes from @p settings, else `<NAME>_CMD_JSON`, else
/// `<NAME>_CMD` (shell-split), else the wrapper script when both it and the
/// venv interpreter exist under @p root. Host, port, health URL, readiness
/// timeout and auto-start read `<NAME>_HOST`, `<NAME>_PORT`,
/// `<NAME>_HEALTH_URL`, `<NAME>_READY_TIMEOUT_MS` and
/// `AGENTLOOP_MANAGE_<NAME>` first, then @p settings, then the defaults.
///
/// @return The configuration, or a ConfigError if `<NAME>_CMD_JSON` is malformed.
[[nodiscard]] auto resolveServiceConfig(const ServiceDescriptor& descriptor,
                                        const ServiceSettings& settings,
                                        const std::filesystem::path& root) -> Result<ServiceConfig>;

/// @brief Text explaining how to install or configure a backend that has no command.
[[nodiscard]] auto notConfiguredMessage(const ServiceDescriptor& descriptor) -> std::string;

} // namespace agentloop
