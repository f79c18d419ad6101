// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/AgentPack.hpp>
#include <core/Error.hpp>
#include <engine/EngineSettings.hpp>
#include <service/ServiceConfig.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace agentloop
{

/// @brief Listening socket configuration section.
struct ServerConfig
{
    std::string host = "127.0.0.1";
    std::uint16_t port = 7777; // 0 picks an ephemeral port
    std::string stateFile;     // empty: no state file
};

/// @brief Top-level application configuration.
struct AppConfig
{
    ServerConfig server;

    /// @brief Root of the workspace: confines fs.* tools and hosts `.agentloop/` and `scripts/services/`.
    std::filesystem::path workspaceRoot;

    EngineSettings engine;
    std::map<std::string, ServiceSettings> services;
    std::map<std::string, AgentOverride> agents;
};

/// @brief Builds a configuration from a parsed config document.
///
/// Unknown keys and values of the wrong type are ignored, so a partial file
/// only overrides what it names.
/// @return The configuration, or a ConfigError if @p root is not an object.
[[nodiscard]] auto parseConfig(const nlohmann::json& root) -> Result<AppConfig>;

/// @brief Loads the configuration from a specific file path.
/// @return The configuration, or an error if the file is missing or malformed.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Loads the configuration from the default path; a missing file yields defaults.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Returns `$XDG_CONFIG_HOME/agentloop`, else `~/.config/agentloop`.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Applies environment overrides (AGENTLOOP_*, MLX_*, VLM_*) on top of @p config.
void applyEnvironment(AppConfig& config);

/// @brief Path of the env file: `$AGENTLOOP_ENV_FILE`, else `<root>/.agentloop/env`.
[[nodiscard]] auto envFilePath(const std::filesystem::path& root) -> std::filesystem::path;

/// @brief Exports `KEY=value` lines from @p path into the process environment.
///
/// Blank lines and `#` comments are skipped, an `export ` prefix is allowed
/// and matching surrounding quotes are removed. Variables that are already
/// set keep their value. A missing file is not an error.
/// @return The number of variables set.
[[nodiscard]] auto loadEnvFile(const std::filesystem::path& path) -> Result<int>;

/// @brief Writes `{host, port, pid, startedAt}` JSON to @p path, creating parent directories.
[[nodiscard]] auto writeStateFile(const std::filesystem::path& path, std::string_view host, std::uint16_t port)
    -> VoidResult;

} // namespace agentloop
