// SPDX-License-Identifier: Apache-2.0
#include "ServiceConfig.hpp"

#include <core/Env.hpp>
#include <core/JsonUtils.hpp>
#include <core/ShellSplit.hpp>

#include <algorithm>
#include <cctype>
#include <format>

namespace agentloop
{

namespace
{
    auto commandFromEnv(const std::string& prefix) -> Result<std::vector<std::string>>
    {
        auto const jsonKey = prefix + "_CMD_JSON";
        if (auto const raw = env::getString(jsonKey))
        {
            auto parsed = json::parse(*raw);
            if (!parsed || !parsed->is_array()
                || !std::ranges::all_of(*parsed, [](const nlohmann::json& item) { return item.is_string(); }))
                return makeError(ErrorCode::ConfigError, std::format("{} must be a JSON array of strings.", jsonKey));
            return parsed->get<std::vector<std::string>>();
        }

        if (auto const raw = env::getString(prefix + "_CMD"))
            return shellSplit(*raw);

        return std::vector<std::string> {};
    }

    auto wrapperInstalled(const std::filesystem::path& root, const ServiceDescriptor& descriptor) -> bool
    {
        auto ec = std::error_code {};
        return std::filesystem::exists(wrapperScriptPath(root, descriptor), ec)
               && std::filesystem::exists(root / descriptor.installCheckPath, ec);
    }

    /// @brief Kokomo may be forced onto the wrapper before its venv exists.
    auto wrapperForced(const ServiceDescriptor& descriptor) -> bool
    {
        if (descriptor.name != "kokomo")
            return false;
        auto const local = env::getBool("AGENTLOOP_KOKOMO_LOCAL", false);
        return env::getBool("KOKOMO_USE_DEFAULTS", local) || local;
    }
} // namespace

auto serviceEnvPrefix(const ServiceDescriptor& descriptor) -> std::string
{
    auto prefix = std::string(descriptor.name);
    std::ranges::transform(prefix, prefix.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return prefix;
}

auto wrapperScriptPath(const std::filesystem::path& root, const ServiceDescriptor& descriptor)
    -> std::filesystem::path
{
    return root / "scripts" / "services" / std::string(descriptor.name) / "run-server.sh";
}

auto resolveServiceConfig(const ServiceDescriptor& descriptor,
                          const ServiceSettings& settings,
                          const std::filesystem::path& root) -> Result<ServiceConfig>
{
    auto const prefix = serviceEnvPrefix(descriptor);
    auto const canUseWrapper = wrapperInstalled(root, descriptor);

    auto config = ServiceConfig {};

    if (settings.command && !settings.command->empty())
        config.command = *settings.command;
    else
    {
        auto fromEnv = commandFromEnv(prefix);
        if (!fromEnv)
            return std::unexpected(fromEnv.error());
        config.command = std::move(*fromEnv);
    }

    if (config.command.empty() && (canUseWrapper || wrapperForced(descriptor)))
        config.command = { "bash", wrapperScriptPath(root, descriptor).string() };

    auto const host = env::getString(prefix + "_HOST").value_or(settings.host.value_or(std::string(descriptor.defaultHost)));
    auto const port = env::getString(prefix + "_PORT").value_or(std::to_string(settings.port.value_or(descriptor.defaultPort)));

    if (auto url = env::getString(prefix + "_HEALTH_URL"))
        config.healthUrl = std::move(*url);
    else if (settings.healthUrl)
        config.healthUrl = *settings.healthUrl;
    else if (!config.command.empty())
        config.healthUrl = std::format("http://{}:{}{}", host, port, descriptor.healthPath);

    if (auto const timeout = env::getNumber(prefix + "_READY_TIMEOUT_MS"))
        config.readyTimeout = std::chrono::milliseconds(static_cast<std::int64_t>(*timeout));
    else if (settings.readyTimeoutMs)
        config.readyTimeout = std::chrono::milliseconds(*settings.readyTimeoutMs);
    else
        config.readyTimeout = descriptor.readyTimeout;

    // The LLM backend is managed by default once its wrapper is installed.
    auto const autoStartDefault = settings.autoStart.value_or(descriptor.name == "mlx" && canUseWrapper);
    config.autoStart = env::getBool(std::format("AGENTLOOP_MANAGE_{}", prefix), autoStartDefault);

    return config;
}

auto notConfiguredMessage(const ServiceDescriptor& descriptor) -> std::string
{
    auto const prefix = serviceEnvPrefix(descriptor);
    return std::format("{} is not configured/installed.\n"
                       "\n"
                       "To use the built-in wrapper:\n"
                       "  1) run scripts/services/{}/install.sh\n"
                       "  2) then send service.start for \"{}\"\n"
                       "\n"
                       "Or provide your own command:\n"
                       "  - set {}_CMD or {}_CMD_JSON\n"
                       "  - or services.{}.command in the config file",
                       descriptor.title,
                       descriptor.name,
                       descriptor.name,
                       prefix,
                       prefix,
                       descriptor.name);
}

} // namespace agentloop
