// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/Env.hpp>
#include <core/Ids.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/TextUtils.hpp>
#include <engine/Workbench.hpp>

#include <chrono>
#include <cstdlib>
#include <format>
#include <fstream>
#include <initializer_list>
#include <sstream>

#ifdef _WIN32
    #include <process.h>
#else
    #include <unistd.h>
#endif

namespace agentloop
{

namespace
{

    auto getOptionalString(const nlohmann::json& obj, std::string_view key) -> std::optional<std::string>
    {
        auto const keyStr = std::string(key);
        if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_string())
            return obj[keyStr].get<std::string>();
        return std::nullopt;
    }

    auto getOptionalInt(const nlohmann::json& obj, std::string_view key) -> std::optional<int>
    {
        auto const keyStr = std::string(key);
        if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_number_integer())
            return obj[keyStr].get<int>();
        return std::nullopt;
    }

    auto getOptionalDouble(const nlohmann::json& obj, std::string_view key) -> std::optional<double>
    {
        auto const keyStr = std::string(key);
        if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_number())
            return obj[keyStr].get<double>();
        return std::nullopt;
    }

    auto getOptionalBool(const nlohmann::json& obj, std::string_view key) -> std::optional<bool>
    {
        auto const keyStr = std::string(key);
        if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_boolean())
            return obj[keyStr].get<bool>();
        return std::nullopt;
    }

    void parseLlmSection(const nlohmann::json& llm, LlmSettings& out)
    {
        out.baseUrl = json::getStringOr(llm, "baseUrl", out.baseUrl);
        out.quickBaseUrl = json::getStringOr(llm, "quickBaseUrl", out.quickBaseUrl);
        out.model = json::getStringOr(llm, "model", out.model);

        // The quick path follows an explicitly chosen model unless it names its own.
        if (auto quick = getOptionalString(llm, "quickModel"))
            out.quickModel = std::move(*quick);
        else if (getOptionalString(llm, "model"))
            out.quickModel = out.model;

        out.followupModel = json::getStringOr(llm, "followupModel", out.followupModel);
        out.timeout = std::chrono::milliseconds(
            json::getIntOr(llm, "timeoutMs", static_cast<int>(out.timeout.count())));
        out.maxTokens = json::getIntOr(llm, "maxTokens", out.maxTokens);
        out.quickMaxTokens = json::getIntOr(llm, "quickMaxTokens", out.quickMaxTokens);
        out.followupMaxTokens = json::getIntOr(llm, "followupMaxTokens", out.followupMaxTokens);
        out.temperature = getOptionalDouble(llm, "temperature").value_or(out.temperature);
        if (auto t = getOptionalDouble(llm, "quickTemperature"))
            out.quickTemperature = t;
        if (auto t = getOptionalDouble(llm, "followupTemperature"))
            out.followupTemperature = t;
        out.topP = getOptionalDouble(llm, "topP").value_or(out.topP);
        out.prefer = json::getBoolOr(llm, "prefer", out.prefer);
    }

    void parseVlmSection(const nlohmann::json& vlm, VlmSettings& out)
    {
        out.baseUrl = json::getStringOr(vlm, "baseUrl", out.baseUrl);
        out.model = json::getStringOr(vlm, "model", out.model);
        out.timeout = std::chrono::milliseconds(
            json::getIntOr(vlm, "timeoutMs", static_cast<int>(out.timeout.count())));
        out.maxTokens = json::getIntOr(vlm, "maxTokens", out.maxTokens);
        out.temperature = getOptionalDouble(vlm, "temperature").value_or(out.temperature);
    }

    void parseEngineSection(const nlohmann::json& engine, EngineSettings& out)
    {
        out.quickFollowup = json::getBoolOr(engine, "quickFollowup", out.quickFollowup);
        out.followupMinChars = json::getIntOr(engine, "followupMinChars", out.followupMinChars);
        out.followupMinPromptChars = json::getIntOr(engine, "followupMinPromptChars", out.followupMinPromptChars);
        out.systemPrompt = json::getStringOr(engine, "systemPrompt", out.systemPrompt);

        if (auto list = json::getStringArray(engine, "workbench"))
        {
            auto joined = std::string {};
            for (const auto& name: *list)
                joined += name + ",";
            out.workbench = parseWorkbenchStrategies(joined);
        }
        else if (auto text = getOptionalString(engine, "workbench"))
            out.workbench = parseWorkbenchStrategies(*text);
    }

    auto parseServiceSettings(const nlohmann::json& obj) -> ServiceSettings
    {
        auto settings = ServiceSettings {
            .command = json::getStringArray(obj, "command"),
            .host = getOptionalString(obj, "host"),
            .port = getOptionalInt(obj, "port"),
            .healthUrl = getOptionalString(obj, "healthUrl"),
            .readyTimeoutMs = getOptionalInt(obj, "readyTimeoutMs"),
            .autoStart = getOptionalBool(obj, "autoStart"),
        };
        if (settings.command && settings.command->empty())
            settings.command.reset();
        return settings;
    }

    auto parseAgentOverride(const nlohmann::json& obj) -> AgentOverride
    {
        return AgentOverride {
            .description = getOptionalString(obj, "description"),
            .prompt = getOptionalString(obj, "prompt"),
            .tools = json::getStringArray(obj, "tools"),
            .maxToolCalls = getOptionalInt(obj, "maxToolCalls"),
            .maxHistoryTurns = getOptionalInt(obj, "maxHistoryTurns"),
            .temperature = getOptionalDouble(obj, "temperature"),
        };
    }

    auto envInt(std::string_view key) -> std::optional<int>
    {
        if (auto value = env::getNumber(key))
            return static_cast<int>(*value);
        return std::nullopt;
    }

    /// Returns the first set variable of @p keys.
    auto envFirst(std::initializer_list<std::string_view> keys) -> std::optional<std::string>
    {
        for (auto const key: keys)
            if (auto value = env::getString(key))
                return value;
        return std::nullopt;
    }

    auto envFirstNumber(std::initializer_list<std::string_view> keys) -> std::optional<double>
    {
        for (auto const key: keys)
            if (auto value = env::getNumber(key))
                return value;
        return std::nullopt;
    }

    auto unquote(std::string_view value) -> std::string_view
    {
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
            return value.substr(1, value.size() - 2);
        return value;
    }

    auto currentPid() -> long
    {
#ifdef _WIN32
        return static_cast<long>(_getpid());
#else
        return static_cast<long>(::getpid());
#endif
    }

} // namespace

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\agentloop";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/agentloop";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/agentloop";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(const nlohmann::json& root) -> Result<AppConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto config = AppConfig {};

    // Server section
    if (root.contains("server"))
    {
        auto const& server = root["server"];
        config.server.host = json::getStringOr(server, "host", config.server.host);
        auto const port = json::getIntOr(server, "port", config.server.port);
        if (port >= 0 && port <= 65535)
            config.server.port = static_cast<std::uint16_t>(port);
        else
            log::warning("Ignoring out-of-range server.port {}", port);
        config.server.stateFile = json::getStringOr(server, "stateFile", "");
    }

    if (auto workspace = getOptionalString(root, "workspaceRoot"))
        config.workspaceRoot = *workspace;

    if (root.contains("llm"))
        parseLlmSection(root["llm"], config.engine.llm);

    if (root.contains("vlm"))
        parseVlmSection(root["vlm"], config.engine.vlm);

    if (root.contains("engine"))
        parseEngineSection(root["engine"], config.engine);

    // Services section
    if (root.contains("services") && root["services"].is_object())
    {
        for (const auto& [name, serviceJson]: root["services"].items())
        {
            if (!findService(name))
            {
                log::warning("Ignoring settings for unknown service '{}'", name);
                continue;
            }
            config.services[name] = parseServiceSettings(serviceJson);
        }
    }

    // Agents section
    if (root.contains("agents") && root["agents"].is_object())
    {
        for (const auto& [name, agentJson]: root["agents"].items())
        {
            if (!agentJson.is_object())
                continue;
            config.agents[name] = parseAgentOverride(agentJson);
        }
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    return parseConfig(*parseResult);
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

void applyEnvironment(AppConfig& config)
{
    // Server
    if (auto host = env::getString("AGENTLOOP_HOST"))
        config.server.host = *host;
    if (auto port = envInt("AGENTLOOP_PORT"); port && *port >= 0 && *port <= 65535)
        config.server.port = static_cast<std::uint16_t>(*port);
    if (auto stateFile = env::getString("AGENTLOOP_STATE_FILE"))
        config.server.stateFile = *stateFile;
    if (auto root = env::getString("AGENTLOOP_ROOT"))
        config.workspaceRoot = *root;

    // Text LLM
    auto& llm = config.engine.llm;
    auto const defaultQuickModel = LlmSettings {}.quickModel;
    if (auto url = env::getString("AGENTLOOP_MLX_URL"))
        llm.baseUrl = *url;
    if (auto url = env::getString("AGENTLOOP_MLX_URL_QUICK"))
        llm.quickBaseUrl = *url;
    if (auto model = envFirst({ "AGENTLOOP_MLX_MODEL", "MLX_MODEL" }))
    {
        llm.model = *model;
        if (llm.quickModel == defaultQuickModel)
            llm.quickModel = *model;
    }
    if (auto model = env::getString("AGENTLOOP_MLX_MODEL_QUICK"))
        llm.quickModel = *model;
    if (auto model = env::getString("AGENTLOOP_MLX_MODEL_FOLLOWUP"))
        llm.followupModel = *model;
    if (auto timeout = envInt("AGENTLOOP_MLX_TIMEOUT_MS"); timeout && *timeout > 0)
        llm.timeout = std::chrono::milliseconds(*timeout);
    if (auto n = envFirstNumber({ "AGENTLOOP_MLX_MAX_TOKENS", "MLX_MAX_TOKENS" }))
        llm.maxTokens = static_cast<int>(*n);
    if (auto n = envInt("AGENTLOOP_MLX_MAX_TOKENS_QUICK"))
        llm.quickMaxTokens = *n;
    if (auto n = envInt("AGENTLOOP_MLX_MAX_TOKENS_FOLLOWUP"))
        llm.followupMaxTokens = *n;
    if (auto t = envFirstNumber({ "AGENTLOOP_MLX_TEMPERATURE", "MLX_TEMPERATURE" }))
        llm.temperature = *t;
    if (auto t = env::getNumber("AGENTLOOP_MLX_TEMPERATURE_QUICK"))
        llm.quickTemperature = *t;
    if (auto t = env::getNumber("AGENTLOOP_MLX_TEMPERATURE_FOLLOWUP"))
        llm.followupTemperature = *t;
    if (auto p = envFirstNumber({ "AGENTLOOP_MLX_TOP_P", "MLX_TOP_P" }))
        llm.topP = *p;
    if (auto prefer = env::getString("AGENTLOOP_LLM"))
        llm.prefer = text::toLower(*prefer) == "mlx";

    // Vision
    auto& vlm = config.engine.vlm;
    if (auto url = env::getString("VLM_URL"))
        vlm.baseUrl = *url;
    else if (env::getString("VLM_HOST") || env::getString("VLM_PORT"))
        vlm.baseUrl = std::format("http://{}:{}",
                                  env::getString("VLM_HOST").value_or("127.0.0.1"),
                                  env::getString("VLM_PORT").value_or("12346"));
    if (auto model = env::getString("VLM_MODEL"))
        vlm.model = *model;
    if (auto timeout = envInt("VLM_TIMEOUT_MS"); timeout && *timeout > 0)
        vlm.timeout = std::chrono::milliseconds(*timeout);
    if (auto n = envInt("VLM_MAX_TOKENS"))
        vlm.maxTokens = *n;
    if (auto t = env::getNumber("VLM_TEMPERATURE"))
        vlm.temperature = *t;

    // Pipeline
    auto& engine = config.engine;
    if (auto followup = env::getString("AGENTLOOP_QUICK_FOLLOWUP"))
        engine.quickFollowup = *followup != "0";
    if (auto n = envInt("AGENTLOOP_QUICK_FOLLOWUP_MIN_CHARS"))
        engine.followupMinChars = *n;
    if (auto n = envInt("AGENTLOOP_QUICK_FOLLOWUP_MIN_PROMPT_CHARS"))
        engine.followupMinPromptChars = *n;
    if (auto workbench = env::getString("AGENTLOOP_WORKBENCH"))
        engine.workbench = parseWorkbenchStrategies(*workbench);
    if (auto prompt = env::getString("AGENTLOOP_SYSTEM_PROMPT"))
        engine.systemPrompt = *prompt;
}

auto envFilePath(const std::filesystem::path& root) -> std::filesystem::path
{
    if (auto path = env::getString("AGENTLOOP_ENV_FILE"))
        return *path;
    return root / ".agentloop" / "env";
}

auto loadEnvFile(const std::filesystem::path& path) -> Result<int>
{
    auto ec = std::error_code {};
    if (!std::filesystem::exists(path, ec))
        return 0;

    auto file = std::ifstream(path);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open env file: {}", path.string()));

    auto count = 0;
    auto line = std::string {};
    while (std::getline(file, line))
    {
        auto entry = text::trim(line);
        if (entry.empty() || entry.front() == '#')
            continue;
        if (entry.starts_with("export "))
            entry = text::trim(entry.substr(7));

        auto const eq = entry.find('=');
        if (eq == std::string_view::npos)
            continue;

        auto const key = std::string(text::trim(entry.substr(0, eq)));
        auto const value = std::string(unquote(text::trim(entry.substr(eq + 1))));
        if (key.empty() || std::getenv(key.c_str()))
            continue;

        env::set(key, value);
        ++count;
    }

    log::debug("Loaded {} variable(s) from {}", count, path.string());
    return count;
}

auto writeStateFile(const std::filesystem::path& path, std::string_view host, std::uint16_t port) -> VoidResult
{
    auto const dir = path.parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to create state directory '{}': {}", dir.string(), ec.message()));
    }

    auto const state = nlohmann::json {
        { "host", std::string(host) },
        { "port", port },
        { "pid", currentPid() },
        { "startedAt", nowMillis() },
    };

    auto file = std::ofstream(path);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot write state file: {}", path.string()));

    file << json::dump(state, 2) << '\n';
    return {};
}

} // namespace agentloop
