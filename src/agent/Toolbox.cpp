// SPDX-License-Identifier: Apache-2.0
#include "Toolbox.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/TextUtils.hpp>
#include <net/HttpClient.hpp>
#include <service/ServiceRegistry.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <format>
#include <fstream>
#include <regex>

namespace agentloop
{

namespace fs = std::filesystem;

namespace
{
    constexpr auto KnownTools = std::array<std::string_view, 5> {
        "time.now", "fs.read", "fs.list", "service.status", "logo.fetch",
    };

    constexpr auto DefaultReadLimit = std::uintmax_t { 65'536 };

    auto toolPromptLine(std::string_view name, const fs::path& root) -> std::string
    {
        if (name == "time.now")
            return "- time.now args={} -> { iso, epochMs }";
        if (name == "fs.read")
            return std::format("- fs.read args={{\"path\":\"<repo-relative>\",\"maxBytes\":65536}} -> "
                               "{{ path, bytes, content }} (repo root: {})",
                               root.string());
        if (name == "fs.list")
            return "- fs.list args={\"path\":\"<repo-relative>\"} -> { path, entries:[{name,type}] }";
        if (name == "service.status")
            return "- service.status args={\"name\":\"kokomo\"|\"chatterbox\"|\"mlx\"|\"vlm\"} -> ServiceState";
        if (name == "logo.fetch")
            return "- logo.fetch args={\"domain\":\"example.com\"} -> { domain, url, filePath, bytes, cached }";
        return {};
    }

    auto isAllowed(std::span<const std::string> allowed, std::string_view name) -> bool
    {
        return std::ranges::find(allowed, name) != allowed.end();
    }

    auto stringArg(const nlohmann::json& args, const char* key) -> std::optional<std::string>
    {
        if (args.is_object() && args.contains(key) && args[key].is_string())
            return args[key].get<std::string>();
        return std::nullopt;
    }

    /// @brief Validates the argument shape of a tool call.
    auto validateArgs(std::string_view name, const nlohmann::json& args) -> std::optional<nlohmann::json>
    {
        if (name == "time.now")
        {
            if (args.is_null() || args.is_object())
                return nlohmann::json::object();
            return std::nullopt;
        }

        if (!args.is_object())
            return std::nullopt;

        if (name == "fs.read")
        {
            auto const path = stringArg(args, "path");
            if (!path)
                return std::nullopt;
            auto out = nlohmann::json { { "path", *path } };
            if (args.contains("maxBytes") && !args["maxBytes"].is_null())
            {
                auto const& maxBytes = args["maxBytes"];
                if (!maxBytes.is_number() || !std::isfinite(maxBytes.get<double>()) || maxBytes.get<double>() <= 0)
                    return std::nullopt;
                out["maxBytes"] = maxBytes;
            }
            return out;
        }

        if (name == "fs.list")
        {
            auto const path = stringArg(args, "path");
            if (!path)
                return std::nullopt;
            return nlohmann::json { { "path", *path } };
        }

        if (name == "service.status")
        {
            auto const service = stringArg(args, "name");
            if (!service || !findService(*service))
                return std::nullopt;
            return nlohmann::json { { "name", *service } };
        }

        if (name == "logo.fetch")
        {
            auto const domain = stringArg(args, "domain");
            if (!domain)
                return std::nullopt;
            return nlohmann::json { { "domain", *domain } };
        }

        return std::nullopt;
    }

    auto isToolProtocolLine(std::string_view line) -> bool
    {
        auto const trimmed = text::trim(line);
        return trimmed.starts_with("TOOL_CALL:") || trimmed.starts_with("TOOL_RESULT:");
    }
} // namespace

auto ToolOutcome::toJson() const -> nlohmann::json
{
    if (ok)
        return { { "ok", true }, { "result", result } };
    return { { "ok", false }, { "error", error } };
}

auto isKnownToolName(std::string_view name) -> bool
{
    return std::ranges::find(KnownTools, name) != KnownTools.end();
}

auto toolSystemPrompt(const fs::path& root, std::span<const std::string> allowedTools) -> std::string
{
    auto prompt = std::string {};
    prompt += "You may call tools when helpful. To call a tool, output a single line:\n";
    prompt += "TOOL_CALL: {\"name\":\"...\",\"args\":{...}}\n";
    prompt += "\n";
    prompt += "Available tools:\n";
    for (auto const name: KnownTools)
    {
        if (isAllowed(allowedTools, name))
            prompt += toolPromptLine(name, root) + "\n";
    }
    prompt += "\n";
    prompt += "Rules:\n";
    prompt += "- Only use repo-relative paths for fs.* tools.\n";
    prompt += "- Call at most one tool at a time; wait for TOOL_RESULT in the next message before continuing.";
    return prompt;
}

auto parseToolCall(std::string_view text, std::span<const std::string> allowedTools) -> std::optional<ToolRequest>
{
    constexpr auto Marker = std::string_view { "TOOL_CALL:" };

    for (auto const line: text::splitLines(text))
    {
        auto const trimmed = text::trim(line);
        if (!trimmed.starts_with(Marker))
            continue;

        auto const payload = nlohmann::json::parse(text::trim(trimmed.substr(Marker.size())), nullptr, false);
        if (payload.is_discarded() || !payload.is_object())
            return std::nullopt;

        auto const name = stringArg(payload, "name");
        if (!name || !isKnownToolName(*name) || !isAllowed(allowedTools, *name))
            return std::nullopt;

        auto args = validateArgs(*name, payload.contains("args") ? payload["args"] : nlohmann::json());
        if (!args)
            return std::nullopt;

        return ToolRequest { .name = *name, .args = std::move(*args) };
    }
    return std::nullopt;
}

auto formatToolResult(std::string_view name, const ToolOutcome& outcome) -> std::string
{
    auto body = nlohmann::json { { "name", name }, { "ok", outcome.ok } };
    if (outcome.ok)
        body["result"] = outcome.result;
    else
        body["error"] = outcome.error;
    return std::format("TOOL_RESULT: {}", json::dump(body));
}

auto stripToolProtocol(std::string_view text) -> std::string
{
    auto kept = std::string {};
    for (auto const line: text::splitLines(text))
    {
        if (isToolProtocolLine(line))
            continue;
        if (!kept.empty())
            kept += '\n';
        kept.append(line);
    }
    return std::string(text::trim(kept));
}

auto resolveWorkspacePath(const fs::path& root, std::string_view relative) -> Result<fs::path>
{
    if (relative.empty())
        return makeError(ErrorCode::PathEscape, "path is required");

    auto normalized = std::string(relative);
    std::ranges::replace(normalized, '\\', '/');

    if (normalized.starts_with('/') || fs::path(relative).is_absolute())
        return makeError(ErrorCode::PathEscape, "absolute paths are not allowed");

    if (normalized == ".." || normalized.starts_with("../") || normalized.find("/../") != std::string::npos
        || normalized.ends_with("/.."))
        return makeError(ErrorCode::PathEscape, "path traversal is not allowed");

    auto ec = std::error_code {};
    auto const base = fs::weakly_canonical(root, ec);
    if (ec)
        return makeError(ErrorCode::IoError, std::format("cannot resolve repo root: {}", ec.message()));

    auto const full = fs::weakly_canonical(base / normalized, ec);
    if (ec)
        return makeError(ErrorCode::IoError, std::format("cannot resolve path: {}", ec.message()));

    // Symlinks can still lead outside even without "..".
    auto const rel = full.lexically_relative(base);
    if (rel.empty() || rel.is_absolute() || *rel.begin() == "..")
    {
        if (full != base)
            return makeError(ErrorCode::PathEscape, "path escapes repo root");
    }
    return full;
}

auto validateDomain(std::string_view domain) -> Result<std::string>
{
    static auto const pattern = std::regex("^[a-z0-9.-]+\\.[a-z]{2,}$");

    auto clean = text::toLower(text::trim(domain));
    if (!std::regex_match(clean, pattern))
        return makeError(ErrorCode::InvalidArgument, "invalid domain");
    return clean;
}

Toolbox::Toolbox(fs::path root, const ServiceRegistry* services): _root(std::move(root)), _services(services)
{
}

auto Toolbox::run(const ToolRequest& request) const -> ToolOutcome
{
    log::debug("Running tool {} {}", request.name, json::dump(request.args));

    auto result = Result<nlohmann::json> {};
    if (request.name == "time.now")
        result = timeNow();
    else if (request.name == "fs.read")
        result = readFile(request.args);
    else if (request.name == "fs.list")
        result = listDirectory(request.args);
    else if (request.name == "service.status")
        result = serviceStatus(request.args);
    else if (request.name == "logo.fetch")
        result = fetchLogo(request.args);
    else
        return ToolOutcome::failure(std::format("unknown tool: {}", request.name));

    if (!result)
    {
        log::debug("Tool {} failed: {}", request.name, result.error().message);
        return ToolOutcome::failure(result.error().message);
    }
    return ToolOutcome::success(std::move(*result));
}

auto Toolbox::timeNow() const -> Result<nlohmann::json>
{
    auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    return nlohmann::json {
        { "iso", std::format("{:%FT%TZ}", now) },
        { "epochMs", now.time_since_epoch().count() },
    };
}

auto Toolbox::readFile(const nlohmann::json& args) const -> Result<nlohmann::json>
{
    auto const relative = stringArg(args, "path").value_or(std::string {});
    auto full = resolveWorkspacePath(_root, relative);
    if (!full)
        return std::unexpected(full.error());

    auto ec = std::error_code {};
    if (!fs::is_regular_file(*full, ec))
        return makeError(ErrorCode::IoError, "file does not exist");

    auto const size = fs::file_size(*full, ec);
    if (ec)
        return makeError(ErrorCode::IoError, std::format("cannot stat file: {}", ec.message()));

    // Clamped while still a double; casting values beyond uintmax_t is undefined.
    auto limit = DefaultReadLimit;
    if (args.contains("maxBytes") && args["maxBytes"].is_number())
    {
        auto const requested = std::floor(args["maxBytes"].get<double>());
        limit = requested >= static_cast<double>(size) ? size : static_cast<std::uintmax_t>(requested);
    }

    auto file = std::ifstream(*full, std::ios::binary);
    if (!file)
        return makeError(ErrorCode::IoError, "cannot open file");

    auto content = std::string(static_cast<std::size_t>(std::min(size, limit)), '\0');
    file.read(content.data(), static_cast<std::streamsize>(content.size()));
    content.resize(static_cast<std::size_t>(file.gcount()));

    return nlohmann::json { { "path", relative }, { "bytes", size }, { "content", std::move(content) } };
}

auto Toolbox::listDirectory(const nlohmann::json& args) const -> Result<nlohmann::json>
{
    auto const relative = stringArg(args, "path").value_or(std::string {});
    auto full = resolveWorkspacePath(_root, relative);
    if (!full)
        return std::unexpected(full.error());

    auto ec = std::error_code {};
    auto it = fs::directory_iterator(*full, ec);
    if (ec)
        return makeError(ErrorCode::IoError, std::format("cannot list directory: {}", ec.message()));

    auto entries = std::vector<std::pair<std::string, std::string_view>> {};
    for (; it != fs::directory_iterator {}; it.increment(ec))
    {
        auto statusError = std::error_code {};
        auto const type = it->is_directory(statusError)      ? "dir"
                          : it->is_regular_file(statusError) ? "file"
                                                             : "other";
        entries.emplace_back(it->path().filename().string(), type);
    }
    if (ec)
        return makeError(ErrorCode::IoError, std::format("cannot list directory: {}", ec.message()));
    std::ranges::sort(entries);

    auto list = nlohmann::json::array();
    for (auto const& [name, type]: entries)
        list.push_back({ { "name", name }, { "type", type } });

    return nlohmann::json { { "path", relative }, { "entries", std::move(list) } };
}

auto Toolbox::serviceStatus(const nlohmann::json& args) const -> Result<nlohmann::json>
{
    if (!_services)
        return makeError(ErrorCode::ToolCallError, "service supervision is not available");

    auto state = _services->state(stringArg(args, "name").value_or(std::string {}));
    if (!state)
        return std::unexpected(state.error());
    return toJson(*state);
}

auto Toolbox::fetchLogo(const nlohmann::json& args) const -> Result<nlohmann::json>
{
    auto domain = validateDomain(stringArg(args, "domain").value_or(std::string {}));
    if (!domain)
        return std::unexpected(domain.error());

    auto const url = std::format("https://logo.clearbit.com/{}", *domain);
    auto const cacheDir = _root / ".agentloop" / "cache" / "logos";
    auto const target = cacheDir / std::format("{}.png", *domain);

    auto ec = std::error_code {};
    fs::create_directories(cacheDir, ec);
    if (ec)
        return makeError(ErrorCode::IoError, std::format("cannot create logo cache: {}", ec.message()));

    if (fs::is_regular_file(target, ec))
    {
        auto const size = fs::file_size(target, ec);
        if (!ec)
        {
            return nlohmann::json {
                { "domain", *domain }, { "url", url }, { "filePath", target.string() }, { "bytes", size }, { "cached", true },
            };
        }
    }

    auto response = http::fetch(http::Request { .method = "GET", .url = url, .accept = "image/*" });
    if (!response)
        return std::unexpected(response.error());
    if (!response->ok())
        return makeError(ErrorCode::BackendError, std::format("fetch failed ({})", response->status));
    if (response->body.empty())
        return makeError(ErrorCode::BackendError, "empty response");

    auto file = std::ofstream(target, std::ios::binary | std::ios::trunc);
    if (!file.write(response->body.data(), static_cast<std::streamsize>(response->body.size())))
        return makeError(ErrorCode::IoError, std::format("cannot write {}", target.string()));

    return nlohmann::json {
        { "domain", *domain },
        { "url", url },
        { "filePath", target.string() },
        { "bytes", response->body.size() },
        { "cached", false },
    };
}

} // namespace agentloop
