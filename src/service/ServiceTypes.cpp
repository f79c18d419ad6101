// SPDX-License-Identifier: Apache-2.0
#include "ServiceTypes.hpp"

#include <algorithm>
#include <array>

namespace agentloop
{

namespace
{
    using namespace std::chrono_literals;

    constexpr auto DefaultHost = std::string_view { "127.0.0.1" };

    const auto Catalog = std::array<ServiceDescriptor, 4> {
        ServiceDescriptor {
            .name = "kokomo",
            .title = "Kokomo TTS",
            .summary = "local TTS (mlx-audio[tts])",
            .kind = ServiceKind::Tts,
            .defaultHost = DefaultHost,
            .defaultPort = 8880,
            .healthPath = "/health",
            .installCheckPath = "external/kokomo-mlx/.venv/bin/python",
            .readyTimeout = 15'000ms,
        },
        ServiceDescriptor {
            .name = "chatterbox",
            .title = "Chatterbox TTS",
            .summary = "local TTS (voice cloning)",
            .kind = ServiceKind::Tts,
            .defaultHost = DefaultHost,
            .defaultPort = 8890,
            .healthPath = "/health",
            .installCheckPath = "external/chatterbox-tts/.venv/bin/python",
            .readyTimeout = 30'000ms,
        },
        ServiceDescriptor {
            .name = "mlx",
            .title = "MLX LLM",
            .summary = "local LLM (mlx-lm)",
            .kind = ServiceKind::Llm,
            .defaultHost = DefaultHost,
            .defaultPort = 12345,
            .healthPath = "/health",
            .installCheckPath = "external/mlx-llm/.venv/bin/python",
            .readyTimeout = 30'000ms,
        },
        ServiceDescriptor {
            .name = "vlm",
            .title = "MLX VLM",
            .summary = "local VLM (mlx-vlm)",
            .kind = ServiceKind::Vlm,
            .defaultHost = DefaultHost,
            .defaultPort = 12346,
            .healthPath = "/health",
            .installCheckPath = "external/mlx-vlm/.venv/bin/python",
            .readyTimeout = 30'000ms,
        },
    };
} // namespace

auto serviceCatalog() -> std::span<const ServiceDescriptor>
{
    return Catalog;
}

auto findService(std::string_view name) -> const ServiceDescriptor*
{
    auto const it = std::ranges::find(Catalog, name, &ServiceDescriptor::name);
    return it != Catalog.end() ? &*it : nullptr;
}

auto toJson(const ServiceState& state) -> nlohmann::json
{
    auto out = nlohmann::json {
        { "name", state.name },
        { "status", serviceStatusToString(state.status) },
    };
    if (state.pid)
        out["pid"] = *state.pid;
    if (!state.detail.empty())
        out["detail"] = state.detail;
    if (state.lastExitCode)
        out["lastExitCode"] = *state.lastExitCode;
    if (state.lastError)
        out["lastError"] = *state.lastError;
    return out;
}

} // namespace agentloop
