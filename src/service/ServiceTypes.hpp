// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace agentloop
{

/// @brief What a backend provides.
enum class ServiceKind
{
    Tts,
    Llm,
    Vlm,
};

[[nodiscard]] constexpr auto serviceKindToString(ServiceKind kind) -> std::string_view
{
    switch (kind)
    {
        case ServiceKind::Tts: return "tts";
        case ServiceKind::Llm: return "llm";
        case ServiceKind::Vlm: return "vlm";
    }
    return "llm";
}

/// @brief Lifecycle status of a supervised backend.
///
/// Transitions: stopped -> starting -> running -> stopping -> stopped,
/// with error reachable from starting and running.
enum class ServiceStatus
{
    Stopped,
    Starting,
    Running,
    Stopping,
    Error,
};

[[nodiscard]] constexpr auto serviceStatusToString(ServiceStatus status) -> std::string_view
{
    switch (status)
    {
        case ServiceStatus::Stopped: return "stopped";
        case ServiceStatus::Starting: return "starting";
        case ServiceStatus::Running: return "running";
        case ServiceStatus::Stopping: return "stopping";
        case ServiceStatus::Error: return "error";
    }
    return "stopped";
}

/// @brief Static description of a known backend.
struct ServiceDescriptor
{
    std::string_view name;
    std::string_view title;
    std::string_view summary;
    ServiceKind kind = ServiceKind::Llm;
    std::string_view defaultHost;
    int defaultPort = 0;
    std::string_view healthPath;
    std::string_view installCheckPath; // venv interpreter, relative to the workspace root
    std::chrono::milliseconds readyTimeout { 30'000 };
};

/// @brief Returns the catalogue of supervised backends (kokomo, chatterbox, mlx, vlm).
[[nodiscard]] auto serviceCatalog() -> std::span<const ServiceDescriptor>;

/// @brief Looks up a backend by name.
/// @return The descriptor, or nullptr for unknown names.
[[nodiscard]] auto findService(std::string_view name) -> const ServiceDescriptor*;

/// @brief Observable state of one backend.
struct ServiceState
{
    std::string name;
    ServiceStatus status = ServiceStatus::Stopped;
    std::optional<int> pid;
    std::string detail;
    std::optional<int> lastExitCode;
    std::optional<std::string> lastError;
};

/// @brief Serializes a service state for the wire protocol.
[[nodiscard]] auto toJson(const ServiceState& state) -> nlohmann::json;

/// @brief Which output stream of a child process a line came from.
enum class OutputStream
{
    Stdout,
    Stderr,
};

[[nodiscard]] constexpr auto outputStreamToString(OutputStream stream) -> std::string_view
{
    return stream == OutputStream::Stdout ? "stdout" : "stderr";
}

/// @brief A backend changed state.
struct ServiceStatusChanged
{
    ServiceState state;
};

/// @brief A backend printed a line.
struct ServiceLogLine
{
    std::string name;
    OutputStream stream = OutputStream::Stdout;
    std::string line;
};

using ServiceEvent = std::variant<ServiceStatusChanged, ServiceLogLine>;

/// @brief Receives service events. May be called from any thread.
using ServiceListener = std::function<void(const ServiceEvent& event)>;

} // namespace agentloop
