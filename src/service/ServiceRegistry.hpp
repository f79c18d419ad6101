// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <service/HealthProbe.hpp>
#include <service/ServiceSupervisor.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace agentloop
{

/// @brief Supervises every backend of the service catalogue and fans out their events.
class ServiceRegistry
{
  public:
    using ListenerId = std::uint64_t;
    using ConfigSource = std::function<Result<ServiceConfig>(const ServiceDescriptor& descriptor)>;

    /// @param configSource Resolves the launch configuration of a backend.
    /// @param probe Health probe shared by all supervisors; must outlive the registry.
    /// @param timing Supervisor timing.
    ServiceRegistry(ConfigSource configSource, HealthProbe& probe, SupervisorTiming timing = {});
    ~ServiceRegistry();

    ServiceRegistry(const ServiceRegistry&) = delete;
    ServiceRegistry& operator=(const ServiceRegistry&) = delete;

    /// @brief Registers a listener for status and log events of all backends.
    [[nodiscard]] auto subscribe(ServiceListener listener) -> ListenerId;
    void unsubscribe(ListenerId id);

    /// @brief Starts a backend by name (blocking).
    [[nodiscard]] auto start(std::string_view name) -> VoidResult;

    /// @brief Stops a backend by name (blocking).
    [[nodiscard]] auto stop(std::string_view name) -> VoidResult;

    [[nodiscard]] auto state(std::string_view name) const -> Result<ServiceState>;

    /// @brief States of all backends, in catalogue order.
    [[nodiscard]] auto states() const -> std::vector<ServiceState>;

    /// @brief States worth showing by default: everything except cleanly stopped backends.
    [[nodiscard]] auto visibleStates() const -> std::vector<ServiceState>;

    [[nodiscard]] auto canStart(std::string_view name) const -> bool;
    [[nodiscard]] auto isHealthy(std::string_view name,
                                 std::chrono::milliseconds timeout = std::chrono::milliseconds(250)) const -> bool;
    [[nodiscard]] auto isRunning(std::string_view name) const -> bool;

    /// @brief Starts every backend whose configuration opts in. Failures are logged.
    void autoStartIfConfigured();

    /// @brief Stops all owned backend processes.
    void shutdown();

  private:
    [[nodiscard]] auto find(std::string_view name) const -> ServiceSupervisor*;
    void publish(const ServiceEvent& event);

    std::vector<std::unique_ptr<ServiceSupervisor>> _supervisors;

    mutable std::mutex _listenerMutex;
    std::map<ListenerId, ServiceListener> _listeners;
    ListenerId _nextListenerId = 1;
};

} // namespace agentloop
