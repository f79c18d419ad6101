// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <service/HealthProbe.hpp>
#include <service/ManagedProcess.hpp>
#include <service/ServiceConfig.hpp>
#include <service/ServiceTypes.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

namespace agentloop
{

/// @brief Produces the current launch configuration of a backend.
///
/// Called on every start() and health query, so environment changes apply
/// without restarting the engine.
using ServiceConfigSource = std::function<Result<ServiceConfig>()>;

/// @brief Timing knobs of the supervisor.
struct SupervisorTiming
{
    std::chrono::milliseconds pollInterval { 250 };
    std::chrono::milliseconds maxProbeTimeout { 1'000 };
    std::chrono::milliseconds externalProbeTimeout { 300 };
    std::chrono::milliseconds stopGrace { 2'000 };
};

/// @brief Owns the lifecycle of one backend process.
///
/// All methods are thread-safe. start() and stop() block and are serialized
/// against each other; state() may be called at any time.
class ServiceSupervisor
{
  public:
    ServiceSupervisor(const ServiceDescriptor& descriptor,
                      ServiceConfigSource configSource,
                      HealthProbe& probe,
                      ServiceListener listener,
                      SupervisorTiming timing = {});
    ~ServiceSupervisor();

    ServiceSupervisor(const ServiceSupervisor&) = delete;
    ServiceSupervisor& operator=(const ServiceSupervisor&) = delete;

    /// @brief Starts the backend and waits until it is healthy.
    ///
    /// No-op when already starting or running. An endpoint that is already
    /// healthy is adopted as "Running (external)" without spawning.
    /// @return Success, a ConfigError when no command is configured, or the
    ///         spawn/readiness error (the backend is then stopped again).
    [[nodiscard]] auto start() -> VoidResult;

    /// @brief Stops the owned process, if any, and transitions to stopped.
    void stop();

    [[nodiscard]] auto state() const -> ServiceState;
    [[nodiscard]] auto descriptor() const -> const ServiceDescriptor& { return _descriptor; }

    /// @brief True when a launch command resolves to a non-empty argv.
    [[nodiscard]] auto canStart() const -> bool;

    /// @brief True when the configuration asks for auto-start.
    [[nodiscard]] auto autoStartRequested() const -> bool;

    /// @brief Probes the health URL once.
    [[nodiscard]] auto isHealthy(std::chrono::milliseconds timeout = std::chrono::milliseconds(250)) const -> bool;

  private:
    [[nodiscard]] auto waitForHealthy(const std::string& url, std::chrono::milliseconds timeout) -> VoidResult;
    [[nodiscard]] auto probeOnce(const std::string& url, std::chrono::milliseconds timeout) const -> bool;
    void markRunningExternal();
    void handleExit(int exitCode);

    template <typename Mutation>
    void update(Mutation&& mutate);

    void emit(const ServiceState& snapshot);

    const ServiceDescriptor& _descriptor;
    ServiceConfigSource _configSource;
    HealthProbe& _probe;
    ServiceListener _listener;
    SupervisorTiming _timing;

    std::mutex _lifecycleMutex; // serializes start() and stop()
    mutable std::mutex _stateMutex;
    ServiceState _state;
    std::unique_ptr<ManagedProcess> _process;
};

} // namespace agentloop
