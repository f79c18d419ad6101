// SPDX-License-Identifier: Apache-2.0
#include "ServiceSupervisor.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <thread>

namespace agentloop
{

ServiceSupervisor::ServiceSupervisor(const ServiceDescriptor& descriptor,
                                     ServiceConfigSource configSource,
                                     HealthProbe& probe,
                                     ServiceListener listener,
                                     SupervisorTiming timing):
    _descriptor(descriptor),
    _configSource(std::move(configSource)),
    _probe(probe),
    _listener(std::move(listener)),
    _timing(timing)
{
    _state.name = std::string(descriptor.name);
}

ServiceSupervisor::~ServiceSupervisor()
{
    auto lifecycle = std::lock_guard(_lifecycleMutex);
    if (_process)
    {
        _process->stop(_timing.stopGrace);
        _process.reset();
    }
}

template <typename Mutation>
void ServiceSupervisor::update(Mutation&& mutate)
{
    auto snapshot = ServiceState {};
    {
        auto lock = std::lock_guard(_stateMutex);
        mutate(_state);
        snapshot = _state;
    }
    emit(snapshot);
}

void ServiceSupervisor::emit(const ServiceState& snapshot)
{
    log::debug("Service {}: {} ({})", snapshot.name, serviceStatusToString(snapshot.status), snapshot.detail);
    if (_listener)
        _listener(ServiceStatusChanged { snapshot });
}

auto ServiceSupervisor::state() const -> ServiceState
{
    auto lock = std::lock_guard(_stateMutex);
    return _state;
}

auto ServiceSupervisor::canStart() const -> bool
{
    auto config = _configSource();
    return config && !config->command.empty();
}

auto ServiceSupervisor::autoStartRequested() const -> bool
{
    auto config = _configSource();
    return config && config->autoStart;
}

auto ServiceSupervisor::isHealthy(std::chrono::milliseconds timeout) const -> bool
{
    auto config = _configSource();
    if (!config || config->healthUrl.empty())
        return false;
    return probeOnce(config->healthUrl, timeout);
}

auto ServiceSupervisor::probeOnce(const std::string& url, std::chrono::milliseconds timeout) const -> bool
{
    return _probe.check(url, timeout).has_value();
}

void ServiceSupervisor::markRunningExternal()
{
    update([](ServiceState& s) {
        s.status = ServiceStatus::Running;
        s.detail = "Running (external)";
        s.pid.reset();
        s.lastError.reset();
    });
}

auto ServiceSupervisor::start() -> VoidResult
{
    auto const alreadyUp = [this] {
        auto lock = std::lock_guard(_stateMutex);
        return _state.status == ServiceStatus::Running || _state.status == ServiceStatus::Starting;
    };

    if (alreadyUp())
        return {};

    auto lifecycle = std::lock_guard(_lifecycleMutex);
    if (alreadyUp())
        return {};

    auto config = _configSource();
    if (!config)
        return std::unexpected(config.error());
    if (config->command.empty())
        return makeError(ErrorCode::ConfigError, notConfiguredMessage(_descriptor));

    // Something already serves the endpoint; adopt it instead of failing on a port clash.
    if (!config->healthUrl.empty() && probeOnce(config->healthUrl, _timing.externalProbeTimeout))
    {
        log::info("Service {} is already serving at {}", _descriptor.name, config->healthUrl);
        markRunningExternal();
        return {};
    }

    update([](ServiceState& s) {
        s.status = ServiceStatus::Starting;
        s.detail = "Starting...";
    });

    // Safe here: the previous process has exited, so its waiter thread is done with callbacks.
    _process.reset();
    _process = std::make_unique<ManagedProcess>(ProcessOptions {
        .name = std::string(_descriptor.name),
        .argv = config->command,
        .env = {},
        .onLine =
            [this](OutputStream stream, std::string_view line) {
                if (_listener)
                    _listener(ServiceLogLine { std::string(_descriptor.name), stream, std::string(line) });
            },
        .onExit = [this](int exitCode) { handleExit(exitCode); },
    });

    auto ready = _process->start();
    if (ready)
    {
        auto const pid = _process->pid();
        update([pid](ServiceState& s) { s.pid = pid; });

        if (!config->healthUrl.empty())
        {
            update([](ServiceState& s) { s.detail = "Waiting for readiness..."; });
            ready = waitForHealthy(config->healthUrl, config->readyTimeout);
        }
    }

    if (ready)
    {
        update([](ServiceState& s) {
            s.status = ServiceStatus::Running;
            s.detail = "Running";
            s.lastError.reset();
        });
        log::info("Service {} is running", _descriptor.name);
        return {};
    }

    // The spawn may have lost a race against an instance started elsewhere.
    if (!config->healthUrl.empty() && probeOnce(config->healthUrl, _timing.externalProbeTimeout))
    {
        markRunningExternal();
        return {};
    }

    auto const error = ready.error();
    log::error("Service {} failed to start: {}", _descriptor.name, error.message);
    update([&error](ServiceState& s) {
        s.status = ServiceStatus::Error;
        s.detail = "Failed to start";
        s.lastError = error.message;
    });

    if (_process)
    {
        if (_process->isRunning())
        {
            update([](ServiceState& s) {
                s.status = ServiceStatus::Stopping;
                s.detail = "Stopping...";
            });
            _process->stop(_timing.stopGrace);
        }
        update([&error](ServiceState& s) {
            s.status = ServiceStatus::Stopped;
            s.detail = "Stopped";
            s.pid.reset();
            s.lastError = error.message;
        });
    }

    return std::unexpected(error);
}

auto ServiceSupervisor::waitForHealthy(const std::string& url, std::chrono::milliseconds timeout) -> VoidResult
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    auto lastError = std::string {};

    while (true)
    {
        if (!_process->isRunning())
        {
            auto const code = _process->exitCode().value_or(-1);
            return makeError(ErrorCode::ProcessError,
                             std::format("Process exited with code {} before becoming healthy", code));
        }

        auto const now = std::chrono::steady_clock::now();
        if (now >= deadline)
            break;

        auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto const result = _probe.check(url, std::min(remaining, _timing.maxProbeTimeout));
        if (result)
            return {};
        lastError = result.error().message;

        auto const pause = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (pause.count() <= 0)
            break;
        std::this_thread::sleep_for(std::min(pause, _timing.pollInterval));
    }

    return makeError(ErrorCode::TimeoutError,
                     std::format("Health check failed ({}): {}", url, lastError.empty() ? "timeout" : lastError));
}

void ServiceSupervisor::handleExit(int exitCode)
{
    update([exitCode](ServiceState& s) {
        auto const wasStopping = s.status == ServiceStatus::Stopping;
        s.status = ServiceStatus::Stopped;
        s.pid.reset();
        s.detail = wasStopping ? "Stopped" : "Exited";
        s.lastExitCode = exitCode;
        if (wasStopping)
            s.lastError.reset();
        else
            s.lastError = std::format("Exited with code {}", exitCode);
    });
}

void ServiceSupervisor::stop()
{
    auto lifecycle = std::lock_guard(_lifecycleMutex);

    if (!_process || !_process->isRunning())
    {
        update([](ServiceState& s) {
            s.status = ServiceStatus::Stopped;
            s.detail = "Stopped";
            s.pid.reset();
        });
        return;
    }

    update([](ServiceState& s) {
        s.status = ServiceStatus::Stopping;
        s.detail = "Stopping...";
    });

    _process->stop(_timing.stopGrace);

    update([](ServiceState& s) {
        s.status = ServiceStatus::Stopped;
        s.detail = "Stopped";
        s.pid.reset();
    });
    log::info("Service {} stopped", _descriptor.name);
}

} // namespace agentloop
