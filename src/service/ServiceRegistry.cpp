// SPDX-License-Identifier: Apache-2.0
#include "ServiceRegistry.hpp"

#include <core/Log.hpp>

#include <format>

namespace agentloop
{

ServiceRegistry::ServiceRegistry(ConfigSource configSource, HealthProbe& probe, SupervisorTiming timing)
{
    for (auto const& descriptor: serviceCatalog())
    {
        _supervisors.push_back(std::make_unique<ServiceSupervisor>(
            descriptor,
            [configSource, &descriptor] { return configSource(descriptor); },
            probe,
            [this](const ServiceEvent& event) { publish(event); },
            timing));
    }
}

ServiceRegistry::~ServiceRegistry()
{
    shutdown();
}

auto ServiceRegistry::subscribe(ServiceListener listener) -> ListenerId
{
    auto lock = std::lock_guard(_listenerMutex);
    auto const id = _nextListenerId++;
    _listeners.emplace(id, std::move(listener));
    return id;
}

void ServiceRegistry::unsubscribe(ListenerId id)
{
    auto lock = std::lock_guard(_listenerMutex);
    _listeners.erase(id);
}

void ServiceRegistry::publish(const ServiceEvent& event)
{
    auto listeners = std::vector<ServiceListener> {};
    {
        auto lock = std::lock_guard(_listenerMutex);
        for (auto const& [id, listener]: _listeners)
            listeners.push_back(listener);
    }
    for (auto const& listener: listeners)
        listener(event);
}

auto ServiceRegistry::find(std::string_view name) const -> ServiceSupervisor*
{
    for (auto const& supervisor: _supervisors)
    {
        if (supervisor->descriptor().name == name)
            return supervisor.get();
    }
    return nullptr;
}

auto ServiceRegistry::start(std::string_view name) -> VoidResult
{
    auto* supervisor = find(name);
    if (!supervisor)
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown service: {}", name));
    return supervisor->start();
}

auto ServiceRegistry::stop(std::string_view name) -> VoidResult
{
    auto* supervisor = find(name);
    if (!supervisor)
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown service: {}", name));
    supervisor->stop();
    return {};
}

auto ServiceRegistry::state(std::string_view name) const -> Result<ServiceState>
{
    auto const* supervisor = find(name);
    if (!supervisor)
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown service: {}", name));
    return supervisor->state();
}

auto ServiceRegistry::states() const -> std::vector<ServiceState>
{
    auto result = std::vector<ServiceState> {};
    for (auto const& supervisor: _supervisors)
        result.push_back(supervisor->state());
    return result;
}

auto ServiceRegistry::visibleStates() const -> std::vector<ServiceState>
{
    auto result = std::vector<ServiceState> {};
    for (auto& s: states())
    {
        if (s.status == ServiceStatus::Stopped && !s.lastError)
            continue;
        result.push_back(std::move(s));
    }
    return result;
}

auto ServiceRegistry::canStart(std::string_view name) const -> bool
{
    auto const* supervisor = find(name);
    return supervisor && supervisor->canStart();
}

auto ServiceRegistry::isHealthy(std::string_view name, std::chrono::milliseconds timeout) const -> bool
{
    auto const* supervisor = find(name);
    return supervisor && supervisor->isHealthy(timeout);
}

auto ServiceRegistry::isRunning(std::string_view name) const -> bool
{
    auto const* supervisor = find(name);
    return supervisor && supervisor->state().status == ServiceStatus::Running;
}

void ServiceRegistry::autoStartIfConfigured()
{
    for (auto const& supervisor: _supervisors)
    {
        if (!supervisor->autoStartRequested())
            continue;

        log::info("Auto-starting service {}", supervisor->descriptor().name);
        if (auto result = supervisor->start(); !result)
            log::warning("Failed to auto-start service {}: {}", supervisor->descriptor().name, result.error().message);
    }
}

void ServiceRegistry::shutdown()
{
    for (auto const& supervisor: _supervisors)
    {
        if (supervisor->state().status != ServiceStatus::Stopped)
            supervisor->stop();
    }
}

} // namespace agentloop
