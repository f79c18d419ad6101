// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <string_view>

namespace agentloop
{

/// @brief Abstract readiness check of a backend endpoint.
class HealthProbe
{
  public:
    virtual ~HealthProbe() = default;

    /// @brief Checks the endpoint once.
    /// @param url The health URL.
    /// @param timeout Upper bound for the whole check.
    /// @return Success if the endpoint answered with a 2xx status.
    [[nodiscard]] virtual auto check(std::string_view url, std::chrono::milliseconds timeout) -> VoidResult = 0;
};

/// @brief HealthProbe issuing `GET <url>` over HTTP.
class HttpHealthProbe: public HealthProbe
{
  public:
    [[nodiscard]] auto check(std::string_view url, std::chrono::milliseconds timeout) -> VoidResult override;
};

} // namespace agentloop
