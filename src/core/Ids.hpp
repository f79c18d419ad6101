// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace agentloop
{

/// @brief Creates a random opaque identifier (RFC 4122 version 4 UUID text).
[[nodiscard]] auto createId() -> std::string;

/// @brief Returns the current wall-clock time in milliseconds since the epoch.
[[nodiscard]] auto nowMillis() -> std::int64_t;

/// @brief Milliseconds elapsed on the steady clock since @p start.
[[nodiscard]] auto millisSince(std::chrono::steady_clock::time_point start) -> std::int64_t;

} // namespace agentloop
