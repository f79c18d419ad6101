// SPDX-License-Identifier: Apache-2.0
#include "Ids.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <chrono>
#include <mutex>

namespace agentloop
{

auto createId() -> std::string
{
    static auto mutex = std::mutex {};
    static auto generator = boost::uuids::random_generator {};

    auto lock = std::lock_guard(mutex);
    return boost::uuids::to_string(generator());
}

auto nowMillis() -> std::int64_t
{
    auto const now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

auto millisSince(std::chrono::steady_clock::time_point start) -> std::int64_t
{
    auto const elapsed = std::chrono::steady_clock::now() - start;
    return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}

} // namespace agentloop
