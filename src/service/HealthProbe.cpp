// SPDX-License-Identifier: Apache-2.0
#include "HealthProbe.hpp"

#include <net/HttpClient.hpp>

#include <format>

namespace agentloop
{

auto HttpHealthProbe::check(std::string_view url, std::chrono::milliseconds timeout) -> VoidResult
{
    auto response = http::fetch(http::Request { .method = "GET", .url = std::string(url), .timeout = timeout });
    if (!response)
        return std::unexpected(response.error());
    if (!response->ok())
        return makeError(ErrorCode::BackendError, std::format("{} returned {}", url, response->status));
    return {};
}

} // namespace agentloop
