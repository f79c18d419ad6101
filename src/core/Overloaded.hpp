// SPDX-License-Identifier: Apache-2.0
#pragma once

namespace agentloop
{

/// @brief Builds a std::visit visitor from a set of lambdas.
template <class... Ts>
struct overloaded: Ts...
{
    using Ts::operator()...;
};

} // namespace agentloop
