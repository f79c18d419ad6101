// SPDX-License-Identifier: Apache-2.0
#include "ShellSplit.hpp"

#include <cctype>

namespace agentloop
{

auto shellSplit(std::string_view command) -> std::vector<std::string>
{
    auto args = std::vector<std::string> {};
    auto current = std::string {};
    auto quote = char { 0 };
    auto escaping = false;

    auto const push = [&] {
        if (!current.empty())
            args.push_back(std::move(current));
        current.clear();
    };

    for (auto const ch: command)
    {
        if (escaping)
        {
            current += ch;
            escaping = false;
            continue;
        }

        if (ch == '\\')
        {
            escaping = true;
            continue;
        }

        if (quote)
        {
            if (ch == quote)
                quote = 0;
            else
                current += ch;
            continue;
        }

        if (ch == '\'' || ch == '"')
        {
            quote = ch;
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(ch)))
        {
            push();
            continue;
        }

        current += ch;
    }

    push();
    return args;
}

} // namespace agentloop
