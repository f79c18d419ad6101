// SPDX-License-Identifier: Apache-2.0
#include "TextUtils.hpp"

#include <algorithm>
#include <cctype>

namespace agentloop::text
{

namespace
{
    auto isSpace(char ch) -> bool
    {
        return std::isspace(static_cast<unsigned char>(ch)) != 0;
    }
} // namespace

auto trim(std::string_view text) -> std::string_view
{
    while (!text.empty() && isSpace(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && isSpace(text.back()))
        text.remove_suffix(1);
    return text;
}

auto toLower(std::string_view text) -> std::string
{
    auto result = std::string(text);
    std::ranges::transform(result, result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto splitKeepingWhitespace(std::string_view text) -> std::vector<std::string>
{
    auto tokens = std::vector<std::string> {};
    auto start = std::size_t { 0 };
    while (start < text.size())
    {
        auto const space = isSpace(text[start]);
        auto end = start + 1;
        while (end < text.size() && isSpace(text[end]) == space)
            ++end;
        tokens.emplace_back(text.substr(start, end - start));
        start = end;
    }
    return tokens;
}

auto splitLines(std::string_view text) -> std::vector<std::string_view>
{
    auto lines = std::vector<std::string_view> {};
    while (true)
    {
        auto const nl = text.find('\n');
        auto line = text.substr(0, nl);
        if (line.ends_with('\r'))
            line.remove_suffix(1);
        lines.push_back(line);
        if (nl == std::string_view::npos)
            break;
        text.remove_prefix(nl + 1);
    }
    return lines;
}

auto countWords(std::string_view text) -> std::size_t
{
    auto count = std::size_t { 0 };
    auto inWord = false;
    for (auto const ch: text)
    {
        if (isSpace(ch))
            inWord = false;
        else if (!inWord)
        {
            inWord = true;
            ++count;
        }
    }
    return count;
}

} // namespace agentloop::text
