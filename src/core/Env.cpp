// SPDX-License-Identifier: Apache-2.0
#include "Env.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string>

namespace agentloop::env
{

namespace
{
    auto trim(std::string_view text) -> std::string_view
    {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
            text.remove_prefix(1);
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
            text.remove_suffix(1);
        return text;
    }
} // namespace

auto getString(std::string_view key) -> std::optional<std::string>
{
    auto const* const raw = std::getenv(std::string(key).c_str());
    if (!raw)
        return std::nullopt;

    auto const trimmed = trim(raw);
    if (trimmed.empty())
        return std::nullopt;
    return std::string(trimmed);
}

auto getNumber(std::string_view key) -> std::optional<double>
{
    auto const raw = getString(key);
    if (!raw)
        return std::nullopt;

    auto value = 0.0;
    auto const* const end = raw->data() + raw->size();
    auto const [ptr, ec] = std::from_chars(raw->data(), end, value);
    if (ec != std::errc {} || ptr != end || !std::isfinite(value))
        return std::nullopt;
    return value;
}

auto getBool(std::string_view key, bool defaultValue) -> bool
{
    auto raw = getString(key);
    if (!raw)
        return defaultValue;

    std::ranges::transform(*raw, raw->begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (*raw == "1" || *raw == "true" || *raw == "yes" || *raw == "y" || *raw == "on")
        return true;
    if (*raw == "0" || *raw == "false" || *raw == "no" || *raw == "n" || *raw == "off")
        return false;
    return defaultValue;
}

void set(std::string_view key, std::string_view value)
{
    auto const name = std::string(key);
    auto const text = std::string(value);
#ifdef _WIN32
    _putenv_s(name.c_str(), text.c_str());
#else
    ::setenv(name.c_str(), text.c_str(), 1);
#endif
}

void unset(std::string_view key)
{
    auto const name = std::string(key);
#ifdef _WIN32
    _putenv_s(name.c_str(), "");
#else
    ::unsetenv(name.c_str());
#endif
}

} // namespace agentloop::env
