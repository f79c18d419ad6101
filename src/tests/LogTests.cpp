// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace agentloop;

namespace
{

/// @brief Routes log output into a vector while alive.
class CapturedLog
{
  public:
    explicit CapturedLog(log::Level level): _previous(log::getLevel())
    {
        log::setLevel(level);
        log::setCallback([this](log::Level l, std::string_view message) { lines.emplace_back(l, message); });
    }

    ~CapturedLog()
    {
        log::setCallback({});
        log::setLevel(_previous);
    }

    std::vector<std::pair<log::Level, std::string>> lines;

  private:
    log::Level _previous;
};

} // namespace

TEST_CASE("log routes formatted messages to the callback", "[log]")
{
    auto capture = CapturedLog(log::Level::Info);

    log::info("Client {} connected", 7);
    log::warning("Ignoring settings for unknown service '{}'", "x");

    REQUIRE(capture.lines.size() == 2);
    CHECK(capture.lines[0] == std::pair { log::Level::Info, std::string("Client 7 connected") });
    CHECK(capture.lines[1].first == log::Level::Warning);
}

TEST_CASE("log drops messages above the current level", "[log]")
{
    auto capture = CapturedLog(log::Level::Warning);

    log::info("hidden");
    log::debug("hidden {}", 1);
    log::error("shown");

    REQUIRE(capture.lines.size() == 1);
    CHECK(capture.lines[0].second == "shown");
}

TEST_CASE("levelFromString maps level names", "[log]")
{
    CHECK(log::levelFromString("trace", log::Level::Info) == log::Level::Trace);
    CHECK(log::levelFromString("warning", log::Level::Info) == log::Level::Warning);
    CHECK(log::levelFromString("verbose", log::Level::Error) == log::Level::Error);
    CHECK(log::levelFromString("DEBUG", log::Level::Info) == log::Level::Info);
}
