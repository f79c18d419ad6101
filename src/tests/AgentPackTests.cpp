// SPDX-License-Identifier: Apache-2.0
#include <agent/AgentPack.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using namespace agentloop;

TEST_CASE("builtInAgents contains the default agent", "[agents]")
{
    auto const agents = builtInAgents();
    REQUIRE(agents.size() == 5);

    auto const* quick = findAgent(agents, DefaultAgentName);
    REQUIRE(quick != nullptr);
    CHECK(quick->tools.empty());
    CHECK(quick->maxToolCalls == 0);
}

TEST_CASE("mergeAgentPacks overrides fields by name", "[agents]")
{
    auto overrides = std::map<std::string, AgentOverride> {};
    overrides["code.arch"] = AgentOverride {
        .description = std::nullopt,
        .prompt = "  Think in diagrams.  ",
        .tools = std::vector<std::string> { "fs.list", "shell.exec" },
        .maxToolCalls = 5,
        .maxHistoryTurns = std::nullopt,
        .temperature = 0.7,
    };

    auto const merged = mergeAgentPacks(builtInAgents(), overrides);
    auto const* arch = findAgent(merged, "code.arch");
    REQUIRE(arch != nullptr);

    CHECK(arch->description == "Architecture discussion and planning (tools optional).");
    CHECK(arch->prompt == "Think in diagrams.");
    CHECK(arch->tools == std::vector<std::string> { "fs.list" });
    CHECK(arch->maxToolCalls == 5);
    CHECK(arch->maxHistoryTurns == 20);
    REQUIRE(arch->temperature.has_value());
    CHECK(*arch->temperature == 0.7);
}

TEST_CASE("mergeAgentPacks keeps built-in tools when no override tool is known", "[agents]")
{
    auto overrides = std::map<std::string, AgentOverride> {};
    overrides["debug.triage"] = AgentOverride { .tools = std::vector<std::string> { "rm.rf" } };

    auto const merged = mergeAgentPacks(builtInAgents(), overrides);
    auto const* triage = findAgent(merged, "debug.triage");
    REQUIRE(triage != nullptr);
    CHECK(triage->tools.size() == 3);
}

TEST_CASE("mergeAgentPacks defines new agents and sorts by name", "[agents]")
{
    auto overrides = std::map<std::string, AgentOverride> {};
    overrides["aa.custom"] = AgentOverride { .prompt = "Custom." };

    auto const merged = mergeAgentPacks(builtInAgents(), overrides);
    REQUIRE(merged.size() == 6);
    CHECK(merged.front().name == "aa.custom");
    CHECK(merged.front().description == "Custom agent pack.");
    CHECK(merged.front().maxToolCalls == 3);
    CHECK(std::ranges::is_sorted(merged, {}, &AgentPack::name));
}

TEST_CASE("findAgentOrFirst falls back to the first agent", "[agents]")
{
    auto const agents = builtInAgents();
    CHECK(findAgent(agents, "missing") == nullptr);
    CHECK(findAgentOrFirst(agents, "missing").name == agents.front().name);
}
