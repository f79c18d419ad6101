// SPDX-License-Identifier: Apache-2.0
#include <engine/Workbench.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "ScriptedChatClient.hpp"

using namespace agentloop;
using agentloop::testing::ScriptedChatClient;

TEST_CASE("parseWorkbenchStrategies accepts flags and lists", "[workbench]")
{
    using enum WorkbenchStrategyId;

    CHECK(parseWorkbenchStrategies("").empty());
    CHECK(parseWorkbenchStrategies("0").empty());
    CHECK(parseWorkbenchStrategies("false").empty());
    CHECK(parseWorkbenchStrategies("TRUE") == std::vector { Quick, Balanced, Full });
    CHECK(parseWorkbenchStrategies(" full, quick ,bogus") == std::vector { Full, Quick });
}

TEST_CASE("buildWorkbenchStrategies derives presets from the LLM settings", "[workbench]")
{
    auto llm = LlmSettings {};
    llm.maxTokens = 512;
    llm.quickTemperature = 0.5;

    auto const ids = std::vector { WorkbenchStrategyId::Full, WorkbenchStrategyId::Quick, WorkbenchStrategyId::Balanced };
    auto const strategies = buildWorkbenchStrategies(llm, ids);
    REQUIRE(strategies.size() == 3);

    CHECK(strategies[0].id == WorkbenchStrategyId::Quick);
    CHECK(strategies[0].model == llm.quickModel);
    CHECK(strategies[0].temperature == 0.5);
    CHECK(strategies[0].maxHistoryTurns == 4);

    CHECK(strategies[1].maxTokens == 192);
    CHECK(strategies[1].maxHistoryTurns == 8);

    CHECK(strategies[2].maxTokens == 512);
    CHECK(strategies[2].maxHistoryTurns == 12);
}

TEST_CASE("jaccardSimilarity compares normalized word sets", "[workbench]")
{
    CHECK(normalizeForCompare("Hello, World! 42x") == std::vector<std::string> { "hello", "world", "42x" });
    CHECK(jaccardSimilarity("The cat sat", "the CAT sat.") == Catch::Approx(1.0));
    CHECK(jaccardSimilarity("a b", "b c") == Catch::Approx(1.0 / 3.0));
    CHECK(jaccardSimilarity("", "x") == 0.0);
}

TEST_CASE("lengthRatio divides the shorter by the longer length", "[workbench]")
{
    CHECK(lengthRatio("  abcd ", "ab") == Catch::Approx(0.5));
    CHECK(lengthRatio("", "ab") == 0.0);
}

TEST_CASE("runWorkbench reports one metric per strategy", "[workbench]")
{
    auto client = ScriptedChatClient {};
    client.queueReply("the answer is 42");
    client.queueError(ErrorCode::TimeoutError, "too slow");

    auto const llm = LlmSettings {};
    auto const strategies = buildWorkbenchStrategies(llm, std::vector { WorkbenchStrategyId::Quick, WorkbenchStrategyId::Full });
    auto const plan = WorkbenchPlan {
        .sessionId = "s1",
        .agent = "chat.quick",
        .system = "SYS",
        .primaryResponse = "The answer is 42.",
        .primaryModel = llm.quickModel,
        .messages = { Message { .id = "m", .role = Role::User, .content = "question" } },
    };

    auto metrics = std::vector<PerfMetricEvent> {};
    runWorkbench(client, llm, plan, strategies, [&](PerfMetricEvent metric) { metrics.push_back(std::move(metric)); });

    REQUIRE(metrics.size() == 2);
    CHECK(metrics[0].name == "workbench.strategy");
    CHECK(metrics[0].sessionId == "s1");
    CHECK(metrics[0].meta["strategy"] == "quick");
    CHECK(metrics[0].meta["jaccard"].get<double>() == Catch::Approx(1.0));
    CHECK(metrics[1].name == "workbench.error");
    CHECK(metrics[1].meta["error"] == "too slow");

    auto const requests = client.requests();
    REQUIRE(requests.size() == 2);
    CHECK(requests[0].options.model == llm.quickModel);
    CHECK(requests[1].options.maxTokens == llm.maxTokens);
}
