// SPDX-License-Identifier: Apache-2.0
#include <engine/Session.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace agentloop;

TEST_CASE("Session starts idle and empty", "[session]")
{
    auto const session = Session("s1");
    CHECK(session.id() == "s1");
    CHECK(session.status() == SessionStatus::Idle);
    CHECK(session.messages().empty());
    CHECK(session.routingMode() == RoutingMode::Auto);
    CHECK(session.createdAt() > 0);
}

TEST_CASE("Session appends messages with unique ids", "[session]")
{
    auto session = Session("s1");
    auto const userId = session.addUserMessage("hello").id;
    auto const& reply = session.addAssistantMessage("hi there");

    CHECK(reply.role == Role::Assistant);
    CHECK(reply.id != userId);
    REQUIRE(session.messages().size() == 2);
    CHECK(session.messages()[0].content == "hello");
}

TEST_CASE("Session tracks tool call completion", "[session]")
{
    auto session = Session("s1");
    session.addToolCall(ToolCall { .id = "t1", .name = "time.now", .status = ToolCallStatus::Running });

    CHECK(session.completeToolCall("t1", ToolCallStatus::Completed, { { "ok", true } }));
    CHECK(!session.completeToolCall("missing", ToolCallStatus::Failed, {}));

    REQUIRE(session.toolCalls().size() == 1);
    CHECK(session.toolCalls()[0].status == ToolCallStatus::Completed);
    REQUIRE(session.toolCalls()[0].result.has_value());
    CHECK(*session.toolCalls()[0].result == nlohmann::json { { "ok", true } });
}

TEST_CASE("Session summarizes its routing configuration", "[session]")
{
    auto session = Session("s1");
    CHECK(session.configurationSummary() == "Configured (auto)");

    session.setRoutingMode(RoutingMode::Pinned);
    session.setPinnedAgent("code.arch");
    CHECK(session.configurationSummary() == "Configured (pinned: code.arch)");

    session.setPinnedAgent(std::nullopt);
    CHECK(session.configurationSummary() == "Configured (pinned)");
}

TEST_CASE("isBusy covers every in-flight status", "[session]")
{
    CHECK(!isBusy(SessionStatus::Idle));
    CHECK(!isBusy(SessionStatus::Error));
    CHECK(isBusy(SessionStatus::Thinking));
    CHECK(isBusy(SessionStatus::Streaming));
    CHECK(isBusy(SessionStatus::ToolUse));
}
