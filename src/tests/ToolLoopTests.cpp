// SPDX-License-Identifier: Apache-2.0
#include <agent/ToolLoop.hpp>

#include <catch2/catch_test_macros.hpp>

#include "ScriptedChatClient.hpp"
#include "TempWorkspace.hpp"

using namespace agentloop;
using agentloop::testing::ScriptedChatClient;
using agentloop::testing::TempWorkspace;

namespace
{
auto transcriptOf(std::initializer_list<std::pair<Role, std::string>> entries) -> std::vector<Message>
{
    auto transcript = std::vector<Message> {};
    for (auto const& [role, content]: entries)
        transcript.push_back(Message { .id = "m", .role = role, .content = content, .timestamp = 0 });
    return transcript;
}
} // namespace

TEST_CASE("ToolLoop answers directly when the model calls no tool", "[toolloop]")
{
    auto const workspace = TempWorkspace {};
    auto const toolbox = Toolbox(workspace.path(), nullptr);
    auto client = ScriptedChatClient {};
    client.queueReply("  Just an answer.  ");

    auto loop = ToolLoop(client, toolbox, ToolLoopConfig { .systemPrompt = "SYS", .allowedTools = { "fs.list" } });
    auto const transcript = transcriptOf({ { Role::User, "hi" } });

    auto const reply = loop.run(transcript);
    REQUIRE(reply.has_value());
    CHECK(*reply == "Just an answer.");

    auto const requests = client.requests();
    REQUIRE(requests.size() == 1);
    auto const& messages = requests[0].messages;
    REQUIRE(messages.size() == 3);
    CHECK(messages[0].content == "SYS");
    CHECK(messages[1].role == Role::System);
    CHECK(messages[1].content.find("- fs.list") != std::string::npos);
    CHECK(messages[2].content == "hi");
}

TEST_CASE("ToolLoop runs a tool and feeds the result back", "[toolloop]")
{
    auto const workspace = TempWorkspace {};
    workspace.write("hello.txt", "file body");
    auto const toolbox = Toolbox(workspace.path(), nullptr);

    auto client = ScriptedChatClient {};
    client.queueReply("Reading.\nTOOL_CALL: {\"name\":\"fs.read\",\"args\":{\"path\":\"hello.txt\"}}");
    client.queueReply("The file says: file body");

    auto calls = std::vector<ToolCall> {};
    auto results = std::vector<ToolCall> {};
    auto const callbacks = ToolLoopCallbacks {
        .onToolCall = [&](const ToolCall& call) { calls.push_back(call); },
        .onToolResult = [&](const ToolCall& call) { results.push_back(call); },
    };

    auto loop = ToolLoop(client, toolbox, ToolLoopConfig { .systemPrompt = "", .allowedTools = { "fs.read" } });
    auto const transcript = transcriptOf({ { Role::User, "what is in hello.txt?" } });

    auto const reply = loop.run(transcript, callbacks);
    REQUIRE(reply.has_value());
    CHECK(*reply == "The file says: file body");

    REQUIRE(calls.size() == 1);
    CHECK(calls[0].name == "fs.read");
    CHECK(calls[0].status == ToolCallStatus::Running);
    REQUIRE(results.size() == 1);
    CHECK(results[0].id == calls[0].id);
    CHECK(results[0].status == ToolCallStatus::Completed);
    REQUIRE(results[0].result.has_value());
    CHECK((*results[0].result)["result"]["content"] == "file body");

    auto const requests = client.requests();
    REQUIRE(requests.size() == 2);
    auto const& second = requests[1].messages;
    REQUIRE(second.size() == 4);
    CHECK(second[2].role == Role::Assistant);
    CHECK(second[3].role == Role::System);
    CHECK(second[3].content.starts_with("TOOL_RESULT: "));
}

TEST_CASE("ToolLoop reports failed tools as values", "[toolloop]")
{
    auto const workspace = TempWorkspace {};
    auto const toolbox = Toolbox(workspace.path(), nullptr);

    auto client = ScriptedChatClient {};
    client.queueReply(R"(TOOL_CALL: {"name":"fs.read","args":{"path":"../etc/passwd"}})");
    client.queueReply("I cannot read that.");

    auto results = std::vector<ToolCall> {};
    auto loop = ToolLoop(client, toolbox, ToolLoopConfig { .allowedTools = { "fs.read" } });
    auto const reply = loop.run({}, ToolLoopCallbacks { .onToolResult = [&](const ToolCall& call) { results.push_back(call); } });

    REQUIRE(reply.has_value());
    CHECK(*reply == "I cannot read that.");
    REQUIRE(results.size() == 1);
    CHECK(results[0].status == ToolCallStatus::Failed);
    CHECK((*results[0].result)["error"] == "path traversal is not allowed");
}

TEST_CASE("ToolLoop stops after maxToolCalls + 1 round trips", "[toolloop]")
{
    auto const workspace = TempWorkspace {};
    auto const toolbox = Toolbox(workspace.path(), nullptr);

    auto client = ScriptedChatClient {};
    for (auto i = 0; i < 5; ++i)
        client.queueReply(R"(TOOL_CALL: {"name":"time.now","args":{}})");

    auto loop = ToolLoop(client, toolbox, ToolLoopConfig { .allowedTools = { "time.now" }, .maxToolCalls = 2 });
    auto const reply = loop.run({});

    REQUIRE(reply.has_value());
    CHECK(*reply == "No response.");
    CHECK(client.requests().size() == 3);
}

TEST_CASE("ToolLoop propagates backend errors", "[toolloop]")
{
    auto const workspace = TempWorkspace {};
    auto const toolbox = Toolbox(workspace.path(), nullptr);

    auto client = ScriptedChatClient {};
    client.queueError(ErrorCode::TimeoutError, "timed out");

    auto loop = ToolLoop(client, toolbox, ToolLoopConfig {});
    auto const reply = loop.run({});
    REQUIRE(!reply);
    CHECK(reply.error().code == ErrorCode::TimeoutError);
}

TEST_CASE("ToolLoop seeds at most the last twenty messages", "[toolloop]")
{
    auto const workspace = TempWorkspace {};
    auto const toolbox = Toolbox(workspace.path(), nullptr);
    auto client = ScriptedChatClient {};
    client.queueReply("ok");

    auto transcript = std::vector<Message> {};
    for (auto i = 0; i < 30; ++i)
        transcript.push_back(Message { .id = "m", .role = i % 2 ? Role::Assistant : Role::User, .content = std::to_string(i) });

    auto loop = ToolLoop(client, toolbox, ToolLoopConfig {});
    REQUIRE(loop.run(transcript).has_value());

    auto const requests = client.requests();
    REQUIRE(requests.size() == 1);
    auto const& messages = requests[0].messages;
    REQUIRE(messages.size() == 1 + ToolLoopHistoryLimit);
    CHECK(messages[1].content == "10");
    CHECK(messages.back().content == "29");
}
