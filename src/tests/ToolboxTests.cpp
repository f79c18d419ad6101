// SPDX-License-Identifier: Apache-2.0
#include <agent/Toolbox.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TempWorkspace.hpp"

using namespace agentloop;
using agentloop::testing::TempWorkspace;

namespace
{
const auto AllTools = std::vector<std::string> { "time.now", "fs.read", "fs.list", "service.status", "logo.fetch" };
} // namespace

TEST_CASE("parseToolCall accepts the first well-formed call", "[tools]")
{
    auto const text = "Let me look.\n  TOOL_CALL: {\"name\":\"fs.read\",\"args\":{\"path\":\"README.md\"}}\n"
                      "TOOL_CALL: {\"name\":\"time.now\",\"args\":{}}";

    auto const call = parseToolCall(text, AllTools);
    REQUIRE(call.has_value());
    CHECK(call->name == "fs.read");
    CHECK(call->args["path"] == "README.md");
}

TEST_CASE("parseToolCall rejects calls outside the allow-list", "[tools]")
{
    auto const allowed = std::vector<std::string> { "fs.list" };
    CHECK(!parseToolCall(R"(TOOL_CALL: {"name":"time.now","args":{}})", allowed).has_value());
    CHECK(!parseToolCall(R"(TOOL_CALL: {"name":"shell.exec","args":{}})", AllTools).has_value());
}

TEST_CASE("parseToolCall validates argument shapes", "[tools]")
{
    CHECK(parseToolCall(R"(TOOL_CALL: {"name":"time.now"})", AllTools).has_value());
    CHECK(!parseToolCall(R"(TOOL_CALL: {"name":"fs.read","args":{}})", AllTools).has_value());
    CHECK(!parseToolCall(R"(TOOL_CALL: {"name":"fs.read","args":{"path":"a","maxBytes":0}})", AllTools).has_value());
    CHECK(parseToolCall(R"(TOOL_CALL: {"name":"fs.read","args":{"path":"a","maxBytes":10}})", AllTools).has_value());
    CHECK(parseToolCall(R"(TOOL_CALL: {"name":"fs.read","args":{"path":"a","maxBytes":1e30}})", AllTools).has_value());
    CHECK(!parseToolCall(R"(TOOL_CALL: {"name":"service.status","args":{"name":"nope"}})", AllTools).has_value());
    CHECK(parseToolCall(R"(TOOL_CALL: {"name":"service.status","args":{"name":"mlx"}})", AllTools).has_value());
    CHECK(!parseToolCall("TOOL_CALL: {not json", AllTools).has_value());
    CHECK(!parseToolCall("no call here", AllTools).has_value());
}

TEST_CASE("toolSystemPrompt lists only the allowed tools", "[tools]")
{
    auto const allowed = std::vector<std::string> { "fs.list" };
    auto const prompt = toolSystemPrompt("/repo", allowed);
    CHECK(prompt.find("- fs.list") != std::string::npos);
    CHECK(prompt.find("- fs.read") == std::string::npos);
    CHECK(prompt.find("TOOL_CALL:") != std::string::npos);
}

TEST_CASE("formatToolResult and stripToolProtocol", "[tools]")
{
    auto const line = formatToolResult("fs.list", ToolOutcome::failure("boom"));
    CHECK(line == R"(TOOL_RESULT: {"error":"boom","name":"fs.list","ok":false})");

    CHECK(stripToolProtocol("Hello\nTOOL_CALL: {}\n  TOOL_RESULT: {}\nworld\n") == "Hello\nworld");
    CHECK(stripToolProtocol("TOOL_CALL: {}").empty());
}

TEST_CASE("resolveWorkspacePath confines paths to the root", "[tools]")
{
    auto const workspace = TempWorkspace {};
    auto const& root = workspace.path();

    auto const ok = resolveWorkspacePath(root, "src/main.cpp");
    REQUIRE(ok.has_value());
    CHECK(ok->filename() == "main.cpp");

    CHECK(resolveWorkspacePath(root, ".").has_value());

    auto const empty = resolveWorkspacePath(root, "");
    REQUIRE(!empty);
    CHECK(empty.error().message == "path is required");

    auto const absolute = resolveWorkspacePath(root, "/etc/passwd");
    REQUIRE(!absolute);
    CHECK(absolute.error().message == "absolute paths are not allowed");

    for (auto const* escape: { "..", "../x", "a/../../x", "a\\..\\..\\x" })
    {
        auto const traversal = resolveWorkspacePath(root, escape);
        REQUIRE(!traversal);
        CHECK(traversal.error().code == ErrorCode::PathEscape);
    }
}

#ifndef _WIN32
TEST_CASE("resolveWorkspacePath refuses symlinks leading outside", "[tools]")
{
    auto const workspace = TempWorkspace {};
    auto const outside = TempWorkspace {};
    std::filesystem::create_directory_symlink(outside.path(), workspace.path() / "link");

    auto const result = resolveWorkspacePath(workspace.path(), "link/file.txt");
    REQUIRE(!result);
    CHECK(result.error().message == "path escapes repo root");
}
#endif

TEST_CASE("validateDomain normalizes and checks domains", "[tools]")
{
    CHECK(validateDomain("  GitHub.COM ").value_or("") == "github.com");
    CHECK(!validateDomain("localhost").has_value());
    CHECK(!validateDomain("evil.com/path").has_value());
}

TEST_CASE("Toolbox fs.read reads bounded content", "[tools]")
{
    auto const workspace = TempWorkspace {};
    workspace.write("notes/todo.txt", "0123456789");
    auto const toolbox = Toolbox(workspace.path(), nullptr);

    SECTION("whole file")
    {
        auto const outcome = toolbox.run(ToolRequest { .name = "fs.read", .args = { { "path", "notes/todo.txt" } } });
        REQUIRE(outcome.ok);
        CHECK(outcome.result["content"] == "0123456789");
        CHECK(outcome.result["bytes"] == 10);
        CHECK(outcome.result["path"] == "notes/todo.txt");
    }

    SECTION("maxBytes truncates content but reports full size")
    {
        auto const outcome = toolbox.run(
            ToolRequest { .name = "fs.read", .args = { { "path", "notes/todo.txt" }, { "maxBytes", 4 } } });
        REQUIRE(outcome.ok);
        CHECK(outcome.result["content"] == "0123");
        CHECK(outcome.result["bytes"] == 10);
    }

    SECTION("maxBytes far beyond any file size reads the whole file")
    {
        for (auto const maxBytes: { 1e30, 1.8446744073709552e19, 10.5 })
        {
            auto const outcome = toolbox.run(
                ToolRequest { .name = "fs.read", .args = { { "path", "notes/todo.txt" }, { "maxBytes", maxBytes } } });
            REQUIRE(outcome.ok);
            CHECK(outcome.result["content"] == "0123456789");
        }
    }

    SECTION("missing file")
    {
        auto const outcome = toolbox.run(ToolRequest { .name = "fs.read", .args = { { "path", "nope.txt" } } });
        CHECK(!outcome.ok);
        CHECK(outcome.error == "file does not exist");
        CHECK(outcome.toJson() == nlohmann::json { { "ok", false }, { "error", "file does not exist" } });
    }

    SECTION("escape")
    {
        auto const outcome = toolbox.run(ToolRequest { .name = "fs.read", .args = { { "path", "../secret" } } });
        CHECK(!outcome.ok);
        CHECK(outcome.error == "path traversal is not allowed");
    }
}

TEST_CASE("Toolbox fs.list returns sorted typed entries", "[tools]")
{
    auto const workspace = TempWorkspace {};
    workspace.write("b.txt", "b");
    workspace.write("a/inner.txt", "a");
    auto const toolbox = Toolbox(workspace.path(), nullptr);

    auto const outcome = toolbox.run(ToolRequest { .name = "fs.list", .args = { { "path", "." } } });
    REQUIRE(outcome.ok);
    auto const& entries = outcome.result["entries"];
    REQUIRE(entries.size() == 2);
    CHECK(entries[0] == nlohmann::json { { "name", "a" }, { "type", "dir" } });
    CHECK(entries[1] == nlohmann::json { { "name", "b.txt" }, { "type", "file" } });
}

TEST_CASE("Toolbox fs.list reports unlistable paths as errors", "[tools]")
{
    auto const workspace = TempWorkspace {};
    workspace.write("plain.txt", "x");
    workspace.write("empty/.keep", "");
    auto const toolbox = Toolbox(workspace.path(), nullptr);

    auto const file = toolbox.run(ToolRequest { .name = "fs.list", .args = { { "path", "plain.txt" } } });
    CHECK(!file.ok);
    CHECK(file.error.starts_with("cannot list directory: "));

    auto const missing = toolbox.run(ToolRequest { .name = "fs.list", .args = { { "path", "absent" } } });
    CHECK(!missing.ok);

    auto const empty = toolbox.run(ToolRequest { .name = "fs.list", .args = { { "path", "empty" } } });
    REQUIRE(empty.ok);
    CHECK(empty.result["entries"].size() == 1);
}

TEST_CASE("Toolbox time.now and service.status without a registry", "[tools]")
{
    auto const workspace = TempWorkspace {};
    auto const toolbox = Toolbox(workspace.path(), nullptr);

    auto const now = toolbox.run(ToolRequest { .name = "time.now" });
    REQUIRE(now.ok);
    CHECK(now.result["iso"].get<std::string>().ends_with("Z"));
    CHECK(now.result["epochMs"].get<std::int64_t>() > 0);

    auto const status = toolbox.run(ToolRequest { .name = "service.status", .args = { { "name", "mlx" } } });
    CHECK(!status.ok);
}

TEST_CASE("Toolbox logo.fetch serves cached logos without network", "[tools]")
{
    auto const workspace = TempWorkspace {};
    workspace.write(".agentloop/cache/logos/example.com.png", "PNGDATA");
    auto const toolbox = Toolbox(workspace.path(), nullptr);

    auto const outcome = toolbox.run(ToolRequest { .name = "logo.fetch", .args = { { "domain", "Example.com" } } });
    REQUIRE(outcome.ok);
    CHECK(outcome.result["cached"] == true);
    CHECK(outcome.result["bytes"] == 7);
    CHECK(outcome.result["url"] == "https://logo.clearbit.com/example.com");

    auto const invalid = toolbox.run(ToolRequest { .name = "logo.fetch", .args = { { "domain", "nope" } } });
    CHECK(!invalid.ok);
    CHECK(invalid.error == "invalid domain");
}
