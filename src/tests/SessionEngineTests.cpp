// SPDX-License-Identifier: Apache-2.0
#include <agent/AgentCatalog.hpp>
#include <agent/Toolbox.hpp>
#include <engine/Replies.hpp>
#include <engine/SessionEngine.hpp>
#include <llm/HttpChatClient.hpp>
#include <service/HealthProbe.hpp>
#include <service/ServiceRegistry.hpp>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <format>
#include <functional>
#include <mutex>
#include <semaphore>
#include <thread>

#include "LocalHttpServer.hpp"
#include "ScriptedChatClient.hpp"
#include "TempWorkspace.hpp"

using namespace agentloop;
using namespace std::chrono_literals;
using agentloop::testing::ScriptedChatClient;
using agentloop::testing::TempWorkspace;

namespace
{

class UnreachableProbe: public HealthProbe
{
  public:
    auto check(std::string_view, std::chrono::milliseconds) -> VoidResult override
    {
        return makeError(ErrorCode::TransportError, "connection refused");
    }
};

/// @brief Scripted client whose streaming calls block until released.
class GatedChatClient: public ScriptedChatClient
{
  public:
    auto completeStreaming(std::span<const ChatMessage> messages, TokenCallback onToken, const ChatOptions& options)
        -> Result<Completion> override
    {
        _gate.acquire();
        return ScriptedChatClient::completeStreaming(messages, std::move(onToken), options);
    }

    void release() { _gate.release(); }

  private:
    std::binary_semaphore _gate { 0 };
};

struct Delivery
{
    Event event;
    std::optional<ClientId> target;
};

/// @brief An engine on a private io_context, with every published event recorded.
class EngineHarness
{
  public:
    using ConfigHook = std::function<Result<ServiceConfig>(const ServiceDescriptor&)>;

    explicit EngineHarness(ChatClient& llm, EngineSettings settings = quietSettings(), ConfigHook serviceConfig = {}):
        serviceConfig(std::move(serviceConfig)),
        registry(
            [this](const ServiceDescriptor& descriptor) -> Result<ServiceConfig> {
                return this->serviceConfig ? this->serviceConfig(descriptor) : ServiceConfig {};
            },
            probe),
        agents(workspace.path(), {}),
        toolbox(workspace.path(), &registry),
        work(boost::asio::make_work_guard(ioc))
    {
        _listener = events.subscribe([this](const Event& event, std::optional<ClientId> target) {
            {
                auto lock = std::lock_guard(_mutex);
                _deliveries.push_back(Delivery { event, target });
            }
            _changed.notify_all();
            if (onDelivery)
                onDelivery(Delivery { event, target });
        });
        engine = std::make_unique<SessionEngine>(
            ioc,
            SessionEngineContext {
                .agents = agents,
                .services = registry,
                .toolbox = toolbox,
                .llm = llm,
                .vlm = vlm,
                .events = events,
            },
            std::move(settings),
            2);
        runner = std::jthread([this] { ioc.run(); });
    }

    ~EngineHarness()
    {
        engine->shutdown();
        events.unsubscribe(_listener);
        work.reset();
        ioc.stop();
        runner.join();
        engine.reset();
    }

    static auto quietSettings() -> EngineSettings
    {
        auto settings = EngineSettings {};
        settings.llm.prefer = true;
        settings.quickFollowup = false;
        return settings;
    }

    void send(ClientId client, std::string_view text) { engine->handleMessage(client, text); }

    /// @brief Waits until @p predicate holds for the recorded deliveries.
    template <typename Predicate>
    auto waitFor(Predicate predicate, std::chrono::milliseconds timeout = 5s) -> bool
    {
        auto lock = std::unique_lock(_mutex);
        return _changed.wait_for(lock, timeout, [&] { return predicate(_deliveries); });
    }

    [[nodiscard]] auto deliveries() const -> std::vector<Delivery>
    {
        auto lock = std::lock_guard(_mutex);
        return _deliveries;
    }

    TempWorkspace workspace;
    UnreachableProbe probe;
    ConfigHook serviceConfig;
    ServiceRegistry registry;
    AgentCatalog agents;
    Toolbox toolbox;
    ScriptedChatClient vlm;
    EventBus events;
    boost::asio::io_context ioc;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work;
    std::unique_ptr<SessionEngine> engine;
    std::jthread runner;

    /// @brief Called for every delivery, on the publishing thread. Set before sending.
    std::function<void(const Delivery&)> onDelivery;

  private:
    EventBus::ListenerId _listener = 0;
    mutable std::mutex _mutex;
    std::condition_variable _changed;
    std::vector<Delivery> _deliveries;
};

auto isStatus(const Delivery& d, SessionStatus status, std::string_view detail) -> bool
{
    auto const* e = std::get_if<SessionStatusEvent>(&d.event);
    return e && e->status == status && e->detail.value_or("") == detail;
}

auto hasStatus(SessionStatus status, std::string_view detail)
{
    return [=](const std::vector<Delivery>& all) {
        return std::ranges::any_of(all, [&](const Delivery& d) { return isStatus(d, status, detail); });
    };
}

template <typename T>
auto eventsOf(const std::vector<Delivery>& all) -> std::vector<T>
{
    auto result = std::vector<T> {};
    for (auto const& d: all)
        if (auto const* e = std::get_if<T>(&d.event))
            result.push_back(*e);
    return result;
}

auto streamedText(const std::vector<Delivery>& all) -> std::string
{
    auto text = std::string {};
    for (auto const& token: eventsOf<AssistantTokenEvent>(all))
        text += token.token;
    return text;
}

constexpr auto CreateS1 = std::string_view { R"({"type":"session.create","payload":{"sessionId":"s1"}})" };

} // namespace

TEST_CASE("SessionEngine streams a quick reply in order", "[engine]")
{
    auto llm = ScriptedChatClient {};
    llm.queueReply("Hi! How can I help?");
    auto harness = EngineHarness(llm);

    harness.send(1, CreateS1);
    harness.send(1, R"({"type":"session.send","payload":{"sessionId":"s1","content":"hello there"}})");
    REQUIRE(harness.waitFor(hasStatus(SessionStatus::Idle, "Ready")));

    auto const all = harness.deliveries();
    auto const types = [&] {
        auto names = std::vector<std::string_view> {};
        for (auto const& d: all)
            names.push_back(eventType(d.event));
        return names;
    }();

    REQUIRE(types.size() >= 6);
    CHECK(types[0] == "session.created");
    CHECK(isStatus(all[1], SessionStatus::Idle, "Session ready"));
    CHECK(isStatus(all[2], SessionStatus::Thinking, "Thinking..."));
    CHECK(types[3] == "router.decision");
    CHECK(types.back() == "session.status");

    auto const decision = eventsOf<RouterDecisionEvent>(all).at(0);
    CHECK(decision.agent == "chat.quick");
    CHECK(decision.reason == "default");

    auto const messages = eventsOf<AssistantMessageEvent>(all);
    REQUIRE(messages.size() == 1);
    CHECK(messages[0].content == "Hi! How can I help?");
    CHECK(streamedText(all) == messages[0].content);

    auto const metrics = eventsOf<PerfMetricEvent>(all);
    CHECK(std::ranges::any_of(metrics, [](const PerfMetricEvent& m) { return m.name == "llm.ttfb"; }));
    CHECK(std::ranges::any_of(metrics, [](const PerfMetricEvent& m) { return m.name == "llm.total"; }));

    // Session events are broadcast.
    CHECK(std::ranges::all_of(all, [](const Delivery& d) { return !d.target.has_value(); }));

    auto const requests = llm.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].streaming);
    CHECK(requests[0].messages.back().content == "hello there");
}

TEST_CASE("SessionEngine rejects sends while a session is busy", "[engine]")
{
    auto llm = GatedChatClient {};
    llm.queueReply("first answer");
    auto harness = EngineHarness(llm);

    harness.send(1, CreateS1);
    harness.send(1, R"({"type":"session.send","payload":{"sessionId":"s1","content":"one"}})");
    REQUIRE(harness.waitFor([](const std::vector<Delivery>& all) { return !eventsOf<RouterDecisionEvent>(all).empty(); }));

    harness.send(2, R"({"type":"session.send","payload":{"sessionId":"s1","content":"two"}})");
    REQUIRE(harness.waitFor([](const std::vector<Delivery>& all) { return !eventsOf<ErrorEvent>(all).empty(); }));

    llm.release();
    REQUIRE(harness.waitFor(hasStatus(SessionStatus::Idle, "Ready")));

    auto const all = harness.deliveries();
    auto const rejected = std::ranges::find_if(all, [](const Delivery& d) { return std::holds_alternative<ErrorEvent>(d.event); });
    REQUIRE(rejected != all.end());
    CHECK(rejected->target == ClientId { 2 });
    CHECK(std::get<ErrorEvent>(rejected->event).error == "Session s1 is busy");

    auto const messages = eventsOf<AssistantMessageEvent>(all);
    REQUIRE(messages.size() == 1);
    CHECK(messages[0].content == "first answer");
    CHECK(llm.requests().size() == 1);
}

TEST_CASE("SessionEngine answers malformed messages with an error to the sender", "[engine]")
{
    auto llm = ScriptedChatClient {};
    auto harness = EngineHarness(llm);

    harness.send(5, "{not json");
    harness.send(5, R"({"type":"session.teleport"})");
    REQUIRE(harness.waitFor([](const std::vector<Delivery>& all) { return eventsOf<ErrorEvent>(all).size() == 2; }));

    auto const all = harness.deliveries();
    REQUIRE(all.size() == 2);
    CHECK(all[0].target == ClientId { 5 });
    CHECK(std::get<ErrorEvent>(all[0].event).error.starts_with("Failed to parse message: "));
    CHECK(std::get<ErrorEvent>(all[1].event).error.starts_with("Invalid command: "));
}

TEST_CASE("SessionEngine runs the tool loop for a pinned agent", "[engine]")
{
    auto llm = ScriptedChatClient {};
    llm.queueReply(R"(TOOL_CALL: {"name":"time.now","args":{}})");
    llm.queueReply("It is now.");
    auto harness = EngineHarness(llm);

    harness.send(1, CreateS1);
    harness.send(1, R"({"type":"session.configure","payload":{"sessionId":"s1","routingMode":"pinned","agent":"tool.use"}})");
    harness.send(1, R"({"type":"session.send","payload":{"sessionId":"s1","content":"what time is it?"}})");
    REQUIRE(harness.waitFor(hasStatus(SessionStatus::Idle, "Ready")));

    auto const all = harness.deliveries();
    CHECK(std::ranges::any_of(all, [](const Delivery& d) {
        return isStatus(d, SessionStatus::Idle, "Configured (pinned: tool.use)");
    }));
    CHECK(std::ranges::any_of(all, [](const Delivery& d) { return isStatus(d, SessionStatus::ToolUse, "Agent (tool.use)..."); }));

    auto const decision = eventsOf<RouterDecisionEvent>(all).at(0);
    CHECK(decision.agent == "tool.use");
    CHECK(decision.reason == "pinned");
    CHECK(decision.routingMode == RoutingMode::Pinned);

    auto const calls = eventsOf<ToolCallEvent>(all);
    auto const results = eventsOf<ToolResultEvent>(all);
    REQUIRE(calls.size() == 1);
    REQUIRE(results.size() == 1);
    CHECK(calls[0].tool.name == "time.now");
    CHECK(results[0].toolId == calls[0].tool.id);
    CHECK(results[0].result["ok"] == true);

    auto const messages = eventsOf<AssistantMessageEvent>(all);
    REQUIRE(messages.size() == 1);
    CHECK(messages[0].content == "It is now.");
    CHECK(streamedText(all) == "It is now.");
}

TEST_CASE("SessionEngine explains a missing LLM backend", "[engine]")
{
    auto llm = ScriptedChatClient {};
    auto settings = EngineHarness::quietSettings();
    settings.llm.prefer = false;
    auto harness = EngineHarness(llm, settings);

    harness.send(1, CreateS1);
    harness.send(1, R"({"type":"session.send","payload":{"sessionId":"s1","content":"hello"}})");
    REQUIRE(harness.waitFor(hasStatus(SessionStatus::Idle, "Ready")));

    auto const all = harness.deliveries();
    auto const messages = eventsOf<AssistantMessageEvent>(all);
    REQUIRE(messages.size() == 1);
    CHECK(messages[0].content == noLlmReply("hello"));
    CHECK(streamedText(all) == messages[0].content);
    CHECK(llm.requests().empty());
}

TEST_CASE("SessionEngine turns LLM failures into a reply", "[engine]")
{
    auto llm = ScriptedChatClient {};
    llm.queueError(ErrorCode::TimeoutError, "request timed out");
    auto harness = EngineHarness(llm);

    harness.send(1, CreateS1);
    harness.send(1, R"({"type":"session.send","payload":{"sessionId":"s1","content":"hello"}})");
    REQUIRE(harness.waitFor(hasStatus(SessionStatus::Idle, "Ready")));

    auto const all = harness.deliveries();
    auto const messages = eventsOf<AssistantMessageEvent>(all);
    REQUIRE(messages.size() == 1);
    CHECK(messages[0].content == llmFailedReply("request timed out"));
    CHECK(streamedText(all) == messages[0].content);
}

TEST_CASE("SessionEngine reports an unreadable image attachment", "[engine]")
{
    auto llm = ScriptedChatClient {};
    auto harness = EngineHarness(llm);
    harness.workspace.write("notes.txt", "text");
    auto const path = (harness.workspace.path() / "notes.txt").string();

    harness.send(1, CreateS1);
    auto const send = nlohmann::json {
        { "type", "session.send" },
        { "payload", { { "sessionId", "s1" }, { "content", "look" }, { "images", { path } } } },
    };
    harness.send(1, send.dump());
    REQUIRE(harness.waitFor(hasStatus(SessionStatus::Idle, "Ready")));

    auto const messages = eventsOf<AssistantMessageEvent>(harness.deliveries());
    REQUIRE(messages.size() == 1);
    CHECK(messages[0].content == "Image attachment failed: unsupported image type: .txt");
    CHECK(llm.requests().empty());
}

TEST_CASE("SessionEngine answers queries to the requesting client", "[engine]")
{
    auto llm = ScriptedChatClient {};
    auto harness = EngineHarness(llm);

    harness.send(3, R"({"type":"agent.list"})");
    harness.send(3, R"({"type":"service.status","payload":{"name":"mlx"}})");
    REQUIRE(harness.waitFor([](const std::vector<Delivery>& all) { return all.size() == 2; }));

    auto const all = harness.deliveries();
    CHECK(std::ranges::all_of(all, [](const Delivery& d) { return d.target == ClientId { 3 }; }));

    auto const lists = eventsOf<AgentListEvent>(all);
    REQUIRE(lists.size() == 1);
    CHECK(lists[0].agents.size() == 5);

    auto const statuses = eventsOf<ServiceStatusEvent>(all);
    REQUIRE(statuses.size() == 1);
    CHECK(statuses[0].service.name == "mlx");
    CHECK(statuses[0].service.status == ServiceStatus::Stopped);
}

namespace
{

auto statusTrail(const std::vector<Delivery>& all) -> std::vector<std::pair<SessionStatus, std::string>>
{
    auto trail = std::vector<std::pair<SessionStatus, std::string>> {};
    for (auto const& status: eventsOf<SessionStatusEvent>(all))
        trail.emplace_back(status.status, status.detail.value_or(""));
    return trail;
}

auto workbenchMetrics(const std::vector<Delivery>& all) -> std::vector<PerfMetricEvent>
{
    auto metrics = eventsOf<PerfMetricEvent>(all);
    std::erase_if(metrics, [](const PerfMetricEvent& m) { return !m.name.starts_with("workbench."); });
    return metrics;
}

auto countStatus(SessionStatus status, std::string_view detail, std::size_t count)
{
    return [=](const std::vector<Delivery>& all) {
        return static_cast<std::size_t>(std::ranges::count_if(all, [&](const Delivery& d) {
                   return isStatus(d, status, detail);
               }))
               >= count;
    };
}

auto followupSettings() -> EngineSettings
{
    auto settings = EngineHarness::quietSettings();
    settings.quickFollowup = true;
    return settings;
}

constexpr auto LongPrompt =
    std::string_view { R"({"type":"session.send","payload":{"sessionId":"s1","content":"tell me about the moon"}})" };

} // namespace

TEST_CASE("SessionEngine walks the quick path through its statuses", "[engine]")
{
    auto llm = ScriptedChatClient {};
    llm.queueReply("Hello.");
    auto harness = EngineHarness(llm);

    harness.send(1, CreateS1);
    harness.send(1, R"({"type":"session.send","payload":{"sessionId":"s1","content":"hi"}})");
    REQUIRE(harness.waitFor(hasStatus(SessionStatus::Idle, "Ready")));

    using Step = std::pair<SessionStatus, std::string>;
    CHECK(statusTrail(harness.deliveries())
          == std::vector<Step> {
              { SessionStatus::Idle, "Session ready" },
              { SessionStatus::Thinking, "Thinking..." },
              { SessionStatus::Streaming, "Local LLM (chat.quick)..." },
              { SessionStatus::Streaming, "Finalizing..." },
              { SessionStatus::Idle, "Ready" },
          });
}

TEST_CASE("SessionEngine walks the tool path through its statuses", "[engine]")
{
    auto llm = ScriptedChatClient {};
    llm.queueReply("No tool needed.");
    auto harness = EngineHarness(llm);

    harness.send(1, CreateS1);
    harness.send(1, R"({"type":"session.configure","payload":{"sessionId":"s1","routingMode":"pinned","agent":"tool.use"}})");
    harness.send(1, R"({"type":"session.send","payload":{"sessionId":"s1","content":"anything new?"}})");
    REQUIRE(harness.waitFor(hasStatus(SessionStatus::Idle, "Ready")));

    using Step = std::pair<SessionStatus, std::string>;
    CHECK(statusTrail(harness.deliveries())
          == std::vector<Step> {
              { SessionStatus::Idle, "Session ready" },
              { SessionStatus::Idle, "Configured (pinned: tool.use)" },
              { SessionStatus::Thinking, "Thinking..." },
              { SessionStatus::ToolUse, "Agent (tool.use)..." },
              { SessionStatus::Streaming, "Finalizing..." },
              { SessionStatus::Idle, "Ready" },
          });
}

TEST_CASE("SessionEngine extends a short quick reply with one follow-up", "[engine]")
{
    auto llm = ScriptedChatClient {};
    llm.queueReply("The moon orbits Earth.");
    llm.queueReply("It is about 384,400 km away.");
    auto harness = EngineHarness(llm, followupSettings());

    harness.send(1, CreateS1);
    harness.send(1, LongPrompt);
    REQUIRE(harness.waitFor(hasStatus(SessionStatus::Idle, "Ready")));

    auto const all = harness.deliveries();
    auto const messages = eventsOf<AssistantMessageEvent>(all);
    REQUIRE(messages.size() == 1);
    CHECK(messages[0].content == "The moon orbits Earth.\n\nIt is about 384,400 km away.");
    CHECK(streamedText(all) == messages[0].content);

    auto const requests = llm.requests();
    REQUIRE(requests.size() == 2);
    CHECK(requests[1].streaming);
    CHECK(requests[1].messages.front().content.ends_with(
        "Continue with a bit more useful detail. Do not repeat the previous response."));
}

TEST_CASE("SessionEngine swallows a failed follow-up", "[engine]")
{
    auto llm = ScriptedChatClient {};
    llm.queueReply("The moon orbits Earth.");
    llm.queueError(ErrorCode::TimeoutError, "request timed out");
    auto harness = EngineHarness(llm, followupSettings());

    harness.send(1, CreateS1);
    harness.send(1, LongPrompt);
    REQUIRE(harness.waitFor(hasStatus(SessionStatus::Idle, "Ready")));

    auto const all = harness.deliveries();
    auto const messages = eventsOf<AssistantMessageEvent>(all);
    REQUIRE(messages.size() == 1);
    CHECK(messages[0].content == "The moon orbits Earth.");
    CHECK(streamedText(all) == "The moon orbits Earth.\n\n");
    CHECK(eventsOf<ErrorEvent>(all).empty());
    CHECK(llm.requests().size() == 2);
}

TEST_CASE("SessionEngine skips the follow-up for short prompts", "[engine]")
{
    auto llm = ScriptedChatClient {};
    llm.queueReply("Hi!");
    auto harness = EngineHarness(llm, followupSettings());

    harness.send(1, CreateS1);
    harness.send(1, R"({"type":"session.send","payload":{"sessionId":"s1","content":"hello"}})");
    REQUIRE(harness.waitFor(hasStatus(SessionStatus::Idle, "Ready")));

    CHECK(streamedText(harness.deliveries()) == "Hi!");
    CHECK(llm.requests().size() == 1);
}

TEST_CASE("SessionEngine cancel resets the status but lets the reply finish", "[engine]")
{
    auto llm = GatedChatClient {};
    llm.queueReply("Late answer.");
    auto harness = EngineHarness(llm);

    harness.send(1, CreateS1);
    harness.send(1, R"({"type":"session.send","payload":{"sessionId":"s1","content":"hello"}})");
    REQUIRE(harness.waitFor(hasStatus(SessionStatus::Streaming, "Local LLM (chat.quick)...")));

    harness.send(1, R"({"type":"session.cancel","payload":{"sessionId":"s1"}})");
    REQUIRE(harness.waitFor(hasStatus(SessionStatus::Idle, "Cancelled")));
    CHECK(eventsOf<AssistantMessageEvent>(harness.deliveries()).empty());

    llm.release();
    REQUIRE(harness.waitFor(hasStatus(SessionStatus::Idle, "Ready")));

    auto const all = harness.deliveries();
    auto const cancelled = std::ranges::find_if(all, [](const Delivery& d) { return isStatus(d, SessionStatus::Idle, "Cancelled"); });
    auto const ready = std::ranges::find_if(all, [](const Delivery& d) { return isStatus(d, SessionStatus::Idle, "Ready"); });
    CHECK(cancelled < ready);

    auto const messages = eventsOf<AssistantMessageEvent>(all);
    REQUIRE(messages.size() == 1);
    CHECK(messages[0].content == "Late answer.");
    CHECK(streamedText(all) == "Late answer.");
}

TEST_CASE("SessionEngine cancel of an unknown session is silent", "[engine]")
{
    auto llm = ScriptedChatClient {};
    auto harness = EngineHarness(llm);

    harness.send(1, R"({"type":"session.cancel","payload":{"sessionId":"ghost"}})");
    harness.send(1, R"({"type":"agent.list"})");
    REQUIRE(harness.waitFor([](const std::vector<Delivery>& all) { return !all.empty(); }));

    auto const all = harness.deliveries();
    REQUIRE(all.size() == 1);
    CHECK(std::holds_alternative<AgentListEvent>(all[0].event));
}

TEST_CASE("SessionEngine runs the workbench after a quick reply", "[engine]")
{
    auto llm = ScriptedChatClient {};
    llm.queueReply("Paris is the capital of France.");
    llm.queueReply("The capital of France is Paris.");
    auto settings = EngineHarness::quietSettings();
    settings.workbench = { WorkbenchStrategyId::Quick };
    auto harness = EngineHarness(llm, settings);

    harness.send(1, CreateS1);
    harness.send(1, R"({"type":"session.send","payload":{"sessionId":"s1","content":"capital of france?"}})");
    REQUIRE(harness.waitFor([](const std::vector<Delivery>& all) { return !workbenchMetrics(all).empty(); }));

    auto const all = harness.deliveries();
    auto const metrics = workbenchMetrics(all);
    REQUIRE(metrics.size() == 1);
    CHECK(metrics[0].name == "workbench.strategy");
    CHECK(metrics[0].sessionId == "s1");
    CHECK(metrics[0].meta["strategy"] == "quick");
    CHECK(metrics[0].meta["agent"] == "chat.quick");
    CHECK(metrics[0].meta["jaccard"].get<double>() == 1.0);

    // The primary reply is complete before the comparison is reported.
    auto const ready = std::ranges::find_if(all, [](const Delivery& d) { return isStatus(d, SessionStatus::Idle, "Ready"); });
    auto const metric = std::ranges::find_if(all, [](const Delivery& d) {
        auto const* e = std::get_if<PerfMetricEvent>(&d.event);
        return e && e->name == "workbench.strategy";
    });
    CHECK(ready < metric);

    auto const requests = llm.requests();
    REQUIRE(requests.size() == 2);
    CHECK(!requests[1].streaming);
}

TEST_CASE("SessionEngine keeps the workbench off outside the plain quick path", "[engine]")
{
    auto llm = ScriptedChatClient {};
    auto settings = EngineHarness::quietSettings();
    settings.workbench = { WorkbenchStrategyId::Quick };

    SECTION("after a follow-up")
    {
        settings.quickFollowup = true;
        llm.queueReply("The moon orbits Earth.");
        llm.queueReply("It is about 384,400 km away.");
        auto harness = EngineHarness(llm, settings);

        harness.send(1, CreateS1);
        harness.send(1, LongPrompt);
        REQUIRE(harness.waitFor(hasStatus(SessionStatus::Idle, "Ready")));
        std::this_thread::sleep_for(200ms);

        CHECK(workbenchMetrics(harness.deliveries()).empty());
        CHECK(llm.requests().size() == 2);
    }

    SECTION("on the tool path")
    {
        llm.queueReply("Nothing to look up.");
        auto harness = EngineHarness(llm, settings);

        harness.send(1, CreateS1);
        harness.send(1, R"({"type":"session.configure","payload":{"sessionId":"s1","routingMode":"pinned","agent":"tool.use"}})");
        harness.send(1, R"({"type":"session.send","payload":{"sessionId":"s1","content":"anything new?"}})");
        REQUIRE(harness.waitFor(hasStatus(SessionStatus::Idle, "Ready")));
        std::this_thread::sleep_for(200ms);

        CHECK(workbenchMetrics(harness.deliveries()).empty());
        CHECK(llm.requests().size() == 1);
    }
}

TEST_CASE("SessionEngine skips the workbench when the session is busy again", "[engine]")
{
    auto llm = ScriptedChatClient {};
    llm.queueReply("First answer.");
    llm.queueReply("Second answer.");
    llm.queueReply("Workbench answer.");
    auto settings = EngineHarness::quietSettings();
    settings.workbench = { WorkbenchStrategyId::Quick };
    auto harness = EngineHarness(llm, settings);

    // The second send is queued on the strand between the first reply and its workbench launch.
    auto resent = std::atomic<bool> { false };
    harness.onDelivery = [&](const Delivery& d) {
        if (isStatus(d, SessionStatus::Idle, "Ready") && !resent.exchange(true))
            harness.send(1, R"({"type":"session.send","payload":{"sessionId":"s1","content":"and again"}})");
    };

    harness.send(1, CreateS1);
    harness.send(1, R"({"type":"session.send","payload":{"sessionId":"s1","content":"hello"}})");
    REQUIRE(harness.waitFor(countStatus(SessionStatus::Idle, "Ready", 2)));
    REQUIRE(harness.waitFor([](const std::vector<Delivery>& all) { return !workbenchMetrics(all).empty(); }));
    std::this_thread::sleep_for(200ms);

    auto const all = harness.deliveries();
    auto const metrics = workbenchMetrics(all);
    REQUIRE(metrics.size() == 1);
    CHECK(metrics[0].name == "workbench.strategy");
    CHECK(metrics[0].meta["primaryLength"] == std::string_view("Second answer.").size());
    CHECK(eventsOf<ErrorEvent>(all).empty());
    CHECK(llm.requests().size() == 3);
}

TEST_CASE("SessionEngine answers sends while service starts are blocked", "[engine]")
{
    auto llm = ScriptedChatClient {};
    llm.queueReply("Still responsive.");

    auto gate = std::counting_semaphore<8> { 0 };
    auto entered = std::atomic<int> { 0 };
    auto blockingConfig = [&](const ServiceDescriptor& descriptor) -> Result<ServiceConfig> {
        if (descriptor.name == "mlx")
            return ServiceConfig {};
        ++entered;
        gate.acquire();
        return makeError(ErrorCode::ConfigError, std::format("{} is held", descriptor.name));
    };
    auto harness = EngineHarness(llm, EngineHarness::quietSettings(), blockingConfig);

    harness.send(2, R"({"type":"service.start","payload":{"name":"kokomo"}})");
    harness.send(2, R"({"type":"service.start","payload":{"name":"vlm"}})");
    harness.send(2, R"({"type":"service.stop","payload":{"name":"vlm"}})");
    for (auto i = 0; i < 500 && entered < 2; ++i)
        std::this_thread::sleep_for(10ms);
    REQUIRE(entered == 2);

    harness.send(1, CreateS1);
    harness.send(1, R"({"type":"session.send","payload":{"sessionId":"s1","content":"hello"}})");
    REQUIRE(harness.waitFor(hasStatus(SessionStatus::Idle, "Ready")));
    CHECK(eventsOf<AssistantMessageEvent>(harness.deliveries()).at(0).content == "Still responsive.");

    gate.release(2);
    REQUIRE(harness.waitFor([](const std::vector<Delivery>& all) { return eventsOf<ErrorEvent>(all).size() == 2; }));

    auto const errors = eventsOf<ErrorEvent>(harness.deliveries());
    CHECK(std::ranges::any_of(errors, [](const ErrorEvent& e) { return e.error == "kokomo is held"; }));
    CHECK(std::ranges::any_of(errors, [](const ErrorEvent& e) { return e.error == "vlm is held"; }));
}

TEST_CASE("SessionEngine sends a workspace prompt that is not valid UTF-8", "[engine]")
{
    auto server = agentloop::testing::LocalHttpServer([](auto const&, auto const&) {
        return agentloop::testing::CannedReply {
            .contentType = "text/event-stream",
            .chunks = { "data: {\"choices\":[{\"delta\":{\"content\":\"Noted.\"}}]}\n\n", "data: [DONE]\n\n" },
        };
    });
    auto llm = HttpChatClient("MLX");
    auto settings = EngineHarness::quietSettings();
    settings.llm.baseUrl = server.url();
    auto harness = EngineHarness(llm, settings);

    // Latin-1 encoded notes.
    harness.workspace.write(".agentloop/workspace.md", "R\xe9sum\xe9 of the caf\xe9 project");

    harness.send(1, CreateS1);
    harness.send(1, R"({"type":"session.send","payload":{"sessionId":"s1","content":"hello"}})");
    REQUIRE(harness.waitFor(hasStatus(SessionStatus::Idle, "Ready")));

    auto const messages = eventsOf<AssistantMessageEvent>(harness.deliveries());
    REQUIRE(messages.size() == 1);
    CHECK(messages[0].content == "Noted.");

    auto const bodies = server.bodies();
    REQUIRE(bodies.size() == 1);
    CHECK(bodies.front().find("R\xEF\xBF\xBDsum\xEF\xBF\xBD of the caf\xEF\xBF\xBD project") != std::string::npos);
}
