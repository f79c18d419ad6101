// SPDX-License-Identifier: Apache-2.0
#include "SessionEngine.hpp"

#include <agent/AgentCatalog.hpp>
#include <agent/PromptStack.hpp>
#include <agent/Router.hpp>
#include <agent/ToolLoop.hpp>
#include <agent/Toolbox.hpp>
#include <core/Ids.hpp>
#include <core/Log.hpp>
#include <core/Overloaded.hpp>
#include <core/TextUtils.hpp>
#include <engine/ImageAttachment.hpp>
#include <engine/Replies.hpp>
#include <engine/Session.hpp>
#include <engine/Workbench.hpp>
#include <llm/ChatClient.hpp>
#include <llm/OutputSanitizer.hpp>
#include <service/ServiceRegistry.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <format>
#include <map>

namespace agentloop
{

namespace asio = boost::asio;

namespace
{
    constexpr auto BackgroundThreads = std::size_t { 2 };

    constexpr auto FollowupInstruction =
        std::string_view { "Continue with a bit more useful detail. Do not repeat the previous response." };

    /// @brief Everything a pipeline needs, copied out of the session on the strand.
    struct PipelineJob
    {
        std::string sessionId;
        std::string content;
        std::vector<std::string> images;
        std::vector<Message> transcript; // includes the new user message
        RoutingMode routingMode = RoutingMode::Auto;
        std::optional<std::string> pinnedAgent;
        std::string sessionPrompt;
    };

    struct FollowupPlan
    {
        std::string system;
        AgentPack agent;
    };

    struct PipelineOutcome
    {
        std::string response;
        bool streamed = false;
        std::optional<std::string> forced;
        std::optional<FollowupPlan> followup;
        std::optional<WorkbenchPlan> workbench;
    };

    auto attachmentNotation(std::string_view content, std::span<const std::string> images) -> std::string
    {
        auto text = std::string(content);
        auto lines = std::string {};
        for (auto const& image: images)
        {
            if (!lines.empty())
                lines += '\n';
            lines += std::format("[image] {}", std::filesystem::path(image).filename().string());
        }
        if (!lines.empty())
            text += "\n" + lines;
        return std::string(text::trim(text));
    }

    auto toEvent(const ServiceEvent& event) -> Event
    {
        return std::visit(overloaded {
                              [](const ServiceStatusChanged& e) -> Event { return ServiceStatusEvent { e.state }; },
                              [](const ServiceLogLine& e) -> Event {
                                  return ServiceLogEvent { .name = e.name, .stream = e.stream, .line = e.line };
                              },
                          },
                          event);
    }
} // namespace

struct SessionEngine::Impl
{
    Impl(asio::io_context& ioc, SessionEngineContext context, EngineSettings engineSettings, std::size_t threads):
        strand(asio::make_strand(ioc)),
        workers(std::max<std::size_t>(threads, 1)),
        background(BackgroundThreads),
        ctx(context),
        settings(std::move(engineSettings))
    {
        serviceListener = ctx.services.subscribe(
            [this](const ServiceEvent& event) { ctx.events.publish(toEvent(event)); });
    }

    asio::strand<asio::io_context::executor_type> strand;
    asio::thread_pool workers;    // session pipelines and agent.list
    asio::thread_pool background; // service lifecycle and workbench runs
    SessionEngineContext ctx;
    EngineSettings settings;
    ServiceRegistry::ListenerId serviceListener = 0;
    std::atomic<bool> stopped = false;

    // Owned by the strand.
    std::map<std::string, Session, std::less<>> sessions;

    // Helpers usable from any thread.
    void onStrand(std::function<void()> task) { asio::post(strand, std::move(task)); }

    void onWorker(std::function<void()> task)
    {
        if (!stopped)
            asio::post(workers, std::move(task));
    }

    void onBackground(std::function<void()> task)
    {
        if (!stopped)
            asio::post(background, std::move(task));
    }

    /// @brief Publishes a session event in strand order.
    void emit(Event event)
    {
        onStrand([this, event = std::move(event)] { ctx.events.publish(event); });
    }

    void setStatus(std::string sessionId, SessionStatus status, std::string detail)
    {
        onStrand([this, sessionId = std::move(sessionId), status, detail = std::move(detail)] {
            if (auto* session = findSession(sessionId))
                session->setStatus(status);
            ctx.events.publish(SessionStatusEvent { .sessionId = sessionId, .status = status, .detail = detail });
        });
    }

    void perf(const std::string& sessionId, std::string name, std::int64_t durationMs, nlohmann::json meta)
    {
        emit(PerfMetricEvent {
            .sessionId = sessionId,
            .name = std::move(name),
            .durationMs = durationMs,
            .meta = std::move(meta),
        });
    }

    void token(const std::string& sessionId, std::string text)
    {
        emit(AssistantTokenEvent { .sessionId = sessionId, .token = std::move(text) });
    }

    // Strand side.
    auto findSession(std::string_view id) -> Session*
    {
        auto const it = sessions.find(id);
        return it == sessions.end() ? nullptr : &it->second;
    }

    auto sessionFor(const std::string& id) -> Session&
    {
        if (auto* session = findSession(id))
            return *session;
        return sessions.emplace(id, Session(id)).first->second;
    }

    void dispatch(ClientId client, Command command)
    {
        std::visit(overloaded {
                       [&](SessionCreateCommand& c) { onCreate(client, std::move(c)); },
                       [&](SessionSendCommand& c) { onSend(client, std::move(c)); },
                       [&](SessionConfigureCommand& c) { onConfigure(std::move(c)); },
                       [&](SessionCancelCommand& c) { onCancel(c); },
                       [&](AgentListCommand&) { onAgentList(client); },
                       [&](ServiceStartCommand& c) { onServiceStart(client, std::move(c.name)); },
                       [&](ServiceStopCommand& c) { onServiceStop(client, std::move(c.name)); },
                       [&](ServiceStatusCommand& c) { onServiceStatus(client, c.name); },
                   },
                   command);
    }

    void onCreate(ClientId client, SessionCreateCommand command)
    {
        auto const id = command.sessionId.value_or(createId());
        if (auto const* existing = findSession(id); existing && isBusy(existing->status()))
        {
            ctx.events.sendTo(client, ErrorEvent { .sessionId = id, .error = std::format("Session {} is busy", id) });
            return;
        }

        sessions.insert_or_assign(id, Session(id));
        ctx.events.publish(SessionCreatedEvent { .sessionId = id });
        ctx.events.publish(
            SessionStatusEvent { .sessionId = id, .status = SessionStatus::Idle, .detail = "Session ready" });
    }

    void onSend(ClientId client, SessionSendCommand command)
    {
        auto& session = sessionFor(command.sessionId);
        if (isBusy(session.status()))
        {
            log::debug("Rejecting send on busy session {}", session.id());
            ctx.events.sendTo(client,
                              ErrorEvent {
                                  .sessionId = session.id(),
                                  .error = std::format("Session {} is busy", session.id()),
                              });
            return;
        }

        session.addUserMessage(attachmentNotation(command.content, command.images));
        session.setStatus(SessionStatus::Thinking);
        ctx.events.publish(SessionStatusEvent {
            .sessionId = session.id(),
            .status = SessionStatus::Thinking,
            .detail = "Thinking...",
        });

        auto job = PipelineJob {
            .sessionId = session.id(),
            .content = std::move(command.content),
            .images = std::move(command.images),
            .transcript = session.messages(),
            .routingMode = session.routingMode(),
            .pinnedAgent = session.pinnedAgent(),
            .sessionPrompt = session.sessionPrompt().value_or(std::string {}),
        };
        onWorker([this, job = std::move(job)]() mutable { runPipeline(std::move(job)); });
    }

    void onConfigure(SessionConfigureCommand command)
    {
        auto& session = sessionFor(command.sessionId);
        if (command.routingMode)
            session.setRoutingMode(*command.routingMode);
        if (command.agent)
            session.setPinnedAgent(std::move(*command.agent));
        if (command.sessionPrompt)
            session.setSessionPrompt(std::move(*command.sessionPrompt));

        ctx.events.publish(SessionStatusEvent {
            .sessionId = session.id(),
            .status = session.status(),
            .detail = session.configurationSummary(),
        });
    }

    void onCancel(const SessionCancelCommand& command)
    {
        auto* session = findSession(command.sessionId);
        if (!session)
            return;
        session->setStatus(SessionStatus::Idle);
        ctx.events.publish(
            SessionStatusEvent { .sessionId = session->id(), .status = SessionStatus::Idle, .detail = "Cancelled" });
    }

    void onAgentList(ClientId client)
    {
        onWorker([this, client] {
            auto const snapshot = ctx.agents.snapshot();
            auto event = AgentListEvent {};
            for (auto const& agent: snapshot.agents)
                event.agents.push_back({ .name = agent.name, .description = agent.description, .tools = agent.tools });
            ctx.events.sendTo(client, event);
        });
    }

    void onServiceStart(ClientId client, std::string name)
    {
        onBackground([this, client, name = std::move(name)] {
            if (auto result = ctx.services.start(name); !result)
                ctx.events.sendTo(client, ErrorEvent { .sessionId = std::nullopt, .error = result.error().message });
        });
    }

    void onServiceStop(ClientId client, std::string name)
    {
        onBackground([this, client, name = std::move(name)] {
            if (auto result = ctx.services.stop(name); !result)
                ctx.events.sendTo(client, ErrorEvent { .sessionId = std::nullopt, .error = result.error().message });
        });
    }

    void onServiceStatus(ClientId client, const std::optional<std::string>& name)
    {
        if (!name)
        {
            for (auto& state: ctx.services.visibleStates())
                ctx.events.sendTo(client, ServiceStatusEvent { std::move(state) });
            return;
        }

        auto state = ctx.services.state(*name);
        if (!state)
        {
            ctx.events.sendTo(client, ErrorEvent { .sessionId = std::nullopt, .error = state.error().message });
            return;
        }
        ctx.events.sendTo(client, ServiceStatusEvent { std::move(*state) });
    }

    // Worker side.
    /// @brief Brings a backend up when it is configured or already answering.
    /// @return True when requests should be attempted.
    auto ensureBackend(std::string_view name, bool prefer) -> bool
    {
        auto const canTry = prefer || ctx.services.canStart(name) || ctx.services.isHealthy(name);
        if (canTry && !ctx.services.isRunning(name))
        {
            if (auto result = ctx.services.start(name); !result)
                log::debug("Auto-start of {} failed: {}", name, result.error().message);
        }
        auto const healthy = ctx.services.isHealthy(name);
        return prefer || ctx.services.isRunning(name) || healthy;
    }

    auto systemPromptFor(const AgentPack& agent, const AgentSnapshot& snapshot, const PipelineJob& job) const
        -> std::string
    {
        auto const composed = composeSystemPrompt(agent, snapshot.workspacePrompt, job.sessionPrompt);
        return joinNonEmpty({ composed, settings.systemPrompt });
    }

    /// @brief Streams a reply through the quick-path scrubber.
    ///
    /// Tokens are forwarded as they arrive until tool-call syntax shows up;
    /// the first forwarded token is reported as `llm.ttfb`.
    auto streamScrubbed(const std::string& sessionId,
                        const std::string& agent,
                        std::string_view mode,
                        std::span<const ChatMessage> messages,
                        const ChatOptions& options) -> Result<Completion>
    {
        auto const start = std::chrono::steady_clock::now();
        auto tokenCount = 0;
        auto blocked = false;

        auto completion = ctx.llm.completeStreaming(
            messages,
            [&](std::string_view raw) {
                if (blocked)
                    return;
                auto scrubbed = scrubToken(raw);
                if (!scrubbed.text.empty())
                {
                    if (tokenCount++ == 0)
                        perf(sessionId, "llm.ttfb", millisSince(start), { { "agent", agent }, { "mode", mode } });
                    token(sessionId, std::move(scrubbed.text));
                }
                if (scrubbed.stop)
                    blocked = true;
            },
            options);

        if (completion)
        {
            perf(sessionId,
                 "llm.total",
                 millisSince(start),
                 { { "agent", agent }, { "mode", mode }, { "tokens", tokenCount }, { "model", completion->model } });
        }
        return completion;
    }

    void runVision(const PipelineJob& job, std::span<const ImageAttachment> images, PipelineOutcome& outcome)
    {
        if (!ensureBackend("vlm", false))
        {
            outcome.forced = visionUnavailableReply();
            return;
        }

        setStatus(job.sessionId, SessionStatus::Streaming, "Vision (vlm)...");

        auto const snapshot = ctx.agents.snapshot();
        auto const& agent = findAgentOrFirst(snapshot.agents, DefaultAgentName);
        auto const system = systemPromptFor(agent, snapshot, job);

        auto const prompt = text::trim(job.content);
        auto user = ChatMessage { .role = Role::User, .content = std::string(prompt.empty() ? "Describe the image." : prompt) };
        for (auto const& image: images)
            user.imageUrls.push_back(image.dataUrl);

        auto messages = std::vector<ChatMessage> {};
        if (!system.empty())
            messages.push_back(ChatMessage { .role = Role::System, .content = system });
        messages.push_back(std::move(user));

        auto const options = ChatOptions {
            .baseUrl = settings.vlm.baseUrl,
            .model = settings.vlm.model,
            .timeout = settings.vlm.timeout,
            .maxTokens = settings.vlm.maxTokens,
            .temperature = settings.vlm.temperature,
            .topP = settings.llm.topP,
        };

        auto const start = std::chrono::steady_clock::now();
        auto completion = ctx.vlm.complete(messages, options);
        if (!completion)
        {
            outcome.forced = std::format("VLM request failed: {}", completion.error().message);
            return;
        }

        outcome.response = std::move(completion->content);
        perf(job.sessionId,
             "llm.total",
             millisSince(start),
             { { "mode", "vlm" }, { "model", completion->model }, { "images", images.size() } });
    }

    void runQuick(const PipelineJob& job, const AgentPack& agent, const std::string& system, PipelineOutcome& outcome)
    {
        setStatus(job.sessionId, SessionStatus::Streaming, std::format("Local LLM ({})...", agent.name));

        auto const quickSystem = joinNonEmpty({ system, QuickOutputGuidance });
        auto const messages = buildChatMessages(quickSystem, job.transcript, agent.maxHistoryTurns);
        auto const& llm = settings.llm;
        auto const options = ChatOptions {
            .baseUrl = llm.quickBaseUrl.empty() ? llm.baseUrl : llm.quickBaseUrl,
            .model = llm.quickModel,
            .timeout = llm.timeout,
            .maxTokens = llm.quickMaxTokens,
            .temperature = llm.quickTemperature.value_or(agent.temperature.value_or(llm.temperature)),
            .topP = llm.topP,
        };

        auto completion = streamScrubbed(job.sessionId, agent.name, "stream", messages, options);
        if (!completion)
        {
            outcome.response = llmFailedReply(completion.error().message);
            return;
        }

        outcome.streamed = true;
        outcome.response = sanitizeOutput(completion->content);

        if (!settings.workbench.empty())
        {
            outcome.workbench = WorkbenchPlan {
                .sessionId = job.sessionId,
                .agent = agent.name,
                .system = quickSystem,
                .primaryResponse = outcome.response,
                .primaryModel = completion->model,
                .messages = job.transcript,
            };
        }

        auto const promptChars = static_cast<int>(text::trim(job.content).size());
        auto const replyChars = static_cast<int>(text::trim(outcome.response).size());
        if (agent.name == DefaultAgentName && settings.quickFollowup && promptChars >= settings.followupMinPromptChars
            && replyChars < settings.followupMinChars)
        {
            outcome.followup = FollowupPlan { .system = quickSystem, .agent = agent };
        }
    }

    /// @return False when the tool loop failed; @p outcome then carries the failure reply.
    auto runTools(const PipelineJob& job, const AgentPack& agent, const std::string& system, PipelineOutcome& outcome)
        -> bool
    {
        setStatus(job.sessionId, SessionStatus::ToolUse, std::format("Agent ({})...", agent.name));

        auto const& llm = settings.llm;
        auto loop = ToolLoop(ctx.llm,
                             ctx.toolbox,
                             ToolLoopConfig {
                                 .systemPrompt = system,
                                 .allowedTools = agent.tools,
                                 .maxToolCalls = agent.maxToolCalls,
                                 .chat = ChatOptions {
                                     .baseUrl = llm.baseUrl,
                                     .model = llm.model,
                                     .timeout = llm.timeout,
                                     .maxTokens = llm.maxTokens,
                                     .temperature = agent.temperature.value_or(llm.temperature),
                                     .topP = llm.topP,
                                 },
                             });

        auto const sessionId = job.sessionId;
        auto callbacks = ToolLoopCallbacks {
            .onToolCall =
                [this, sessionId](const ToolCall& call) {
                    onStrand([this, sessionId, call] {
                        if (auto* session = findSession(sessionId))
                            session->addToolCall(call);
                        ctx.events.publish(ToolCallEvent { .sessionId = sessionId, .tool = call });
                    });
                },
            .onToolResult =
                [this, sessionId](const ToolCall& call) {
                    onStrand([this, sessionId, call] {
                        auto const result = call.result.value_or(nlohmann::json {});
                        if (auto* session = findSession(sessionId))
                            session->completeToolCall(call.id, call.status, result);
                        ctx.events.publish(ToolResultEvent { .sessionId = sessionId, .toolId = call.id, .result = result });
                    });
                },
        };

        auto const start = std::chrono::steady_clock::now();
        auto reply = loop.run(job.transcript, callbacks);
        if (!reply)
        {
            outcome.response = llmFailedReply(reply.error().message);
            return false;
        }

        outcome.response = std::move(*reply);
        perf(job.sessionId, "agent.total", millisSince(start), { { "agent", agent.name } });
        return true;
    }

    void runText(const PipelineJob& job, PipelineOutcome& outcome)
    {
        if (!ensureBackend("mlx", settings.llm.prefer))
        {
            outcome.response = noLlmReply(job.content);
            return;
        }

        auto const routeStart = std::chrono::steady_clock::now();
        auto const snapshot = ctx.agents.snapshot();

        auto const* pinned = static_cast<const AgentPack*>(nullptr);
        if (job.routingMode == RoutingMode::Pinned && job.pinnedAgent)
        {
            auto const name = text::trim(*job.pinnedAgent);
            if (!name.empty())
                pinned = findAgent(snapshot.agents, name);
        }

        auto const decision = pinned ? RoutingDecision { pinned->name, pinned->tools, "pinned" }
                                     : routeHeuristic(job.content, snapshot.agents);
        auto const* selected = findAgent(snapshot.agents, decision.agent);
        if (!selected)
            selected = &findAgentOrFirst(snapshot.agents, DefaultAgentName);

        emit(RouterDecisionEvent {
            .sessionId = job.sessionId,
            .routingMode = pinned ? RoutingMode::Pinned : RoutingMode::Auto,
            .agent = selected->name,
            .toolsAllowed = selected->tools,
            .reason = decision.reason,
            .durationMs = millisSince(routeStart),
        });

        auto const system = systemPromptFor(*selected, snapshot, job);
        auto const quick =
            selected->name == DefaultAgentName || (selected->tools.empty() && isSimpleMessage(job.content));

        if (quick)
        {
            runQuick(job, *selected, system, outcome);
            if (!outcome.streamed)
                return;
        }
        else if (!runTools(job, *selected, system, outcome))
        {
            return;
        }

        setStatus(job.sessionId, SessionStatus::Streaming, "Finalizing...");
    }

    void runFollowup(const PipelineJob& job, const FollowupPlan& plan, std::string& response)
    {
        auto const system = joinNonEmpty({ plan.system, FollowupInstruction });
        auto const messages = buildChatMessages(system, job.transcript, std::max(plan.agent.maxHistoryTurns, 12));
        auto const& llm = settings.llm;
        auto const options = ChatOptions {
            .baseUrl = llm.baseUrl,
            .model = llm.followupModel.empty() ? llm.model : llm.followupModel,
            .timeout = llm.timeout,
            .maxTokens = llm.followupMaxTokens,
            .temperature = llm.followupTemperature.value_or(plan.agent.temperature.value_or(llm.temperature)),
            .topP = llm.topP,
        };

        token(job.sessionId, "\n\n");

        auto completion = streamScrubbed(job.sessionId, plan.agent.name, "followup", messages, options);
        if (!completion)
        {
            log::debug("Follow-up for session {} failed: {}", job.sessionId, completion.error().message);
            return;
        }

        auto const extra = sanitizeOutput(completion->content);
        if (!extra.empty())
            response = std::format("{}\n\n{}", response, extra);
    }

    void runPipeline(PipelineJob job)
    {
        auto outcome = PipelineOutcome {};

        auto images = std::vector<ImageAttachment> {};
        for (auto const& path: job.images)
        {
            auto image = loadImageAttachment(path);
            if (!image)
            {
                outcome.forced = std::format("Image attachment failed: {}", image.error().message);
                images.clear();
                break;
            }
            images.push_back(std::move(*image));
        }

        if (!images.empty())
            runVision(job, images, outcome);
        else if (!outcome.forced)
            runText(job, outcome);

        if (outcome.forced)
        {
            outcome.response = std::move(*outcome.forced);
            outcome.streamed = false;
        }

        if (!outcome.streamed)
        {
            for (auto& piece: text::splitKeepingWhitespace(outcome.response))
                token(job.sessionId, std::move(piece));
        }

        if (outcome.followup && !text::trim(outcome.response).empty())
            runFollowup(job, *outcome.followup, outcome.response);

        auto workbench = std::optional<WorkbenchPlan> {};
        if (outcome.workbench && !outcome.followup)
            workbench = std::move(outcome.workbench);

        onStrand([this, sessionId = job.sessionId, response = std::move(outcome.response), workbench = std::move(workbench)] {
            finish(sessionId, response, workbench);
        });
    }

    void finish(const std::string& sessionId, const std::string& response, const std::optional<WorkbenchPlan>& workbench)
    {
        auto& session = sessionFor(sessionId);
        auto const& message = session.addAssistantMessage(response);
        ctx.events.publish(AssistantMessageEvent { .sessionId = sessionId, .messageId = message.id, .content = response });

        session.setStatus(SessionStatus::Idle);
        ctx.events.publish(SessionStatusEvent { .sessionId = sessionId, .status = SessionStatus::Idle, .detail = "Ready" });

        if (workbench)
            onStrand([this, sessionId, plan = *workbench] { launchWorkbench(sessionId, plan); });
    }

    /// @brief Starts the workbench fan-out unless the session got busy again.
    ///
    /// Queued behind finish(), so a send dispatched in between wins.
    void launchWorkbench(const std::string& sessionId, const WorkbenchPlan& plan)
    {
        auto const* session = findSession(sessionId);
        if (!session || session->status() != SessionStatus::Idle)
        {
            log::debug("Skipping workbench for {}: session is no longer idle", sessionId);
            return;
        }

        auto const strategies = buildWorkbenchStrategies(settings.llm, settings.workbench);
        if (strategies.empty())
            return;

        onBackground([this, plan, strategies] {
            runWorkbench(ctx.llm, settings.llm, plan, strategies, [this](PerfMetricEvent metric) {
                emit(std::move(metric));
            });
        });
    }
};

SessionEngine::SessionEngine(asio::io_context& ioc,
                             SessionEngineContext context,
                             EngineSettings settings,
                             std::size_t workerThreads):
    _impl(std::make_unique<Impl>(ioc, context, std::move(settings), workerThreads))
{
}

SessionEngine::~SessionEngine()
{
    shutdown();
    _impl->ctx.services.unsubscribe(_impl->serviceListener);
}

void SessionEngine::handleMessage(ClientId client, std::string_view text)
{
    auto command = parseCommand(text);
    if (!command)
    {
        log::debug("Rejecting message from client {}: {}", client, command.error().message);
        _impl->ctx.events.sendTo(client, ErrorEvent { .sessionId = std::nullopt, .error = command.error().message });
        return;
    }
    submit(client, std::move(*command));
}

void SessionEngine::submit(ClientId client, Command command)
{
    _impl->onStrand([impl = _impl.get(), client, command = std::move(command)]() mutable {
        impl->dispatch(client, std::move(command));
    });
}

void SessionEngine::clientConnected(ClientId client)
{
    _impl->onStrand([impl = _impl.get(), client] { impl->onServiceStatus(client, std::nullopt); });
}

auto SessionEngine::settings() const noexcept -> const EngineSettings&
{
    return _impl->settings;
}

void SessionEngine::shutdown()
{
    if (_impl->stopped.exchange(true))
        return;
    _impl->workers.join();
    _impl->background.join();
}

} // namespace agentloop
