// SPDX-License-Identifier: Apache-2.0
#include <agent/Orchestrator.hpp>
#include <mcp/McpClientManager.hpp>
#include <tools/ToolRegistry.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <semaphore>
#include <thread>

using namespace rigchat;

namespace
{

/// @brief Blocks the model request until it is cancelled.
struct BlockUntilCancelled
{
};

/// @brief Waits for cancellation, then answers anyway, as a reply racing the cancel would.
struct ReplyAfterCancel
{
    std::string text;
};

using ModelStep = std::variant<Result<ModelTurn>, BlockUntilCancelled, ReplyAfterCancel>;

auto reply(std::string text) -> ModelStep
{
    return Result<ModelTurn> { ModelTurn { .text = std::move(text), .toolCalls = {} } };
}

auto callTool(std::string name, nlohmann::json arguments, std::string text = {}) -> ModelStep
{
    auto turn = ModelTurn { .text = std::move(text), .toolCalls = {} };
    turn.toolCalls.push_back(ToolCall { .id = "call_" + name, .toolName = std::move(name), .arguments = std::move(arguments) });
    return Result<ModelTurn> { std::move(turn) };
}

auto echoCall(std::string text) -> ToolCall
{
    return ToolCall { .id = "call_" + text, .toolName = "echo", .arguments = { { "text", text } } };
}

auto callTools(std::vector<ToolCall> calls) -> ModelStep
{
    return Result<ModelTurn> { ModelTurn { .text = {}, .toolCalls = std::move(calls) } };
}

auto failWith(ErrorCode code, std::string message) -> ModelStep
{
    return Result<ModelTurn> { std::unexpected(Error { .code = code, .message = std::move(message) }) };
}

/// @brief ModelClient answering from a script, one step per request.
class ScriptedModel: public ModelClient
{
  public:
    struct Request
    {
        std::vector<Message> history;
        std::vector<std::string> toolNames;
    };

    void push(ModelStep step)
    {
        auto lock = std::lock_guard(_mutex);
        _script.push_back(std::move(step));
    }

    auto send(const std::vector<Message>& history,
              const std::vector<ToolDescriptor>& tools,
              std::stop_token stopToken,
              const TokenCallback& onToken) -> Result<ModelTurn> override
    {
        auto step = ModelStep { reply("(script exhausted)") };
        {
            auto lock = std::unique_lock(_mutex);
            auto request = Request { .history = history, .toolNames = {} };
            for (const auto& tool: tools)
                request.toolNames.push_back(tool.name);
            _requests.push_back(std::move(request));
            if (!_script.empty())
            {
                step = std::move(_script.front());
                _script.pop_front();
            }
        }

        if (std::holds_alternative<BlockUntilCancelled>(step))
        {
            auto lock = std::unique_lock(_mutex);
            _cv.wait(lock, stopToken, [] { return false; });
            ++_finished;
            return makeError(ErrorCode::Cancelled, "Request cancelled");
        }

        if (auto const* late = std::get_if<ReplyAfterCancel>(&step))
        {
            {
                auto lock = std::unique_lock(_mutex);
                _cv.wait(lock, stopToken, [] { return false; });
            }
            if (onToken)
                onToken(late->text);
            ++_finished;
            return ModelTurn { .text = late->text, .toolCalls = {} };
        }

        auto result = std::get<Result<ModelTurn>>(std::move(step));
        if (result && onToken && !result->text.empty())
            onToken(result->text);
        ++_finished;
        return result;
    }

    /// @brief Number of send() calls that have returned.
    [[nodiscard]] auto finished() const -> int { return _finished.load(); }

    auto modelName() const -> std::string override { return "scripted"; }
    void setModelName(std::string) override {}

    auto requests() -> std::vector<Request>
    {
        auto lock = std::lock_guard(_mutex);
        return _requests;
    }

  private:
    std::mutex _mutex;
    std::condition_variable_any _cv;
    std::deque<ModelStep> _script;
    std::vector<Request> _requests;
    std::atomic<int> _finished = 0;
};

/// @brief What the echo tool observed: call count, echoed texts in order, overlap.
struct EchoRecord
{
    std::atomic<int> calls = 0;
    std::atomic<int> running = 0;
    std::atomic<int> maxRunning = 0;
    std::mutex mutex;
    std::vector<std::string> texts;

    auto echoed() -> std::vector<std::string>
    {
        auto lock = std::lock_guard(mutex);
        return texts;
    }
};

class EchoTool: public Tool
{
  public:
    explicit EchoTool(EchoRecord& record): _record(record) {}

    auto name() const -> std::string_view override { return "echo"; }
    auto description() const -> std::string_view override { return "Echo text"; }
    auto inputSchema() const -> nlohmann::json override
    {
        return { { "type", "object" },
                 { "properties", { { "text", { { "type", "string" } } } } },
                 { "required", { "text" } } };
    }
    auto execute(const nlohmann::json& arguments, std::stop_token) -> Result<ToolResultBlock> override
    {
        ++_record.calls;
        auto const running = ++_record.running;
        auto observed = _record.maxRunning.load();
        while (running > observed && !_record.maxRunning.compare_exchange_weak(observed, running))
            ;

        auto const text = arguments["text"].get<std::string>();
        {
            auto lock = std::lock_guard(_record.mutex);
            _record.texts.push_back(text);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        --_record.running;

        if (text == "fail")
            return makeError(ErrorCode::ToolExecutionError, "echo refused");
        return makeTextResult("echo: " + text);
    }

  private:
    EchoRecord& _record;
};

/// @brief Holds a tool execution until the test opens it.
struct Gate
{
    std::atomic<bool> entered = false;
    std::atomic<bool> left = false;
    std::binary_semaphore open { 0 };
};

/// @brief Tool "wait": blocks on a Gate and ignores cancellation.
class WaitTool: public Tool
{
  public:
    explicit WaitTool(Gate& gate): _gate(gate) {}

    auto name() const -> std::string_view override { return "wait"; }
    auto description() const -> std::string_view override { return "Wait for the gate"; }
    auto inputSchema() const -> nlohmann::json override { return { { "type", "object" } }; }
    auto execute(const nlohmann::json&, std::stop_token) -> Result<ToolResultBlock> override
    {
        _gate.entered = true;
        _gate.open.acquire();
        _gate.left = true;
        return makeTextResult("waited");
    }

  private:
    Gate& _gate;
};

/// @brief An orchestrator over a scripted model and a registry holding "echo" and "wait".
struct Harness
{
    EchoRecord echo;
    std::atomic<int>& toolCalls = echo.calls;
    Gate gate;
    ConversationStore store;
    ScriptedModel model;
    ToolRegistry registry;
    McpClientManager servers { [](const McpServer&) -> std::unique_ptr<Transport> { return nullptr; } };
    ToolDispatcher dispatcher { registry, servers };
    std::unique_ptr<Orchestrator> orchestrator;

    std::vector<OrchestratorState> states;
    std::vector<std::string> notices;
    std::vector<std::string> tokens;
    std::vector<TurnOutcome> outcomes;
    std::vector<std::string> confirmationIds;
    int confirmationsRequested = 0;

    explicit Harness(OrchestratorConfig config = {})
    {
        registry.registerTool(std::make_unique<EchoTool>(echo));
        registry.registerTool(std::make_unique<WaitTool>(gate));
        orchestrator = std::make_unique<Orchestrator>(store, model, dispatcher, config);
        orchestrator->setListener(OrchestratorListener {
            .onStateChanged = [this](OrchestratorState state) { states.push_back(state); },
            .onMessageAppended = {},
            .onConfirmationRequested =
                [this](const PendingConfirmation& pending) {
                    ++confirmationsRequested;
                    confirmationIds.push_back(pending.toolCall.id);
                },
            .onToken = [this](std::string_view token) { tokens.emplace_back(token); },
            .onNotice = [this](std::string_view text) { notices.emplace_back(text); },
            .onTurnFinished = [this](const TurnOutcome& outcome) { outcomes.push_back(outcome); },
        });
    }

    ~Harness()
    {
        if (gate.entered && !gate.left)
            gate.open.release();
        orchestrator.reset();
    }

    /// @brief Pumps until @p done holds or a generous deadline passes.
    template <typename Predicate>
    auto pumpUntil(Predicate done) -> bool
    {
        auto const deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (!done())
        {
            if (std::chrono::steady_clock::now() > deadline)
                return false;
            orchestrator->pump(std::chrono::milliseconds(10));
        }
        return true;
    }

    auto settle() -> bool
    {
        return pumpUntil([this] { return !orchestrator->busy() || orchestrator->pending(); });
    }

    auto requestCount() -> size_t { return model.requests().size(); }
};

auto toolResultOf(const Message& message) -> const ToolResultBlock&
{
    auto const* result = findToolResult(message);
    REQUIRE(result != nullptr);
    return *result;
}

} // namespace

TEST_CASE("Orchestrator answers a plain prompt", "[orchestrator]")
{
    auto h = Harness {};
    h.model.push(reply("Hello there"));

    CHECK(h.orchestrator->submit("hi") == SubmitStatus::Started);
    CHECK(h.orchestrator->state() == OrchestratorState::AwaitingModel);
    REQUIRE(h.settle());

    CHECK(h.orchestrator->state() == OrchestratorState::Idle);
    REQUIRE(h.store.size() == 2);
    CHECK(h.store.at(0).role == Role::User);
    CHECK(h.store.at(1).role == Role::Assistant);
    CHECK(textOf(h.store.at(1)) == "Hello there");

    REQUIRE(h.outcomes.size() == 1);
    CHECK(h.outcomes[0].status == TurnStatus::Completed);
    CHECK(h.outcomes[0].text == "Hello there");
    CHECK(h.tokens == std::vector<std::string> { "Hello there" });

    auto const requests = h.model.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].toolNames == std::vector<std::string> { "echo", "wait" });
}

TEST_CASE("Orchestrator ignores blank input", "[orchestrator]")
{
    auto h = Harness {};
    CHECK(h.orchestrator->submit("   \n") == SubmitStatus::Ignored);
    CHECK(h.store.empty());
    CHECK(!h.orchestrator->busy());
}

TEST_CASE("Orchestrator runs a confirmed tool call and resubmits", "[orchestrator]")
{
    auto h = Harness {};
    h.model.push(callTool("echo", { { "text", "ping" } }));
    h.model.push(reply("The tool said ping."));

    h.orchestrator->submit("echo ping");
    REQUIRE(h.settle());

    REQUIRE(h.orchestrator->pending() != nullptr);
    CHECK(h.orchestrator->state() == OrchestratorState::AwaitingConfirmation);
    CHECK(h.orchestrator->pending()->toolCall.toolName == "echo");
    CHECK(h.confirmationsRequested == 1);
    CHECK(h.toolCalls.load() == 0);

    REQUIRE(h.orchestrator->confirm().has_value());
    CHECK(h.orchestrator->state() == OrchestratorState::ExecutingTool);
    REQUIRE(h.pumpUntil([&] { return !h.orchestrator->busy(); }));

    CHECK(h.toolCalls.load() == 1);
    REQUIRE(h.store.size() == 3);
    CHECK(h.store.at(1).role == Role::Tool);
    auto const& result = toolResultOf(h.store.at(1));
    CHECK(result.callId == "call_echo");
    CHECK(!result.isError);
    CHECK(textOf(result) == "echo: ping");
    CHECK(textOf(h.store.at(2)) == "The tool said ping.");

    auto const requests = h.model.requests();
    REQUIRE(requests.size() == 2);
    REQUIRE(requests[1].history.size() == 2);
    CHECK(requests[1].history[1].role == Role::Tool);
}

TEST_CASE("Orchestrator tells the model about a declined tool call", "[orchestrator]")
{
    auto h = Harness {};
    h.model.push(callTool("echo", { { "text", "rm -rf" } }));
    h.model.push(reply("Understood, I will not run it."));

    h.orchestrator->submit("do something risky");
    REQUIRE(h.settle());
    REQUIRE(h.orchestrator->decline().has_value());
    REQUIRE(h.pumpUntil([&] { return !h.orchestrator->busy(); }));

    CHECK(h.toolCalls.load() == 0);
    REQUIRE(h.store.size() == 3);
    auto const& result = toolResultOf(h.store.at(1));
    CHECK(result.isError);
    CHECK(textOf(result) == "execution declined by user");
    CHECK(h.outcomes.back().status == TurnStatus::Completed);
    CHECK(h.requestCount() == 2);
}

TEST_CASE("Orchestrator confirm and decline need a pending call", "[orchestrator]")
{
    auto h = Harness {};
    auto confirmed = h.orchestrator->confirm();
    REQUIRE(!confirmed.has_value());
    CHECK(confirmed.error().code == ErrorCode::InvalidRequest);

    auto declined = h.orchestrator->decline();
    REQUIRE(!declined.has_value());
    CHECK(declined.error().code == ErrorCode::InvalidRequest);
}

TEST_CASE("Orchestrator runs tools without asking in auto-confirm mode", "[orchestrator]")
{
    auto h = Harness { OrchestratorConfig { .autoConfirm = true } };
    h.model.push(callTool("echo", { { "text", "a" } }));
    h.model.push(reply("done"));

    h.orchestrator->submit("go");
    REQUIRE(h.pumpUntil([&] { return !h.orchestrator->busy(); }));

    CHECK(h.confirmationsRequested == 0);
    CHECK(h.toolCalls.load() == 1);
    CHECK(h.store.size() == 3);
    CHECK(std::ranges::find(h.states, OrchestratorState::AwaitingConfirmation) == h.states.end());
    CHECK(std::ranges::find(h.states, OrchestratorState::ExecutingTool) != h.states.end());
}

TEST_CASE("Orchestrator reports unknown tools to the model without confirmation", "[orchestrator]")
{
    auto h = Harness {};
    h.model.push(callTool("format_disk", nlohmann::json::object()));
    h.model.push(reply("Sorry, that tool does not exist."));

    h.orchestrator->submit("format my disk");
    REQUIRE(h.pumpUntil([&] { return !h.orchestrator->busy(); }));

    CHECK(h.confirmationsRequested == 0);
    REQUIRE(h.store.size() == 3);
    auto const& result = toolResultOf(h.store.at(1));
    CHECK(result.isError);
    CHECK(textOf(result) == "Unknown tool: format_disk");
}

TEST_CASE("Orchestrator records tool failures and continues", "[orchestrator]")
{
    auto h = Harness { OrchestratorConfig { .autoConfirm = true } };
    h.model.push(callTool("echo", { { "text", "fail" } }));
    h.model.push(reply("The tool failed."));

    h.orchestrator->submit("try it");
    REQUIRE(h.pumpUntil([&] { return !h.orchestrator->busy(); }));

    REQUIRE(h.store.size() == 3);
    auto const& result = toolResultOf(h.store.at(1));
    CHECK(result.isError);
    CHECK(textOf(result) == "echo refused");
    CHECK(h.outcomes.back().status == TurnStatus::Completed);
}

TEST_CASE("Orchestrator rejects invalid arguments as a tool error", "[orchestrator]")
{
    auto h = Harness { OrchestratorConfig { .autoConfirm = true } };
    h.model.push(callTool("echo", { { "text", 42 } }));
    h.model.push(reply("Let me fix that."));

    h.orchestrator->submit("echo a number");
    REQUIRE(h.pumpUntil([&] { return !h.orchestrator->busy(); }));

    CHECK(h.toolCalls.load() == 0);
    auto const& result = toolResultOf(h.store.at(1));
    CHECK(result.isError);
    CHECK(textOf(result).starts_with("'text' must be of type"));
}

TEST_CASE("Orchestrator cancels a model request in flight", "[orchestrator]")
{
    auto h = Harness {};
    h.model.push(BlockUntilCancelled {});

    h.orchestrator->submit("think hard");
    REQUIRE(h.pumpUntil([&] { return h.requestCount() == 1; }));

    CHECK(h.orchestrator->cancel());
    CHECK(!h.orchestrator->busy());
    CHECK(h.orchestrator->state() == OrchestratorState::Idle);
    CHECK(std::ranges::find(h.states, OrchestratorState::Cancelled) != h.states.end());
    REQUIRE(h.outcomes.size() == 1);
    CHECK(h.outcomes[0].status == TurnStatus::Cancelled);

    // The cancelled request's reply arrives late and is discarded.
    h.orchestrator->pump(std::chrono::milliseconds(100));
    CHECK(h.store.size() == 1);
    CHECK(h.outcomes.size() == 1);

    // Idempotent
    CHECK(!h.orchestrator->cancel());
}

TEST_CASE("Orchestrator cancels a pending confirmation", "[orchestrator]")
{
    auto h = Harness {};
    h.model.push(callTool("echo", { { "text", "x" } }));

    h.orchestrator->submit("echo x");
    REQUIRE(h.settle());
    REQUIRE(h.orchestrator->pending() != nullptr);

    CHECK(h.orchestrator->cancel());
    CHECK(h.orchestrator->pending() == nullptr);
    CHECK(h.orchestrator->state() == OrchestratorState::Idle);
    CHECK(h.toolCalls.load() == 0);
    CHECK(!h.orchestrator->confirm().has_value());
}

TEST_CASE("Orchestrator queues input while busy and submits it after the turn", "[orchestrator]")
{
    auto h = Harness {};
    h.model.push(BlockUntilCancelled {});
    h.model.push(reply("answered both"));

    CHECK(h.orchestrator->submit("first") == SubmitStatus::Started);
    CHECK(h.orchestrator->submit("second") == SubmitStatus::Queued);
    CHECK(h.orchestrator->submit("third") == SubmitStatus::Queued);
    CHECK(h.orchestrator->queuedCount() == 2);

    REQUIRE(h.pumpUntil([&] { return h.requestCount() == 1; }));
    CHECK(h.orchestrator->cancel());

    // The queued input starts the next turn right away.
    CHECK(h.orchestrator->busy());
    CHECK(h.orchestrator->queuedCount() == 0);
    REQUIRE(h.pumpUntil([&] { return !h.orchestrator->busy(); }));

    REQUIRE(h.store.size() == 3);
    CHECK(textOf(h.store.at(1)) == "second\n\nthird");
    CHECK(textOf(h.store.at(2)) == "answered both");
}

TEST_CASE("Orchestrator clearConversation drops history and queued input", "[orchestrator]")
{
    auto h = Harness {};
    h.model.push(callTool("echo", { { "text", "x" } }));

    h.orchestrator->submit("echo x");
    h.orchestrator->submit("queued");
    REQUIRE(h.settle());
    auto const generation = h.store.generation();

    h.orchestrator->clearConversation();

    CHECK(h.store.empty());
    CHECK(h.store.generation() == generation + 1);
    CHECK(!h.orchestrator->busy());
    CHECK(h.orchestrator->queuedCount() == 0);
    CHECK(h.orchestrator->pending() == nullptr);
}

TEST_CASE("Orchestrator forces a final answer at the tool step limit", "[orchestrator]")
{
    auto h = Harness { OrchestratorConfig { .autoConfirm = true, .maxToolSteps = 1 } };
    h.model.push(callTool("echo", { { "text", "1" } }));
    h.model.push(callTool("echo", { { "text", "2" } }));
    h.model.push(reply("final answer"));

    h.orchestrator->submit("loop");
    REQUIRE(h.pumpUntil([&] { return !h.orchestrator->busy(); }));

    CHECK(h.toolCalls.load() == 1);
    REQUIRE(h.notices.size() == 1);
    CHECK(h.notices[0] == "Tool step limit (1) reached; asking the model for a final answer");

    auto const requests = h.model.requests();
    REQUIRE(requests.size() == 3);
    CHECK(requests[2].toolNames.empty());
    CHECK(textOf(h.store.at(h.store.size() - 1)) == "final answer");
    CHECK(h.outcomes.back().status == TurnStatus::Completed);
}

TEST_CASE("Orchestrator retries transient model failures when configured", "[orchestrator]")
{
    auto h = Harness { OrchestratorConfig { .maxRetries = 1 } };
    h.model.push(failWith(ErrorCode::Unreachable, "connection refused"));
    h.model.push(reply("back online"));

    h.orchestrator->submit("hello");
    REQUIRE(h.pumpUntil([&] { return !h.orchestrator->busy(); }));

    REQUIRE(h.notices.size() == 1);
    CHECK(h.notices[0] == "Model request failed: connection refused. Retrying (1/1)");
    CHECK(h.outcomes.back().status == TurnStatus::Completed);
    CHECK(textOf(h.store.at(1)) == "back online");
}

TEST_CASE("Orchestrator fails the turn when the model cannot be reached", "[orchestrator]")
{
    auto h = Harness {};
    h.model.push(failWith(ErrorCode::Unreachable, "Ollama request failed"));

    h.orchestrator->submit("hello");
    REQUIRE(h.pumpUntil([&] { return !h.orchestrator->busy(); }));

    REQUIRE(h.outcomes.size() == 1);
    CHECK(h.outcomes[0].status == TurnStatus::Failed);
    REQUIRE(h.outcomes[0].error.has_value());
    CHECK(h.outcomes[0].error->code == ErrorCode::Unreachable);
    CHECK(std::ranges::find(h.states, OrchestratorState::Failed) != h.states.end());
    CHECK(h.orchestrator->state() == OrchestratorState::Idle);
    CHECK(h.store.size() == 1);

    // The conversation stays usable.
    h.model.push(reply("ok now"));
    h.orchestrator->submit("again");
    REQUIRE(h.pumpUntil([&] { return !h.orchestrator->busy(); }));
    CHECK(h.outcomes.back().status == TurnStatus::Completed);
}

TEST_CASE("Orchestrator keeps the text that accompanied tool calls", "[orchestrator]")
{
    auto h = Harness { OrchestratorConfig { .autoConfirm = true } };
    h.model.push(callTool("echo", { { "text", "hi" } }, "Let me check."));
    h.model.push(reply("Checked."));

    h.orchestrator->submit("check");
    REQUIRE(h.pumpUntil([&] { return !h.orchestrator->busy(); }));

    REQUIRE(h.store.size() == 3);
    auto const& toolMessage = h.store.at(1);
    REQUIRE(toolMessage.content.size() == 3);
    REQUIRE(std::holds_alternative<TextBlock>(toolMessage.content[0]));
    CHECK(std::get<TextBlock>(toolMessage.content[0]).text == "Let me check.");
    CHECK(std::holds_alternative<ToolCallBlock>(toolMessage.content[1]));
}

TEST_CASE("Orchestrator gates a batch of tool calls one by one in emission order", "[orchestrator]")
{
    auto h = Harness {};
    h.model.push(callTools({ echoCall("a"), echoCall("b"), echoCall("c") }));
    h.model.push(reply("Ran a and c."));

    h.orchestrator->submit("three things");
    REQUIRE(h.settle());
    REQUIRE(h.orchestrator->pending() != nullptr);
    CHECK(h.orchestrator->pending()->toolCall.id == "call_a");
    REQUIRE(h.orchestrator->confirm().has_value());

    REQUIRE(h.pumpUntil([&] { return h.orchestrator->pending() != nullptr; }));
    CHECK(h.orchestrator->pending()->toolCall.id == "call_b");
    CHECK(h.echo.echoed() == std::vector<std::string> { "a" });

    // Declining b moves straight on to c; the batch is not abandoned.
    REQUIRE(h.orchestrator->decline().has_value());
    REQUIRE(h.orchestrator->pending() != nullptr);
    CHECK(h.orchestrator->pending()->toolCall.id == "call_c");
    CHECK(h.requestCount() == 1);

    REQUIRE(h.orchestrator->confirm().has_value());
    REQUIRE(h.pumpUntil([&] { return !h.orchestrator->busy(); }));

    CHECK(h.confirmationIds == std::vector<std::string> { "call_a", "call_b", "call_c" });
    CHECK(h.echo.echoed() == std::vector<std::string> { "a", "c" });
    CHECK(h.echo.maxRunning.load() == 1);

    REQUIRE(h.store.size() == 5);
    CHECK(toolResultOf(h.store.at(1)).callId == "call_a");
    CHECK(!toolResultOf(h.store.at(1)).isError);
    CHECK(toolResultOf(h.store.at(2)).callId == "call_b");
    CHECK(toolResultOf(h.store.at(2)).isError);
    CHECK(textOf(toolResultOf(h.store.at(2))) == "execution declined by user");
    CHECK(toolResultOf(h.store.at(3)).callId == "call_c");
    CHECK(textOf(h.store.at(4)) == "Ran a and c.");

    // The model is asked again once, after the whole batch.
    auto const requests = h.model.requests();
    REQUIRE(requests.size() == 2);
    CHECK(requests[1].history.size() == 4);
}

TEST_CASE("Orchestrator discards a successful reply that arrives after cancel", "[orchestrator]")
{
    auto h = Harness {};
    h.model.push(ReplyAfterCancel { "too late" });

    h.orchestrator->submit("slow question");
    REQUIRE(h.pumpUntil([&] { return h.requestCount() == 1; }));
    REQUIRE(h.orchestrator->cancel());

    REQUIRE(h.pumpUntil([&] { return h.model.finished() == 1; }));
    h.orchestrator->pump(std::chrono::milliseconds(100));

    CHECK(h.store.size() == 1);
    CHECK(h.tokens.empty());
    REQUIRE(h.outcomes.size() == 1);
    CHECK(h.outcomes[0].status == TurnStatus::Cancelled);
    CHECK(h.orchestrator->state() == OrchestratorState::Idle);
}

TEST_CASE("Orchestrator discards a tool result that arrives after cancel", "[orchestrator]")
{
    auto h = Harness { OrchestratorConfig { .autoConfirm = true } };
    h.model.push(callTool("wait", nlohmann::json::object()));
    h.model.push(reply("should never be asked"));

    h.orchestrator->submit("wait for it");
    REQUIRE(h.pumpUntil([&] { return h.gate.entered.load(); }));
    CHECK(h.orchestrator->state() == OrchestratorState::ExecutingTool);

    REQUIRE(h.orchestrator->cancel());
    REQUIRE(h.outcomes.size() == 1);
    CHECK(h.outcomes[0].status == TurnStatus::Cancelled);

    // The tool runs to completion; its result is dropped.
    h.gate.open.release();
    REQUIRE(h.pumpUntil([&] { return h.gate.left.load(); }));
    h.orchestrator->pump(std::chrono::milliseconds(100));

    CHECK(h.store.size() == 1);
    CHECK(h.outcomes.size() == 1);
    CHECK(h.requestCount() == 1);
    CHECK(!h.orchestrator->busy());
}

TEST_CASE("Orchestrator gives a final text when the forced answer holds only tool calls", "[orchestrator]")
{
    auto h = Harness { OrchestratorConfig { .autoConfirm = true, .maxToolSteps = 1 } };
    h.model.push(callTool("echo", { { "text", "1" } }));
    h.model.push(callTool("echo", { { "text", "2" } }));
    h.model.push(callTool("echo", { { "text", "3" } }));

    h.orchestrator->submit("loop forever");
    REQUIRE(h.pumpUntil([&] { return !h.orchestrator->busy(); }));

    CHECK(h.toolCalls.load() == 1);
    auto const& last = h.store.at(h.store.size() - 1);
    CHECK(last.role == Role::Assistant);
    CHECK(textOf(last) == "Stopped after 1 tool call(s): the tool step limit was reached before the model gave a "
                          "final answer.");
    REQUIRE(h.outcomes.size() == 1);
    CHECK(h.outcomes[0].status == TurnStatus::Completed);
    CHECK(h.outcomes[0].text == textOf(last));
}
