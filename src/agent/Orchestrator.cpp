// SPDX-License-Identifier: Apache-2.0
#include "Orchestrator.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <iterator>
#include <utility>

namespace rigchat
{

namespace
{
    auto isBlank(std::string_view text) -> bool
    {
        return std::ranges::all_of(text, [](unsigned char c) { return std::isspace(c) != 0; });
    }

    constexpr auto DeclinedText = std::string_view { "execution declined by user" };
} // namespace

// {{{ tasks

template <typename Fn>
void Orchestrator::spawn(Fn work)
{
    retireActiveTask();
    reapTasks();

    auto stopToken = _cancellation.begin();
    auto done = std::make_shared<std::atomic<bool>>(false);
    auto thread = std::jthread([work = std::move(work), stopToken, done]() mutable {
        work(stopToken);
        done->store(true);
    });
    _active = Task { .thread = std::move(thread), .done = std::move(done) };
}

void Orchestrator::retireActiveTask()
{
    if (!_active)
        return;
    _retired.push_back(std::move(*_active));
    _active.reset();
}

void Orchestrator::reapTasks()
{
    // A finished task's thread is about to return; joining it does not block.
    std::erase_if(_retired, [](const Task& task) { return task.done->load(); });
}

// }}}

Orchestrator::Orchestrator(ConversationStore& store,
                           ModelClient& model,
                           ToolDispatcher& dispatcher,
                           OrchestratorConfig config):
    _store(store), _model(model), _dispatcher(dispatcher), _config(config)
{
}

Orchestrator::~Orchestrator()
{
    // Tasks reference members; they are joined before anything is torn down.
    _cancellation.cancel();
    _active.reset();
    _retired.clear();
}

void Orchestrator::setListener(OrchestratorListener listener)
{
    _listener = std::move(listener);
}

auto Orchestrator::submit(std::string text) -> SubmitStatus
{
    if (isBlank(text))
        return SubmitStatus::Ignored;

    if (_turnOpen)
    {
        _queue.push_back(std::move(text));
        log::debug("Queued input while busy ({} queued)", _queue.size());
        return SubmitStatus::Queued;
    }

    startTurn(std::move(text));
    return SubmitStatus::Started;
}

auto Orchestrator::confirm() -> VoidResult
{
    if (!_pending)
        return makeError(ErrorCode::InvalidRequest, "No tool call is awaiting confirmation");

    auto pending = std::move(*_pending);
    _pending.reset();

    if (pending.generation != _store.generation())
    {
        cancel();
        return makeError(ErrorCode::InvalidRequest, "The pending tool call belongs to a cleared conversation");
    }

    execute(std::move(pending.toolCall), pending.tool);
    return {};
}

auto Orchestrator::decline() -> VoidResult
{
    if (!_pending)
        return makeError(ErrorCode::InvalidRequest, "No tool call is awaiting confirmation");

    auto pending = std::move(*_pending);
    _pending.reset();

    if (pending.generation != _store.generation())
    {
        cancel();
        return makeError(ErrorCode::InvalidRequest, "The pending tool call belongs to a cleared conversation");
    }

    log::info("User declined tool call '{}' ({})", pending.toolCall.toolName, pending.toolCall.id);
    recordToolActivity(pending.toolCall, makeTextResult(std::string(DeclinedText), true));
    processNextCall();
    return {};
}

auto Orchestrator::cancel() -> bool
{
    if (!_turnOpen)
        return false;

    log::info("Cancelling turn {} in state {}", _turnId, stateName(_state));
    _cancellation.cancel();
    retireActiveTask();
    _activeRequestId = 0;
    _pending.reset();
    _executing.reset();
    _batch.clear();

    finishTurn(TurnStatus::Cancelled, {});
    return true;
}

void Orchestrator::clearConversation()
{
    _queue.clear();
    cancel();
    _pending.reset();
    _store.clear();
    log::info("Conversation cleared");
}

auto Orchestrator::pump(std::chrono::milliseconds timeout) -> size_t
{
    reapTasks();

    auto events = _events.drain(timeout);
    for (auto& event: events)
        std::visit([this](auto& e) { handle(e); }, event);

    reapTasks();
    return events.size();
}

auto Orchestrator::pending() const -> const PendingConfirmation*
{
    return _pending ? &*_pending : nullptr;
}

void Orchestrator::setAutoConfirm(bool enabled)
{
    _config.autoConfirm = enabled;
    log::info("Auto-confirm {}", enabled ? "enabled" : "disabled");
}

// {{{ turn flow

void Orchestrator::startTurn(std::string text)
{
    ++_turnId;
    _turnOpen = true;
    _catalog = ToolCatalog {};
    _batch.clear();
    _batchText.clear();
    _executing.reset();
    _pending.reset();
    _stepsTaken = 0;
    _retries = 0;
    _forceFinal = false;

    log::debug("Starting turn {}", _turnId);
    appendMessage(makeTextMessage(Role::User, std::move(text)));
    requestModel();
}

void Orchestrator::requestModel()
{
    setState(OrchestratorState::AwaitingModel);

    auto const turnId = _turnId;
    auto const requestId = _nextRequestId++;
    _activeRequestId = requestId;

    spawn([this, turnId, requestId, history = _store.snapshot(), forceFinal = _forceFinal](
              std::stop_token stopToken) {
        auto catalog = forceFinal ? ToolCatalog {} : _dispatcher.buildCatalog(stopToken);
        auto result = _model.send(*history, catalog.tools(), stopToken, [&](std::string_view token) {
            _events.post(TokenReceived { turnId, requestId, std::string(token) });
        });
        _events.post(ModelReply { turnId, requestId, std::move(result), std::move(catalog) });
    });
}

void Orchestrator::processNextCall()
{
    while (!_batch.empty())
    {
        if (_stepsTaken >= _config.maxToolSteps)
        {
            log::warning("Reached max tool steps ({}), forcing final response", _config.maxToolSteps);
            notice(std::format("Tool step limit ({}) reached; asking the model for a final answer",
                               _config.maxToolSteps));
            _batch.clear();
            _forceFinal = true;
            break;
        }

        auto call = std::move(_batch.front());
        _batch.pop_front();

        auto const* tool = _catalog.resolve(call.toolName);
        if (!tool)
        {
            log::warning("Model requested unknown tool '{}'", call.toolName);
            recordToolActivity(call, makeTextResult(std::format("Unknown tool: {}", call.toolName), true));
            continue;
        }

        if (_config.autoConfirm)
        {
            execute(std::move(call), *tool);
            return;
        }

        _pending = PendingConfirmation {
            .toolCall = std::move(call),
            .tool = *tool,
            .createdAt = std::chrono::system_clock::now(),
            .generation = _store.generation(),
        };
        setState(OrchestratorState::AwaitingConfirmation);
        if (_listener.onConfirmationRequested)
            _listener.onConfirmationRequested(*_pending);
        return;
    }

    requestModel();
}

void Orchestrator::execute(ToolCall call, const ToolDescriptor& tool)
{
    ++_stepsTaken;
    setState(OrchestratorState::ExecutingTool);
    log::info("Executing tool: {} (id: {})", call.toolName, call.id);

    auto const turnId = _turnId;
    auto const requestId = _nextRequestId++;
    _activeRequestId = requestId;

    spawn([this, turnId, requestId, tool, arguments = call.arguments](std::stop_token stopToken) {
        auto result = _dispatcher.invoke(tool, arguments, stopToken);
        _events.post(ToolFinished { turnId, requestId, std::move(result) });
    });
    _executing = std::move(call);
}

void Orchestrator::recordToolActivity(const ToolCall& call, ToolResultBlock result)
{
    result.callId = call.id;

    auto message = Message { .role = Role::Tool, .content = {} };
    if (!_batchText.empty())
        message.content.emplace_back(TextBlock { std::exchange(_batchText, {}) });
    message.content.emplace_back(call);
    message.content.emplace_back(std::move(result));
    appendMessage(std::move(message));
}

void Orchestrator::finishTurn(TurnStatus status, std::string text, std::optional<Error> error)
{
    if (!_turnOpen)
        return;

    _turnOpen = false;
    _cancellation.finish();
    _activeRequestId = 0;
    _batch.clear();
    _batchText.clear();
    _executing.reset();
    _pending.reset();

    if (status == TurnStatus::Failed)
        setState(OrchestratorState::Failed);
    else if (status == TurnStatus::Cancelled)
        setState(OrchestratorState::Cancelled);
    setState(OrchestratorState::Idle);

    log::debug("Turn {} finished", _turnId);
    if (_listener.onTurnFinished)
        _listener.onTurnFinished(TurnOutcome { .status = status, .text = std::move(text), .error = std::move(error) });

    if (!_turnOpen && !_queue.empty())
    {
        auto combined = std::string {};
        for (auto& queued: _queue)
        {
            if (!combined.empty())
                combined += "\n\n";
            combined += queued;
        }
        _queue.clear();
        log::debug("Submitting queued input");
        startTurn(std::move(combined));
    }
}

// }}}

// {{{ task events

auto Orchestrator::isCurrent(uint64_t turnId, uint64_t requestId) const -> bool
{
    return _turnOpen && turnId == _turnId && requestId == _activeRequestId;
}

void Orchestrator::handle(ModelReply& reply)
{
    if (!isCurrent(reply.turnId, reply.requestId))
    {
        log::debug("Discarding late model reply (turn {}, request {})", reply.turnId, reply.requestId);
        return;
    }

    retireActiveTask();
    _activeRequestId = 0;
    _cancellation.finish();

    if (!reply.result)
    {
        auto const& error = reply.result.error();
        if (error.code == ErrorCode::Cancelled)
        {
            finishTurn(TurnStatus::Cancelled, {});
            return;
        }
        if (isTransient(error.code) && _retries < _config.maxRetries)
        {
            ++_retries;
            log::warning("Model request failed: {}", error);
            notice(std::format("Model request failed: {}. Retrying ({}/{})",
                               error.message,
                               _retries,
                               _config.maxRetries));
            requestModel();
            return;
        }
        log::error("Model request failed: {}", error);
        finishTurn(TurnStatus::Failed, error.message, error);
        return;
    }

    _catalog = std::move(reply.catalog);
    auto& turn = *reply.result;

    if (!turn.hasToolCalls() || _forceFinal)
    {
        if (turn.hasToolCalls())
            log::warning("Model requested tools after the step limit; treating reply as final");
        auto text = std::move(turn.text);
        if (_forceFinal && isBlank(text))
            text = std::format("Stopped after {} tool call(s): the tool step limit was reached before the model "
                               "gave a final answer.",
                               _stepsTaken);
        appendMessage(makeTextMessage(Role::Assistant, text));
        finishTurn(TurnStatus::Completed, std::move(text));
        return;
    }

    log::info("LLM requested {} tool call(s)", turn.toolCalls.size());
    _batch.assign(std::make_move_iterator(turn.toolCalls.begin()), std::make_move_iterator(turn.toolCalls.end()));
    _batchText = std::move(turn.text);
    processNextCall();
}

void Orchestrator::handle(ToolFinished& finished)
{
    if (!isCurrent(finished.turnId, finished.requestId) || !_executing)
    {
        log::debug("Discarding late tool result (turn {}, request {})", finished.turnId, finished.requestId);
        return;
    }

    retireActiveTask();
    _activeRequestId = 0;
    _cancellation.finish();

    auto call = std::move(*_executing);
    _executing.reset();

    if (!finished.result)
    {
        auto const& error = finished.result.error();
        if (error.code == ErrorCode::Cancelled)
        {
            finishTurn(TurnStatus::Cancelled, {});
            return;
        }
        log::error("Tool call '{}' failed: {}", call.toolName, error);
        recordToolActivity(call, makeTextResult(error.message, true));
    }
    else
    {
        recordToolActivity(call, std::move(*finished.result));
    }

    processNextCall();
}

void Orchestrator::handle(TokenReceived& token)
{
    if (!isCurrent(token.turnId, token.requestId))
        return;
    if (_listener.onToken)
        _listener.onToken(token.text);
}

// }}}

void Orchestrator::appendMessage(Message message)
{
    _store.append(std::move(message));
    if (_listener.onMessageAppended)
        _listener.onMessageAppended(_store.at(_store.size() - 1));
}

void Orchestrator::setState(OrchestratorState state)
{
    if (_state == state)
        return;
    log::trace("Orchestrator state: {} -> {}", stateName(_state), stateName(state));
    _state = state;
    if (_listener.onStateChanged)
        _listener.onStateChanged(state);
}

void Orchestrator::notice(std::string_view text)
{
    if (_listener.onNotice)
        _listener.onNotice(text);
}

} // namespace rigchat
