// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/ConversationStore.hpp>
#include <agent/ToolCatalog.hpp>
#include <core/Cancellation.hpp>
#include <core/Channel.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <llm/ModelClient.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

namespace rigchat
{

/// @brief States of the tool-call state machine.
enum class OrchestratorState
{
    Idle,
    AwaitingModel,
    AwaitingConfirmation,
    ExecutingTool,
    Cancelled,
    Failed,
};

[[nodiscard]] constexpr auto stateName(OrchestratorState state) -> std::string_view
{
    switch (state)
    {
        case OrchestratorState::Idle: return "idle";
        case OrchestratorState::AwaitingModel: return "awaiting-model";
        case OrchestratorState::AwaitingConfirmation: return "awaiting-confirmation";
        case OrchestratorState::ExecutingTool: return "executing-tool";
        case OrchestratorState::Cancelled: return "cancelled";
        case OrchestratorState::Failed: return "failed";
    }
    return "unknown";
}

/// @brief A tool call blocked on the user's decision.
struct PendingConfirmation
{
    ToolCall toolCall;
    ToolDescriptor tool;
    std::chrono::system_clock::time_point createdAt = std::chrono::system_clock::now();
    uint64_t generation = 0; ///< ConversationStore generation the call belongs to.
};

enum class TurnStatus
{
    Completed,
    Cancelled,
    Failed,
};

/// @brief How a turn ended. Reported exactly once per turn.
struct TurnOutcome
{
    TurnStatus status = TurnStatus::Completed;
    std::string text;
    std::optional<Error> error;
};

enum class SubmitStatus
{
    Started,
    Queued,
    Ignored,
};

struct OrchestratorConfig
{
    bool autoConfirm = false;
    int maxToolSteps = 10;
    int maxRetries = 0;
};

/// @brief Observers of the orchestrator. All run on the thread calling pump().
struct OrchestratorListener
{
    std::function<void(OrchestratorState)> onStateChanged;
    std::function<void(const Message&)> onMessageAppended;
    std::function<void(const PendingConfirmation&)> onConfirmationRequested;
    std::function<void(std::string_view)> onToken;
    std::function<void(std::string_view)> onNotice;
    std::function<void(const TurnOutcome&)> onTurnFinished;
};

/// @brief Drives one conversation turn: model request, confirmation, tool execution, resubmission.
///
/// The orchestrator is owned by a single control loop which calls pump() to
/// receive completions. Model requests and tool executions run as background
/// tasks, at most one per turn; they report through a channel and never touch
/// the ConversationStore. Every task event carries the turn and request it
/// belongs to; events of a cancelled request are discarded, so a late reply is
/// never appended.
class Orchestrator
{
  public:
    Orchestrator(ConversationStore& store,
                 ModelClient& model,
                 ToolDispatcher& dispatcher,
                 OrchestratorConfig config = {});
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    void setListener(OrchestratorListener listener);

    /// @brief Starts a turn with @p text, or queues it while a turn is in flight.
    auto submit(std::string text) -> SubmitStatus;

    /// @brief Approves the pending tool call.
    /// @return ErrorCode::InvalidRequest if nothing is pending or the pending call is stale.
    auto confirm() -> VoidResult;

    /// @brief Rejects the pending tool call. The model is told and the turn continues.
    auto decline() -> VoidResult;

    /// @brief Cancels the turn in flight. Idempotent.
    /// @return True if a turn was cancelled.
    auto cancel() -> bool;

    /// @brief Cancels any turn, drops queued input and empties the conversation.
    void clearConversation();

    /// @brief Waits up to @p timeout for task events and processes them.
    /// @return The number of events processed.
    auto pump(std::chrono::milliseconds timeout) -> size_t;

    [[nodiscard]] auto state() const noexcept -> OrchestratorState { return _state; }
    [[nodiscard]] auto busy() const noexcept -> bool { return _turnOpen; }
    [[nodiscard]] auto pending() const -> const PendingConfirmation*;
    [[nodiscard]] auto queuedCount() const noexcept -> size_t { return _queue.size(); }

    [[nodiscard]] auto autoConfirm() const noexcept -> bool { return _config.autoConfirm; }
    void setAutoConfirm(bool enabled);

    [[nodiscard]] auto config() const noexcept -> const OrchestratorConfig& { return _config; }

    /// @brief Returns the catalog presented to the model in the current turn.
    [[nodiscard]] auto catalog() const noexcept -> const ToolCatalog& { return _catalog; }

  private:
    struct ModelReply
    {
        uint64_t turnId;
        uint64_t requestId;
        Result<ModelTurn> result;
        ToolCatalog catalog;
    };

    struct ToolFinished
    {
        uint64_t turnId;
        uint64_t requestId;
        Result<ToolResultBlock> result;
    };

    struct TokenReceived
    {
        uint64_t turnId;
        uint64_t requestId;
        std::string text;
    };

    using Event = std::variant<ModelReply, ToolFinished, TokenReceived>;

    struct Task
    {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void startTurn(std::string text);
    void requestModel();
    void processNextCall();
    void execute(ToolCall call, const ToolDescriptor& tool);
    void recordToolActivity(const ToolCall& call, ToolResultBlock result);
    void finishTurn(TurnStatus status, std::string text, std::optional<Error> error = std::nullopt);

    void handle(ModelReply& reply);
    void handle(ToolFinished& finished);
    void handle(TokenReceived& token);
    [[nodiscard]] auto isCurrent(uint64_t turnId, uint64_t requestId) const -> bool;

    template <typename Fn>
    void spawn(Fn work);
    void retireActiveTask();
    void reapTasks();

    void appendMessage(Message message);
    void setState(OrchestratorState state);
    void notice(std::string_view text);

    ConversationStore& _store;
    ModelClient& _model;
    ToolDispatcher& _dispatcher;
    OrchestratorConfig _config;
    OrchestratorListener _listener;

    OrchestratorState _state = OrchestratorState::Idle;
    bool _turnOpen = false;
    uint64_t _turnId = 0;
    uint64_t _nextRequestId = 1;
    uint64_t _activeRequestId = 0;

    ToolCatalog _catalog;
    std::deque<ToolCall> _batch;
    std::string _batchText;
    std::optional<ToolCall> _executing;
    std::optional<PendingConfirmation> _pending;
    int _stepsTaken = 0;
    int _retries = 0;
    bool _forceFinal = false;

    std::deque<std::string> _queue;

    CancellationController _cancellation;
    Channel<Event> _events;
    std::optional<Task> _active;
    std::vector<Task> _retired;
};

} // namespace rigchat
