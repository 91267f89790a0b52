// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <llm/ModelClient.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rigchat::ollama
{

constexpr auto DefaultHost = std::string_view { "http://localhost:11434" };
constexpr auto DefaultModel = std::string_view { "qwen2.5-coder:3b" };

/// @brief The system prompt used when the configuration does not provide one.
[[nodiscard]] auto defaultSystemPrompt() -> std::string_view;

/// @brief Extends @p base with the names of the remote tools in @p tools, if any.
[[nodiscard]] auto buildSystemPrompt(std::string_view base, const std::vector<ToolDescriptor>& tools)
    -> std::string;

/// @brief Converts a descriptor into Ollama's function-tool schema.
[[nodiscard]] auto toolToJson(const ToolDescriptor& tool) -> nlohmann::json;

/// @brief Serializes the conversation into /api/chat messages.
///
/// The system prompt comes first. A Tool-role message expands into the
/// assistant message carrying its tool call followed by the tool message
/// carrying the result. Image blocks travel base64-encoded in "images".
[[nodiscard]] auto serializeMessages(const std::vector<Message>& history, std::string_view systemPrompt)
    -> nlohmann::json;

/// @brief Builds the complete /api/chat request body.
[[nodiscard]] auto buildChatRequest(std::string_view model,
                                    const std::vector<Message>& history,
                                    const std::vector<ToolDescriptor>& tools,
                                    std::string_view systemPrompt,
                                    bool stream = true) -> nlohmann::json;

/// @brief Tool calls found in plain assistant text, and the text left around them.
struct InlineToolCalls
{
    std::vector<ToolCall> calls;
    std::string remainingText;
};

/// @brief Detects tool calls a model printed as text instead of emitting them structurally.
///
/// Recognizes `<tool_call>{...}</tool_call>` tags, and a response consisting solely
/// of a JSON object `{"name": .., "arguments": {..}}` or an array of those,
/// optionally wrapped in a Markdown code fence. Only succeeds if every named
/// tool is in @p tools. Calls without an id are numbered `<idPrefix>_<n>`.
[[nodiscard]] auto detectInlineToolCalls(std::string_view text,
                                         const std::vector<ToolDescriptor>& tools,
                                         std::string_view idPrefix = "call") -> std::optional<InlineToolCalls>;

/// @brief Accumulates a streamed /api/chat response (newline-delimited JSON).
class StreamAccumulator
{
  public:
    /// @param onToken Receives each streamed content fragment.
    /// @param idPrefix Prefix of the ids given to tool calls that carry none (`<idPrefix>_<n>`).
    explicit StreamAccumulator(TokenCallback onToken = {}, std::string idPrefix = "call");

    /// @brief Consumes received bytes. Complete lines are parsed immediately.
    void feed(std::string_view bytes);

    /// @brief Processes any trailing partial line and returns the turn.
    /// @return The accumulated turn, or ErrorCode::ProtocolError if the endpoint
    ///         reported an error or sent nothing parseable.
    [[nodiscard]] auto finish() -> Result<ModelTurn>;

    [[nodiscard]] auto done() const noexcept -> bool { return _done; }

  private:
    void processLine(std::string_view line);

    TokenCallback _onToken;
    std::string _idPrefix;
    std::string _buffer;
    ModelTurn _turn;
    std::string _error;
    size_t _chunks = 0;
    bool _done = false;
};

} // namespace rigchat::ollama
