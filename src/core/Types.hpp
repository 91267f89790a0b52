// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rigchat
{

/// @brief The role of a message in the conversation.
enum class Role
{
    User,
    Assistant,
    Tool,
};

/// @brief Converts a Role enum to its string representation.
[[nodiscard]] constexpr auto roleToString(Role role) -> std::string_view
{
    switch (role)
    {
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "unknown";
}

/// @brief Plain text content.
struct TextBlock
{
    std::string text;
};

/// @brief Decoded image content.
struct ImageBlock
{
    std::string mimeType;
    std::vector<std::uint8_t> bytes;
};

/// @brief Content a tool result may carry.
using ResultContent = std::variant<TextBlock, ImageBlock>;

/// @brief A model-emitted request to invoke a named tool.
struct ToolCallBlock
{
    std::string id;
    std::string toolName;
    nlohmann::json arguments = nlohmann::json::object();
};

/// @brief The outcome of a tool call. callId references a prior ToolCallBlock::id.
struct ToolResultBlock
{
    std::string callId;
    std::vector<ResultContent> content;
    bool isError = false;
};

/// @brief One block of message content.
using ContentBlock = std::variant<TextBlock, ImageBlock, ToolCallBlock, ToolResultBlock>;

/// @brief A single message in the conversation.
struct Message
{
    Role role = Role::User;
    std::vector<ContentBlock> content;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/// @brief Alias used when a tool call travels outside a message.
using ToolCall = ToolCallBlock;

/// @brief Marks a tool implemented in-process.
struct LocalOrigin
{
    auto operator==(const LocalOrigin&) const -> bool = default;
};

/// @brief Marks a tool hosted on a remote MCP server.
struct RemoteOrigin
{
    std::string serverId;
    auto operator==(const RemoteOrigin&) const -> bool = default;
};

using ToolOrigin = std::variant<LocalOrigin, RemoteOrigin>;

/// @brief A tool as presented to the model.
///
/// `name` is unique within a merged catalog; `originalName` is the name the
/// owning registry or server knows it by.
struct ToolDescriptor
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema = nlohmann::json::object();
    ToolOrigin origin = LocalOrigin {};
    std::string originalName;

    [[nodiscard]] auto isRemote() const -> bool { return std::holds_alternative<RemoteOrigin>(origin); }
};

/// @brief The result of one model request: final text or tool calls.
struct ModelTurn
{
    std::string text;
    std::vector<ToolCall> toolCalls;

    /// @brief Returns true if this turn requests tool calls.
    [[nodiscard]] auto hasToolCalls() const -> bool { return !toolCalls.empty(); }
};

// {{{ construction helpers

[[nodiscard]] inline auto makeTextMessage(Role role, std::string text) -> Message
{
    auto message = Message { .role = role, .content = {} };
    message.content.emplace_back(TextBlock { std::move(text) });
    return message;
}

[[nodiscard]] inline auto makeTextResult(std::string text, bool isError = false) -> ToolResultBlock
{
    auto result = ToolResultBlock { .callId = {}, .content = {}, .isError = isError };
    result.content.emplace_back(TextBlock { std::move(text) });
    return result;
}

/// @brief Concatenates every text block of a message, separated by newlines.
[[nodiscard]] inline auto textOf(const Message& message) -> std::string
{
    auto text = std::string {};
    for (const auto& block: message.content)
    {
        if (auto const* t = std::get_if<TextBlock>(&block))
        {
            if (!text.empty())
                text += '\n';
            text += t->text;
        }
    }
    return text;
}

/// @brief Concatenates the text content of a tool result.
[[nodiscard]] inline auto textOf(const ToolResultBlock& result) -> std::string
{
    auto text = std::string {};
    for (const auto& item: result.content)
    {
        if (auto const* t = std::get_if<TextBlock>(&item))
        {
            if (!text.empty())
                text += '\n';
            text += t->text;
        }
    }
    return text;
}

/// @brief Returns the tool result block of a message, if it has one.
[[nodiscard]] inline auto findToolResult(const Message& message) -> const ToolResultBlock*
{
    for (const auto& block: message.content)
    {
        if (auto const* r = std::get_if<ToolResultBlock>(&block))
            return r;
    }
    return nullptr;
}

// }}}

} // namespace rigchat
