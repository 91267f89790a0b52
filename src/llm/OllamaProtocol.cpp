// SPDX-License-Identifier: Apache-2.0
#include "OllamaProtocol.hpp"

#include <core/Base64.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

namespace rigchat::ollama
{

namespace
{
    constexpr auto SystemPrompt = std::string_view {
        R"(You are rigchat, a helpful AI coding assistant running in a terminal.

You have access to tools that allow you to:
- Read and write files
- List directory contents
- Run shell commands
- Search code with grep

When using tools:
1. Think carefully about what the user is asking
2. Use the appropriate tool(s) to help
3. Explain what you're doing and what the results mean

Be concise but helpful. Use formatting like code blocks when appropriate.
You are running on the user's local machine via Ollama.)"
    };

    auto trim(std::string_view text) -> std::string_view
    {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
            text.remove_prefix(1);
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
            text.remove_suffix(1);
        return text;
    }

    auto encodeImages(const std::vector<const ImageBlock*>& images) -> nlohmann::json
    {
        auto encoded = nlohmann::json::array();
        for (auto const* image: images)
            encoded.push_back(base64::encode(image->bytes));
        return encoded;
    }

    auto serializeUserOrAssistant(const Message& message) -> nlohmann::json
    {
        auto images = std::vector<const ImageBlock*> {};
        for (const auto& block: message.content)
        {
            if (auto const* image = std::get_if<ImageBlock>(&block))
                images.push_back(image);
        }

        auto msg = nlohmann::json {
            { "role", roleToString(message.role) },
            { "content", textOf(message) },
        };
        if (!images.empty())
            msg["images"] = encodeImages(images);
        return msg;
    }

    void serializeToolMessage(const Message& message, nlohmann::json& out)
    {
        auto leadingText = std::string {};
        auto toolNames = std::vector<std::pair<std::string, std::string>> {}; // call id, tool name

        for (const auto& block: message.content)
        {
            if (auto const* text = std::get_if<TextBlock>(&block))
            {
                if (!leadingText.empty())
                    leadingText += '\n';
                leadingText += text->text;
            }
            else if (auto const* call = std::get_if<ToolCallBlock>(&block))
            {
                toolNames.emplace_back(call->id, call->toolName);
                out.push_back(nlohmann::json {
                    { "role", "assistant" },
                    { "content", std::exchange(leadingText, {}) },
                    { "tool_calls",
                      nlohmann::json::array({ nlohmann::json {
                          { "id", call->id },
                          { "type", "function" },
                          { "function", { { "name", call->toolName }, { "arguments", call->arguments } } },
                      } }) },
                });
            }
            else if (auto const* result = std::get_if<ToolResultBlock>(&block))
            {
                auto images = std::vector<const ImageBlock*> {};
                for (const auto& item: result->content)
                {
                    if (auto const* image = std::get_if<ImageBlock>(&item))
                        images.push_back(image);
                }

                auto text = textOf(*result);
                if (result->isError)
                    text = std::format("Error: {}", text);

                auto msg = nlohmann::json {
                    { "role", "tool" },
                    { "content", std::move(text) },
                    { "tool_call_id", result->callId },
                };
                auto const it = std::ranges::find(toolNames, result->callId, &std::pair<std::string, std::string>::first);
                if (it != toolNames.end())
                    msg["tool_name"] = it->second;
                if (!images.empty())
                    msg["images"] = encodeImages(images);
                out.push_back(std::move(msg));
            }
        }
    }

    auto callFromJson(const nlohmann::json& value, std::string_view idPrefix, size_t index) -> std::optional<ToolCall>
    {
        if (!value.is_object())
            return std::nullopt;

        // {"function": {"name": .., "arguments": ..}} is accepted as well as the flat form.
        auto const& fn = value.contains("function") && value["function"].is_object() ? value["function"] : value;

        auto name = json::getStringOr(fn, "name", "");
        if (name.empty())
            return std::nullopt;

        auto arguments = nlohmann::json::object();
        for (auto const* key: { "arguments", "parameters" })
        {
            if (!fn.contains(key))
                continue;
            auto const& raw = fn[key];
            if (raw.is_object())
                arguments = raw;
            else if (raw.is_string())
            {
                auto parsed = json::parse(raw.get<std::string>());
                if (!parsed || !parsed->is_object())
                    return std::nullopt;
                arguments = std::move(*parsed);
            }
            else if (!raw.is_null())
                return std::nullopt;
            break;
        }

        auto id = json::getStringOr(value, "id", "");
        if (id.empty())
            id = std::format("{}_{}", idPrefix, index);

        return ToolCall { .id = std::move(id), .toolName = std::move(name), .arguments = std::move(arguments) };
    }

    auto inCatalog(const std::vector<ToolDescriptor>& tools, std::string_view name) -> bool
    {
        return std::ranges::any_of(tools, [&](const auto& t) { return t.name == name; });
    }

    auto detectTaggedCalls(std::string_view text, const std::vector<ToolDescriptor>& tools, std::string_view idPrefix)
        -> std::optional<InlineToolCalls>
    {
        constexpr auto OpenTag = std::string_view("<tool_call>");
        constexpr auto CloseTag = std::string_view("</tool_call>");

        auto result = InlineToolCalls {};
        auto pos = size_t { 0 };
        while (true)
        {
            auto const start = text.find(OpenTag, pos);
            if (start == std::string_view::npos)
            {
                result.remainingText += text.substr(pos);
                break;
            }
            auto const end = text.find(CloseTag, start);
            if (end == std::string_view::npos)
                return std::nullopt;

            result.remainingText += text.substr(pos, start - pos);
            auto const body = text.substr(start + OpenTag.size(), end - start - OpenTag.size());
            auto parsed = json::parse(trim(body));
            if (!parsed)
                return std::nullopt;
            auto call = callFromJson(*parsed, idPrefix, result.calls.size());
            if (!call || !inCatalog(tools, call->toolName))
                return std::nullopt;
            result.calls.push_back(std::move(*call));
            pos = end + CloseTag.size();
        }

        if (result.calls.empty())
            return std::nullopt;
        result.remainingText = std::string(trim(result.remainingText));
        return result;
    }

    auto stripCodeFence(std::string_view text) -> std::string_view
    {
        if (!text.starts_with("```") || !text.ends_with("```") || text.size() < 6)
            return text;
        text.remove_suffix(3);
        auto const eol = text.find('\n');
        if (eol == std::string_view::npos)
            return text.substr(3);
        return trim(text.substr(eol + 1));
    }
} // namespace

auto defaultSystemPrompt() -> std::string_view
{
    return SystemPrompt;
}

auto buildSystemPrompt(std::string_view base, const std::vector<ToolDescriptor>& tools) -> std::string
{
    auto prompt = std::string(base.empty() ? SystemPrompt : base);

    auto remote = std::string {};
    for (const auto& tool: tools)
    {
        if (!tool.isRemote())
            continue;
        if (!remote.empty())
            remote += ", ";
        remote += tool.name;
    }
    if (remote.empty())
        return prompt;

    prompt += std::format(
        "\n\nYou also have access to these MCP tools: {}\n\n"
        "When the user asks for something one of these tools can do, call the tool directly "
        "instead of telling the user which command to run. Prefer MCP tools over suggesting "
        "shell commands.",
        remote);
    return prompt;
}

auto toolToJson(const ToolDescriptor& tool) -> nlohmann::json
{
    auto parameters = tool.inputSchema.is_object() && !tool.inputSchema.empty()
                          ? tool.inputSchema
                          : nlohmann::json { { "type", "object" }, { "properties", nlohmann::json::object() } };
    return nlohmann::json {
        { "type", "function" },
        { "function",
          {
              { "name", tool.name },
              { "description", tool.description },
              { "parameters", std::move(parameters) },
          } },
    };
}

auto serializeMessages(const std::vector<Message>& history, std::string_view systemPrompt) -> nlohmann::json
{
    auto messages = nlohmann::json::array();
    if (!systemPrompt.empty())
        messages.push_back(nlohmann::json { { "role", "system" }, { "content", systemPrompt } });

    for (const auto& message: history)
    {
        if (message.role == Role::Tool)
            serializeToolMessage(message, messages);
        else
            messages.push_back(serializeUserOrAssistant(message));
    }
    return messages;
}

auto buildChatRequest(std::string_view model,
                      const std::vector<Message>& history,
                      const std::vector<ToolDescriptor>& tools,
                      std::string_view systemPrompt,
                      bool stream) -> nlohmann::json
{
    auto request = nlohmann::json {
        { "model", model },
        { "messages", serializeMessages(history, systemPrompt) },
        { "stream", stream },
    };

    if (!tools.empty())
    {
        auto toolsJson = nlohmann::json::array();
        for (const auto& tool: tools)
            toolsJson.push_back(toolToJson(tool));
        request["tools"] = std::move(toolsJson);
    }
    return request;
}

auto detectInlineToolCalls(std::string_view text, const std::vector<ToolDescriptor>& tools, std::string_view idPrefix)
    -> std::optional<InlineToolCalls>
{
    if (tools.empty())
        return std::nullopt;

    if (text.find("<tool_call>") != std::string_view::npos)
        return detectTaggedCalls(text, tools, idPrefix);

    auto const candidate = stripCodeFence(trim(text));
    if (!candidate.starts_with("{") && !candidate.starts_with("["))
        return std::nullopt;

    auto parsed = json::parse(candidate);
    if (!parsed)
        return std::nullopt;

    auto items = parsed->is_array() ? *parsed : nlohmann::json::array({ *parsed });
    if (items.empty())
        return std::nullopt;

    auto result = InlineToolCalls {};
    for (const auto& item: items)
    {
        // Anything but {"name", "arguments"} is ordinary JSON the user asked for.
        if (!item.is_object() || !item.contains("name")
            || !(item.contains("arguments") || item.contains("parameters")))
            return std::nullopt;
        auto call = callFromJson(item, idPrefix, result.calls.size());
        if (!call || !inCatalog(tools, call->toolName))
            return std::nullopt;
        result.calls.push_back(std::move(*call));
    }
    return result;
}

StreamAccumulator::StreamAccumulator(TokenCallback onToken, std::string idPrefix):
    _onToken(std::move(onToken)), _idPrefix(std::move(idPrefix))
{
}

void StreamAccumulator::feed(std::string_view bytes)
{
    _buffer.append(bytes);
    auto pos = size_t { 0 };
    while (true)
    {
        auto const eol = _buffer.find('\n', pos);
        if (eol == std::string::npos)
            break;
        processLine(std::string_view(_buffer).substr(pos, eol - pos));
        pos = eol + 1;
    }
    _buffer.erase(0, pos);
}

auto StreamAccumulator::finish() -> Result<ModelTurn>
{
    if (!trim(_buffer).empty())
        processLine(_buffer);
    _buffer.clear();

    if (!_error.empty())
        return makeError(ErrorCode::ProtocolError, _error);
    if (_chunks == 0)
        return makeError(ErrorCode::ProtocolError, "Empty response from model endpoint");
    if (!_done)
        log::debug("Model stream ended without a done marker");
    return std::move(_turn);
}

void StreamAccumulator::processLine(std::string_view line)
{
    line = trim(line);
    if (line.empty())
        return;

    auto parsed = json::parse(line);
    if (!parsed || !parsed->is_object())
    {
        log::warning("Ignoring malformed stream chunk: {}", line);
        return;
    }
    ++_chunks;
    auto const& chunk = *parsed;

    if (auto error = json::getStringOr(chunk, "error", ""); !error.empty())
    {
        _error = std::move(error);
        return;
    }

    if (chunk.contains("message") && chunk["message"].is_object())
    {
        auto const& message = chunk["message"];
        if (auto content = json::getStringOr(message, "content", ""); !content.empty())
        {
            _turn.text += content;
            if (_onToken)
                _onToken(content);
        }

        if (message.contains("tool_calls") && message["tool_calls"].is_array())
        {
            for (const auto& item: message["tool_calls"])
            {
                if (auto call = callFromJson(item, _idPrefix, _turn.toolCalls.size()))
                    _turn.toolCalls.push_back(std::move(*call));
                else
                    log::warning("Ignoring malformed tool call: {}", json::dumpSafe(item));
            }
        }
    }

    if (json::getBoolOr(chunk, "done", false))
        _done = true;
}

} // namespace rigchat::ollama
