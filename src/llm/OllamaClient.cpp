// SPDX-License-Identifier: Apache-2.0
#include "OllamaClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <net/HttpClient.hpp>

#include <format>

namespace rigchat
{

namespace
{
    auto serviceHint(std::string_view model) -> std::string
    {
        return std::format("Make sure Ollama is running (`ollama serve`) and the model is pulled (`ollama pull {}`).",
                           model);
    }

    auto chatEndpoint(std::string host) -> std::string
    {
        while (!host.empty() && host.back() == '/')
            host.pop_back();
        return host + "/api/chat";
    }
} // namespace

OllamaClient::OllamaClient(OllamaConfig config): _config(std::move(config))
{
}

auto OllamaClient::send(const std::vector<Message>& history,
                        const std::vector<ToolDescriptor>& tools,
                        std::stop_token stopToken,
                        const TokenCallback& onToken) -> Result<ModelTurn>
{
    auto const cfg = config();
    auto const systemPrompt = ollama::buildSystemPrompt(cfg.systemPrompt, tools);
    auto const body = ollama::buildChatRequest(cfg.model, history, tools, systemPrompt);

    log::debug("Sending {} message(s) and {} tool(s) to {} ({})",
               history.size(),
               tools.size(),
               cfg.host,
               cfg.model);

    // Calls without an id are numbered per reply; the reply number keeps them unique.
    auto const idPrefix = std::format("call_{}", ++_replyCount);
    auto accumulator = ollama::StreamAccumulator(onToken, idPrefix);
    auto response = httpPost(
        HttpRequest {
            .url = chatEndpoint(cfg.host),
            .body = json::dumpSafe(body),
            .headers = { { "Content-Type", "application/json" } },
            .timeout = cfg.requestTimeout,
            .connectTimeout = cfg.connectTimeout,
        },
        stopToken,
        [&](std::string_view chunk) { accumulator.feed(chunk); });

    if (!response)
    {
        auto error = response.error();
        if (isTransient(error.code))
            error.message = std::format("Ollama request failed: {}\n\n{}", error.message, serviceHint(cfg.model));
        return std::unexpected(std::move(error));
    }

    if (!response->ok())
    {
        auto detail = std::string {};
        if (auto parsed = json::parse(response->body))
            detail = json::getStringOr(*parsed, "error", "");
        if (detail.empty())
            detail = response->body;
        auto message = std::format("Ollama returned HTTP {}: {}", response->status, detail);
        if (response->status == 404)
            message += std::format("\n\n{}", serviceHint(cfg.model));
        return makeError(ErrorCode::ProtocolError, std::move(message));
    }

    auto turn = accumulator.finish();
    if (!turn)
        return turn;

    if (!turn->hasToolCalls())
    {
        if (auto inlineCalls = ollama::detectInlineToolCalls(turn->text, tools, idPrefix))
        {
            log::debug("Detected {} inline tool call(s) in model text", inlineCalls->calls.size());
            turn->toolCalls = std::move(inlineCalls->calls);
            turn->text = std::move(inlineCalls->remainingText);
        }
    }

    log::debug("Model replied with {} chars and {} tool call(s)", turn->text.size(), turn->toolCalls.size());
    return turn;
}

auto OllamaClient::modelName() const -> std::string
{
    auto lock = std::lock_guard(_mutex);
    return _config.model;
}

void OllamaClient::setModelName(std::string name)
{
    auto lock = std::lock_guard(_mutex);
    _config.model = std::move(name);
}

auto OllamaClient::host() const -> std::string
{
    auto lock = std::lock_guard(_mutex);
    return _config.host;
}

auto OllamaClient::config() const -> OllamaConfig
{
    auto lock = std::lock_guard(_mutex);
    return _config;
}

} // namespace rigchat
