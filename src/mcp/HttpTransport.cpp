// SPDX-License-Identifier: Apache-2.0
#include "HttpTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>
#include <net/HttpClient.hpp>

#include <cctype>
#include <format>

namespace rigchat
{

auto parseEventStream(std::string_view body) -> std::vector<nlohmann::json>
{
    auto events = std::vector<nlohmann::json> {};
    auto data = std::string {};
    auto haveData = false;

    auto flush = [&] {
        if (haveData)
        {
            if (auto parsed = json::parse(data))
                events.push_back(std::move(*parsed));
            else
                log::debug("Skipping non-JSON event data: {}", parsed.error().message);
        }
        data.clear();
        haveData = false;
    };

    while (!body.empty())
    {
        auto const eol = body.find('\n');
        auto line = body.substr(0, eol);
        body = eol == std::string_view::npos ? std::string_view {} : body.substr(eol + 1);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        if (line.empty())
        {
            flush();
            continue;
        }
        if (!line.starts_with("data:"))
            continue;

        line.remove_prefix(5);
        if (!line.empty() && line.front() == ' ')
            line.remove_prefix(1);
        if (haveData)
            data += '\n';
        data.append(line);
        haveData = true;
    }
    flush();
    return events;
}

HttpTransport::HttpTransport(Options options): _options(std::move(options))
{
}

auto HttpTransport::roundTrip(const nlohmann::json& message, std::stop_token stopToken)
    -> Result<nlohmann::json>
{
    auto body = post(message, std::move(stopToken));
    if (!body)
        return std::unexpected(body.error());

    auto const id = message.value("id", int64_t { -1 });

    auto trimmed = std::string_view(*body);
    while (!trimmed.empty() && std::isspace(static_cast<unsigned char>(trimmed.front())))
        trimmed.remove_prefix(1);

    if (trimmed.starts_with("{") || trimmed.starts_with("["))
        return json::parse(trimmed);

    // text/event-stream: servers may interleave notifications before the response.
    for (auto& event: parseEventStream(trimmed))
    {
        if (jsonrpc::isResponseTo(event, id))
            return std::move(event);
    }
    return makeError(ErrorCode::ProtocolError,
                     std::format("No JSON-RPC response for request {} from {}", id, _options.url));
}

auto HttpTransport::notify(const nlohmann::json& message) -> VoidResult
{
    return post(message, std::stop_token {}).transform([](const std::string&) {});
}

auto HttpTransport::sessionId() const -> std::string
{
    auto lock = std::lock_guard(_sessionMutex);
    return _sessionId;
}

auto HttpTransport::post(const nlohmann::json& message, std::stop_token stopToken) -> Result<std::string>
{
    auto request = HttpRequest {
        .url = _options.url,
        .body = json::dumpSafe(message),
        .headers = {
            { "Content-Type", "application/json" },
            { "Accept", "application/json, text/event-stream" },
        },
        .timeout = _options.timeout,
        .connectTimeout = _options.connectTimeout,
    };
    if (_options.authToken && !_options.authToken->empty())
        request.headers["Authorization"] = std::format("Bearer {}", *_options.authToken);
    if (auto const session = sessionId(); !session.empty())
        request.headers["Mcp-Session-Id"] = session;

    auto response = httpPost(request, std::move(stopToken));
    if (!response)
        return std::unexpected(response.error());

    if (auto session = response->header("mcp-session-id"); !session.empty())
    {
        auto lock = std::lock_guard(_sessionMutex);
        _sessionId = std::move(session);
    }

    if (response->status >= 400)
        return makeError(ErrorCode::TransportError,
                         std::format("MCP server {} answered HTTP {}", _options.url, response->status));

    return std::move(response->body);
}

} // namespace rigchat
