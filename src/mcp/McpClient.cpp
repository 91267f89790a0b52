// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <format>

namespace rigchat
{

namespace
{
    constexpr auto MaxToolListPages = 32;
}

McpClient::McpClient(std::unique_ptr<Transport> transport): _transport(std::move(transport))
{
}

McpClient::~McpClient() = default;

auto McpClient::initialize(std::stop_token stopToken) -> Result<McpServerCapabilities>
{
    auto params = nlohmann::json {
        { "protocolVersion", McpProtocolVersion },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", "rigchat" },
              { "version", "0.1.0" },
          } },
    };

    return sendRequest("initialize", std::move(params), std::move(stopToken))
        .and_then([this](const nlohmann::json& result) -> Result<McpServerCapabilities> {
            auto const serverInfo = result.value("serverInfo", nlohmann::json::object());
            _capabilities.serverName = json::getStringOr(serverInfo, "name", "unknown");
            _capabilities.serverVersion = json::getStringOr(serverInfo, "version", "unknown");

            if (result.contains("capabilities") && result["capabilities"].is_object())
            {
                auto const& caps = result["capabilities"];
                _capabilities.hasTools = caps.contains("tools");
                _capabilities.hasResources = caps.contains("resources");
                _capabilities.hasPrompts = caps.contains("prompts");
            }

            if (auto sent = _transport->notify(jsonrpc::makeNotification("notifications/initialized")); !sent)
                log::debug("initialized notification not delivered: {}", sent.error());

            _initialized = true;
            log::info(
                "MCP server initialized: {} v{}", _capabilities.serverName, _capabilities.serverVersion);

            return _capabilities;
        });
}

auto McpClient::listTools(std::stop_token stopToken) -> Result<std::vector<McpToolInfo>>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto tools = std::vector<McpToolInfo> {};
    auto cursor = std::string {};

    for (auto page = 0; page < MaxToolListPages; ++page)
    {
        auto params = cursor.empty() ? nlohmann::json(nullptr) : nlohmann::json { { "cursor", cursor } };
        auto result = sendRequest("tools/list", std::move(params), stopToken);
        if (!result)
            return std::unexpected(result.error());

        if (result->contains("tools") && (*result)["tools"].is_array())
        {
            for (const auto& toolJson: (*result)["tools"])
            {
                auto name = json::getStringOr(toolJson, "name", "");
                if (name.empty())
                    continue;
                auto schema = toolJson.value("inputSchema", nlohmann::json::object());
                tools.push_back(McpToolInfo {
                    .name = std::move(name),
                    .description = json::getStringOr(toolJson, "description", ""),
                    .inputSchema = schema.is_object() ? std::move(schema) : nlohmann::json::object(),
                });
            }
        }

        cursor = json::getStringOr(*result, "nextCursor", "");
        if (cursor.empty())
            break;
    }

    return tools;
}

auto McpClient::callTool(std::string_view name, const nlohmann::json& arguments, std::stop_token stopToken)
    -> Result<McpCallResult>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments },
    };

    return sendRequest("tools/call", std::move(params), std::move(stopToken))
        .transform([&name](const nlohmann::json& result) {
            auto callResult = McpCallResult {};
            callResult.isError = json::getBoolOr(result, "isError", false);
            if (result.contains("content") && result["content"].is_array())
                callResult.content = result["content"];

            log::debug("Tool '{}' returned {} item(s) (isError: {})",
                       name,
                       callResult.content.size(),
                       callResult.isError);
            return callResult;
        });
}

auto McpClient::capabilities() const -> const McpServerCapabilities&
{
    return _capabilities;
}

auto McpClient::isInitialized() const -> bool
{
    return _initialized;
}

auto McpClient::sendRequest(std::string_view method, nlohmann::json params, std::stop_token stopToken)
    -> Result<nlohmann::json>
{
    auto const id = _nextId++;
    auto request = jsonrpc::makeRequest(id, method, std::move(params));

    return _transport->roundTrip(request, std::move(stopToken))
        .and_then([id](const nlohmann::json& msg) { return jsonrpc::unwrapResult(msg, id); });
}

} // namespace rigchat
