// SPDX-License-Identifier: Apache-2.0
#include "McpClientManager.hpp"

#include <content/ContentConverter.hpp>
#include <core/Log.hpp>
#include <mcp/HttpTransport.hpp>

#include <algorithm>
#include <format>

namespace rigchat
{

namespace
{
    constexpr auto IoPollInterval = std::chrono::milliseconds(50);

    /// Locks @p mutex unless @p stopToken is signalled first. Check owns_lock().
    auto lockUnlessStopped(std::timed_mutex& mutex, const std::stop_token& stopToken)
        -> std::unique_lock<std::timed_mutex>
    {
        auto lock = std::unique_lock(mutex, std::defer_lock);
        while (!lock.try_lock_for(IoPollInterval))
        {
            if (stopToken.stop_requested())
                break;
        }
        return lock;
    }
} // namespace

auto makeHttpTransportFactory(std::chrono::seconds timeout, std::chrono::seconds connectTimeout)
    -> TransportFactory
{
    return [timeout, connectTimeout](const McpServer& server) -> std::unique_ptr<Transport> {
        return std::make_unique<HttpTransport>(HttpTransport::Options {
            .url = server.url,
            .authToken = server.authToken,
            .timeout = timeout,
            .connectTimeout = connectTimeout,
        });
    };
}

McpClientManager::McpClientManager(TransportFactory factory, std::chrono::seconds refreshInterval):
    _factory(std::move(factory)), _refreshInterval(refreshInterval)
{
}

McpClientManager::~McpClientManager() = default;

auto McpClientManager::addServer(McpServer server) -> VoidResult
{
    if (server.id.empty())
        return makeError(ErrorCode::InvalidRequest, "MCP server id must not be empty");
    if (server.url.empty())
        return makeError(ErrorCode::InvalidRequest, std::format("MCP server '{}' has no URL", server.id));

    auto lock = std::lock_guard(_mutex);
    auto const taken = std::ranges::any_of(_servers, [&](const auto& s) { return s->config.id == server.id; });
    if (taken)
        return makeError(ErrorCode::InvalidRequest, std::format("MCP server '{}' already exists", server.id));

    auto state = std::make_shared<ServerState>();
    state->status = server.enabled ? McpServerStatus::Disconnected : McpServerStatus::Disabled;
    state->config = std::move(server);
    log::debug("Registered MCP server '{}' at {}", state->config.id, state->config.url);
    _servers.push_back(std::move(state));
    return {};
}

auto McpClientManager::removeServer(std::string_view id) -> VoidResult
{
    auto removed = std::shared_ptr<ServerState> {};
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = std::ranges::find_if(_servers, [&](const auto& s) { return s->config.id == id; });
        if (it == _servers.end())
            return makeError(ErrorCode::InvalidRequest, std::format("Unknown MCP server: {}", id));
        removed = std::move(*it);
        _servers.erase(it);
    }

    {
        auto state = std::lock_guard(removed->stateMutex);
        removed->removed = true;
        removed->tools.clear();
    }

    // An exchange in flight keeps the state alive and tears the client down when it returns.
    if (auto io = std::unique_lock(removed->ioMutex, std::try_to_lock); io.owns_lock())
        removed->client.reset();
    log::info("Removed MCP server '{}'", id);
    return {};
}

auto McpClientManager::setEnabled(std::string_view id, bool enabled) -> VoidResult
{
    auto server = find(id);
    if (!server)
        return makeError(ErrorCode::InvalidRequest, std::format("Unknown MCP server: {}", id));

    {
        auto state = std::lock_guard(server->stateMutex);
        server->config.enabled = enabled;
        server->status = enabled ? McpServerStatus::Disconnected : McpServerStatus::Disabled;
        server->lastAttempt.reset();
        if (!enabled)
            server->tools.clear();
    }

    if (!enabled)
    {
        if (auto io = std::unique_lock(server->ioMutex, std::try_to_lock); io.owns_lock())
            server->client.reset();
    }
    log::info("MCP server '{}' {}", id, enabled ? "enabled" : "disabled");
    return {};
}

void McpClientManager::refresh(bool force, std::stop_token stopToken)
{
    auto const now = std::chrono::steady_clock::now();
    for (const auto& server: snapshot())
    {
        if (stopToken.stop_requested())
            return;

        auto due = force;
        {
            auto state = std::lock_guard(server->stateMutex);
            if (!server->config.enabled)
                continue;
            if (!server->lastAttempt || now - *server->lastAttempt >= _refreshInterval)
                due = true;
        }
        if (due)
            connect(*server, stopToken);
    }
}

void McpClientManager::refreshIfStale(std::stop_token stopToken)
{
    refresh(false, std::move(stopToken));
}

auto McpClientManager::listTools() const -> std::vector<ToolDescriptor>
{
    auto descriptors = std::vector<ToolDescriptor> {};
    for (const auto& server: snapshot())
    {
        auto state = std::lock_guard(server->stateMutex);
        if (server->status != McpServerStatus::Connected)
            continue;
        for (const auto& tool: server->tools)
        {
            descriptors.push_back(ToolDescriptor {
                .name = tool.name,
                .description = tool.description,
                .inputSchema = tool.inputSchema,
                .origin = RemoteOrigin { server->config.id },
                .originalName = tool.name,
            });
        }
    }
    return descriptors;
}

auto McpClientManager::invoke(std::string_view serverId,
                              std::string_view toolName,
                              const nlohmann::json& arguments,
                              std::stop_token stopToken) -> Result<ToolResultBlock>
{
    auto server = find(serverId);
    if (!server)
        return makeError(ErrorCode::McpServerUnreachable, std::format("Unknown MCP server: {}", serverId));

    {
        auto state = std::lock_guard(server->stateMutex);
        if (!server->config.enabled)
            return makeError(ErrorCode::McpServerUnreachable,
                             std::format("MCP server '{}' is disabled", serverId));
    }

    auto io = lockUnlessStopped(server->ioMutex, stopToken);
    if (!io.owns_lock())
        return makeError(ErrorCode::Cancelled, "Request cancelled");

    auto result = invokeLocked(*server, toolName, arguments, std::move(stopToken));
    releaseIfRetired(*server);
    return result;
}

auto McpClientManager::invokeLocked(ServerState& server,
                                    std::string_view toolName,
                                    const nlohmann::json& arguments,
                                    std::stop_token stopToken) -> Result<ToolResultBlock>
{
    auto const& serverId = server.config.id;
    if (!server.client || !server.client->isInitialized())
    {
        markDisconnected(server);
        return makeError(ErrorCode::McpServerUnreachable, std::format("MCP server '{}' is not connected", serverId));
    }

    log::info("Calling MCP tool '{}' on server '{}'", toolName, serverId);
    auto result = server.client->callTool(toolName, arguments, std::move(stopToken));
    if (!result)
    {
        switch (result.error().code)
        {
            case ErrorCode::Cancelled: return std::unexpected(result.error());
            case ErrorCode::ProtocolError:
                return makeError(ErrorCode::ToolExecutionError,
                                 std::format("MCP tool '{}' failed: {}", toolName, result.error().message));
            default:
                server.client.reset();
                markUnreachable(server, result.error());
                return makeError(ErrorCode::McpServerUnreachable,
                                 std::format("MCP server '{}' unreachable: {}", serverId, result.error().message));
        }
    }

    auto block = ToolResultBlock { .callId = {}, .content = {}, .isError = result->isError };
    for (const auto& item: result->content)
        block.content.push_back(ContentConverter::fromMcpItem(item));
    if (block.content.empty())
        block.content.emplace_back(TextBlock { "(no content)" });
    return block;
}

auto McpClientManager::statuses() const -> std::vector<ServerStatusReport>
{
    auto reports = std::vector<ServerStatusReport> {};
    for (const auto& server: snapshot())
    {
        auto state = std::lock_guard(server->stateMutex);
        reports.push_back(ServerStatusReport {
            .id = server->config.id,
            .url = server->config.url,
            .enabled = server->config.enabled,
            .status = server->status,
            .toolCount = server->status == McpServerStatus::Connected ? server->tools.size() : 0,
            .lastError = server->lastError,
            .sessionOnly = server->config.sessionOnly,
        });
    }
    return reports;
}

auto McpClientManager::servers() const -> std::vector<McpServer>
{
    auto result = std::vector<McpServer> {};
    for (const auto& server: snapshot())
    {
        auto state = std::lock_guard(server->stateMutex);
        result.push_back(server->config);
    }
    return result;
}

auto McpClientManager::hasServer(std::string_view id) const -> bool
{
    return find(id) != nullptr;
}

auto McpClientManager::serverCount() const -> size_t
{
    auto lock = std::lock_guard(_mutex);
    return _servers.size();
}

void McpClientManager::shutdown()
{
    for (const auto& server: snapshot())
    {
        auto io = std::lock_guard(server->ioMutex);
        server->client.reset();
        auto state = std::lock_guard(server->stateMutex);
        if (server->status == McpServerStatus::Connected)
            server->status = McpServerStatus::Disconnected;
        server->tools.clear();
    }
}

auto McpClientManager::find(std::string_view id) const -> std::shared_ptr<ServerState>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = std::ranges::find_if(_servers, [&](const auto& s) { return s->config.id == id; });
    return it != _servers.end() ? *it : nullptr;
}

auto McpClientManager::snapshot() const -> std::vector<std::shared_ptr<ServerState>>
{
    auto lock = std::lock_guard(_mutex);
    return _servers;
}

void McpClientManager::connect(ServerState& server, std::stop_token stopToken)
{
    auto io = lockUnlessStopped(server.ioMutex, stopToken);
    if (!io.owns_lock())
    {
        log::debug("Refresh of MCP server '{}' cancelled while it was busy", server.config.id);
        return;
    }

    connectLocked(server, std::move(stopToken));
    releaseIfRetired(server);
}

void McpClientManager::connectLocked(ServerState& server, std::stop_token stopToken)
{
    {
        auto state = std::lock_guard(server.stateMutex);
        if (!server.config.enabled)
        {
            server.client.reset();
            return;
        }
        server.lastAttempt = std::chrono::steady_clock::now();
    }

    log::info("Connecting to MCP server '{}' at {}", server.config.id, server.config.url);

    if (!server.client || !server.client->isInitialized())
    {
        auto transport = _factory(server.config);
        if (!transport)
        {
            markUnreachable(server, Error { ErrorCode::TransportError, "No transport available" });
            return;
        }
        server.client = std::make_unique<McpClient>(std::move(transport));
        if (auto init = server.client->initialize(stopToken); !init)
        {
            server.client.reset();
            if (init.error().code == ErrorCode::Cancelled)
                markDisconnected(server);
            else
                markUnreachable(server, init.error());
            return;
        }
    }

    auto tools = server.client->listTools(stopToken);
    if (!tools)
    {
        server.client.reset();
        if (tools.error().code == ErrorCode::Cancelled)
            markDisconnected(server);
        else
            markUnreachable(server, tools.error());
        return;
    }

    log::info("MCP server '{}' provides {} tool(s)", server.config.id, tools->size());
    auto state = std::lock_guard(server.stateMutex);
    server.status = server.config.enabled ? McpServerStatus::Connected : McpServerStatus::Disabled;
    server.tools = std::move(*tools);
    server.lastError.clear();
}

void McpClientManager::releaseIfRetired(ServerState& server)
{
    auto state = std::lock_guard(server.stateMutex);
    if ((server.config.enabled && !server.removed) || !server.client)
        return;
    log::debug("Tearing down MCP server '{}' after its last exchange", server.config.id);
    server.client.reset();
}

void McpClientManager::markDisconnected(ServerState& server)
{
    auto state = std::lock_guard(server.stateMutex);
    if (server.status == McpServerStatus::Disabled)
        return;
    server.status = McpServerStatus::Disconnected;
    server.tools.clear();
    server.lastAttempt.reset();
}

void McpClientManager::markUnreachable(ServerState& server, const Error& error)
{
    log::warning("MCP server '{}' unreachable: {}", server.config.id, error.message);
    auto state = std::lock_guard(server.stateMutex);
    if (server.status == McpServerStatus::Disabled)
        return;
    server.status = McpServerStatus::Unreachable;
    server.tools.clear();
    server.lastError = error.message;
}

} // namespace rigchat
