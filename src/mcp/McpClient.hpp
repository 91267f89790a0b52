// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/Transport.hpp>

#include <cstdint>
#include <memory>
#include <stop_token>
#include <string_view>
#include <string>
#include <vector>

namespace rigchat
{

/// @brief MCP protocol revision spoken by the client.
constexpr auto McpProtocolVersion = std::string_view { "2024-11-05" };

/// @brief MCP server capabilities reported during initialization.
struct McpServerCapabilities
{
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
    std::string serverName;
    std::string serverVersion;
};

/// @brief A tool as advertised by tools/list.
struct McpToolInfo
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema = nlohmann::json::object();
};

/// @brief The raw outcome of tools/call, before content conversion.
struct McpCallResult
{
    nlohmann::json content = nlohmann::json::array();
    bool isError = false;
};

/// @brief Client for the Model Context Protocol (MCP).
///
/// Handles the MCP lifecycle: initialize, list tools, call tools.
/// Not thread-safe; callers serialize access per server.
class McpClient
{
  public:
    /// @brief Constructs an McpClient with the given transport.
    /// @param transport The transport to use for communication.
    explicit McpClient(std::unique_ptr<Transport> transport);
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Performs the MCP initialize handshake.
    /// @return The server's capabilities or an error.
    [[nodiscard]] auto initialize(std::stop_token stopToken = {}) -> Result<McpServerCapabilities>;

    /// @brief Lists available tools from the server, following pagination cursors.
    /// @return A vector of tool definitions or an error.
    [[nodiscard]] auto listTools(std::stop_token stopToken = {}) -> Result<std::vector<McpToolInfo>>;

    /// @brief Calls a tool on the server.
    /// @param name The tool name.
    /// @param arguments The tool arguments.
    /// @return The tool result or an error.
    [[nodiscard]] auto callTool(std::string_view name,
                                const nlohmann::json& arguments,
                                std::stop_token stopToken = {}) -> Result<McpCallResult>;

    /// @brief Returns the server capabilities (valid after initialize).
    [[nodiscard]] auto capabilities() const -> const McpServerCapabilities&;

    /// @brief Returns true if the client has been initialized.
    [[nodiscard]] auto isInitialized() const -> bool;

  private:
    std::unique_ptr<Transport> _transport;
    McpServerCapabilities _capabilities;
    int64_t _nextId = 1;
    bool _initialized = false;

    [[nodiscard]] auto sendRequest(std::string_view method, nlohmann::json params, std::stop_token stopToken)
        -> Result<nlohmann::json>;
};

} // namespace rigchat
