// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/McpClient.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace rigchat
{

/// @brief A configured remote MCP server.
struct McpServer
{
    std::string id;
    std::string url;
    bool enabled = true;
    std::optional<std::string> authToken;
    bool sessionOnly = false; ///< Added from the command line or /mcp add; never persisted.
};

/// @brief Connection state of one MCP server.
enum class McpServerStatus
{
    Disconnected,
    Connected,
    Unreachable,
    Disabled,
};

[[nodiscard]] constexpr auto statusName(McpServerStatus status) -> std::string_view
{
    switch (status)
    {
        case McpServerStatus::Disconnected: return "disconnected";
        case McpServerStatus::Connected: return "connected";
        case McpServerStatus::Unreachable: return "unreachable";
        case McpServerStatus::Disabled: return "disabled";
    }
    return "unknown";
}

/// @brief A point-in-time view of one server, as shown by `/mcp list`.
struct ServerStatusReport
{
    std::string id;
    std::string url;
    bool enabled = true;
    McpServerStatus status = McpServerStatus::Disconnected;
    size_t toolCount = 0;
    std::string lastError;
    bool sessionOnly = false;
};

/// @brief Creates the transport for a server. Replaced by tests.
using TransportFactory = std::function<std::unique_ptr<Transport>(const McpServer& server)>;

/// @brief Returns a factory producing HttpTransport instances.
[[nodiscard]] auto makeHttpTransportFactory(std::chrono::seconds timeout = std::chrono::seconds(60),
                                            std::chrono::seconds connectTimeout = std::chrono::seconds(10))
    -> TransportFactory;

/// @brief Owns the remote MCP connections, their tool discovery and invocation.
///
/// A server that cannot be reached is marked Unreachable and its tools are left
/// out of listTools(); other servers are unaffected. Discovery is cached and
/// redone by refreshIfStale() once the refresh interval has elapsed, or by
/// refresh(true) on demand.
///
/// Thread-safe: discovery runs on the model task while the console reads
/// statuses. Each server allows one network exchange at a time.
class McpClientManager
{
  public:
    explicit McpClientManager(TransportFactory factory,
                              std::chrono::seconds refreshInterval = std::chrono::seconds(300));
    ~McpClientManager();

    McpClientManager(const McpClientManager&) = delete;
    McpClientManager& operator=(const McpClientManager&) = delete;

    /// @brief Registers a server. Does not connect.
    /// @return ErrorCode::InvalidRequest if the id is empty or already taken.
    [[nodiscard]] auto addServer(McpServer server) -> VoidResult;

    /// @brief Tears down and forgets a server.
    ///
    /// A connection busy with an exchange is torn down once that exchange returns.
    [[nodiscard]] auto removeServer(std::string_view id) -> VoidResult;

    /// @brief Enables or disables a server. Disabling tears the connection down.
    [[nodiscard]] auto setEnabled(std::string_view id, bool enabled) -> VoidResult;

    /// @brief (Re)connects enabled servers and reloads their tool lists.
    /// @param force Refresh every enabled server, not just the stale ones.
    ///
    /// Returns early once @p stopToken is signalled, also while waiting for a
    /// server busy with another exchange.
    void refresh(bool force, std::stop_token stopToken = {});

    /// @brief Refreshes the servers whose last attempt is older than the refresh interval.
    void refreshIfStale(std::stop_token stopToken = {});

    /// @brief Returns the tools of every connected server, in server registration order.
    [[nodiscard]] auto listTools() const -> std::vector<ToolDescriptor>;

    /// @brief Calls @p toolName on server @p serverId and converts the returned content.
    ///
    /// RPC-level failures yield ErrorCode::ToolExecutionError. Transport failures mark
    /// the server Unreachable and yield ErrorCode::McpServerUnreachable.
    [[nodiscard]] auto invoke(std::string_view serverId,
                              std::string_view toolName,
                              const nlohmann::json& arguments,
                              std::stop_token stopToken = {}) -> Result<ToolResultBlock>;

    [[nodiscard]] auto statuses() const -> std::vector<ServerStatusReport>;

    /// @brief Returns the configured servers, session-only ones included.
    [[nodiscard]] auto servers() const -> std::vector<McpServer>;

    [[nodiscard]] auto hasServer(std::string_view id) const -> bool;

    [[nodiscard]] auto serverCount() const -> size_t;

    /// @brief Disconnects every server.
    void shutdown();

  private:
    struct ServerState
    {
        McpServer config;

        std::timed_mutex ioMutex; // serializes network exchanges; guards client
        std::unique_ptr<McpClient> client;

        mutable std::mutex stateMutex; // guards the fields below
        bool removed = false;
        McpServerStatus status = McpServerStatus::Disconnected;
        std::vector<McpToolInfo> tools;
        std::string lastError;
        std::optional<std::chrono::steady_clock::time_point> lastAttempt;
    };

    [[nodiscard]] auto find(std::string_view id) const -> std::shared_ptr<ServerState>;
    [[nodiscard]] auto snapshot() const -> std::vector<std::shared_ptr<ServerState>>;
    void connect(ServerState& server, std::stop_token stopToken);
    void connectLocked(ServerState& server, std::stop_token stopToken);
    [[nodiscard]] auto invokeLocked(ServerState& server,
                                    std::string_view toolName,
                                    const nlohmann::json& arguments,
                                    std::stop_token stopToken) -> Result<ToolResultBlock>;
    static void releaseIfRetired(ServerState& server);
    static void markUnreachable(ServerState& server, const Error& error);
    static void markDisconnected(ServerState& server);

    TransportFactory _factory;
    std::chrono::seconds _refreshInterval;

    mutable std::mutex _mutex; // guards _servers
    std::vector<std::shared_ptr<ServerState>> _servers;
};

} // namespace rigchat
