// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rigchat
{

/// @brief Collects the JSON payloads of the `data:` lines of a text/event-stream body.
///
/// Multi-line data fields of one event are joined with '\n' before parsing.
/// Events whose data is not valid JSON are skipped.
[[nodiscard]] auto parseEventStream(std::string_view body) -> std::vector<nlohmann::json>;

/// @brief MCP transport over HTTP POST (streamable HTTP, JSON or SSE responses).
class HttpTransport final: public Transport
{
  public:
    struct Options
    {
        std::string url;
        std::optional<std::string> authToken;
        std::chrono::seconds timeout { 60 };
        std::chrono::seconds connectTimeout { 10 };
    };

    explicit HttpTransport(Options options);

    [[nodiscard]] auto roundTrip(const nlohmann::json& message, std::stop_token stopToken)
        -> Result<nlohmann::json> override;

    [[nodiscard]] auto notify(const nlohmann::json& message) -> VoidResult override;

    /// @brief Returns the Mcp-Session-Id assigned by the server, if any.
    [[nodiscard]] auto sessionId() const -> std::string;

  private:
    [[nodiscard]] auto post(const nlohmann::json& message, std::stop_token stopToken) -> Result<std::string>;

    Options _options;
    mutable std::mutex _sessionMutex;
    std::string _sessionId;
};

} // namespace rigchat
