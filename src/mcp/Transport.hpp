// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <stop_token>

namespace rigchat
{

/// @brief Abstract interface for MCP transport communication.
///
/// MCP over HTTP is request/response: every JSON-RPC request is answered in the
/// body of the same exchange, so the transport exposes a single round trip.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Sends a JSON-RPC request and waits for its response.
    /// @param message The JSON-RPC request object.
    /// @param stopToken Aborts the exchange with ErrorCode::Cancelled once signalled.
    /// @return The JSON-RPC response object or an error.
    [[nodiscard]] virtual auto roundTrip(const nlohmann::json& message, std::stop_token stopToken)
        -> Result<nlohmann::json> = 0;

    /// @brief Sends a JSON-RPC notification. No response is expected.
    [[nodiscard]] virtual auto notify(const nlohmann::json& message) -> VoidResult = 0;
};

} // namespace rigchat
