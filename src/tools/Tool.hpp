// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <stop_token>
#include <string_view>

namespace rigchat
{

/// @brief Abstract interface for a tool implemented in-process.
class Tool
{
  public:
    virtual ~Tool() = default;

    /// @brief The unique name the model calls this tool by.
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /// @brief A one-line description presented to the model.
    [[nodiscard]] virtual auto description() const -> std::string_view = 0;

    /// @brief The JSON schema of the arguments object.
    [[nodiscard]] virtual auto inputSchema() const -> nlohmann::json = 0;

    /// @brief Runs the tool. Arguments have already been validated against inputSchema().
    /// @param arguments The validated arguments object.
    /// @param stopToken Signalled when the surrounding request is cancelled.
    /// @return The tool result (callId left empty) or a ToolExecutionError.
    [[nodiscard]] virtual auto execute(const nlohmann::json& arguments, std::stop_token stopToken)
        -> Result<ToolResultBlock> = 0;
};

} // namespace rigchat
