// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace rigchat
{

class McpClientManager;
class ToolRegistry;

/// @brief The merged local and remote tool catalog presented to the model.
///
/// Local names are kept as they are. A remote tool whose name clashes with
/// any other tool is presented as `<server>__<tool>`.
class ToolCatalog
{
  public:
    ToolCatalog() = default;

    /// @brief Merges local and remote descriptors, disambiguating clashing names.
    [[nodiscard]] static auto merge(std::vector<ToolDescriptor> local, std::vector<ToolDescriptor> remote)
        -> ToolCatalog;

    [[nodiscard]] auto tools() const noexcept -> const std::vector<ToolDescriptor>& { return _tools; }

    /// @brief Looks a tool up by its presented name.
    [[nodiscard]] auto resolve(std::string_view name) const -> const ToolDescriptor*;

    [[nodiscard]] auto size() const noexcept -> size_t { return _tools.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return _tools.empty(); }

  private:
    std::vector<ToolDescriptor> _tools;
};

/// @brief Routes a call to the local registry or the owning MCP server.
class ToolDispatcher
{
  public:
    ToolDispatcher(ToolRegistry& registry, McpClientManager& servers);

    /// @brief Refreshes stale MCP servers and returns the merged catalog.
    [[nodiscard]] auto buildCatalog(std::stop_token stopToken = {}) -> ToolCatalog;

    /// @brief Returns the merged catalog without touching the network.
    [[nodiscard]] auto currentCatalog() const -> ToolCatalog;

    /// @brief Invokes the tool behind @p tool. The callId of the result is left empty.
    [[nodiscard]] auto invoke(const ToolDescriptor& tool,
                              const nlohmann::json& arguments,
                              std::stop_token stopToken = {}) -> Result<ToolResultBlock>;

  private:
    ToolRegistry& _registry;
    McpClientManager& _servers;
};

} // namespace rigchat
