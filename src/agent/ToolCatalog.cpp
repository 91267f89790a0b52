// SPDX-License-Identifier: Apache-2.0
#include "ToolCatalog.hpp"

#include <core/Log.hpp>
#include <mcp/McpClientManager.hpp>
#include <tools/ToolRegistry.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <map>

namespace rigchat
{

namespace
{
    auto sanitize(std::string_view id) -> std::string
    {
        auto out = std::string {};
        out.reserve(id.size());
        for (auto const c: id)
        {
            auto const uc = static_cast<unsigned char>(c);
            out += std::isalnum(uc) || c == '_' || c == '-' ? c : '_';
        }
        return out;
    }

    template <typename... Ts>
    struct Overloaded: Ts...
    {
        using Ts::operator()...;
    };
} // namespace

auto ToolCatalog::merge(std::vector<ToolDescriptor> local, std::vector<ToolDescriptor> remote) -> ToolCatalog
{
    auto occurrences = std::map<std::string, int, std::less<>> {};
    for (const auto& tool: local)
        ++occurrences[tool.name];
    for (const auto& tool: remote)
        ++occurrences[tool.name];

    auto catalog = ToolCatalog {};
    catalog._tools = std::move(local);

    auto taken = [&](std::string_view name) {
        return std::ranges::any_of(catalog._tools, [&](const auto& t) { return t.name == name; });
    };

    for (auto& tool: remote)
    {
        if (occurrences[tool.name] > 1 || taken(tool.name))
        {
            auto const& serverId = std::get<RemoteOrigin>(tool.origin).serverId;
            auto const base = std::format("{}__{}", sanitize(serverId), tool.originalName);
            auto name = base;
            for (auto n = 2; taken(name); ++n)
                name = std::format("{}_{}", base, n);
            log::debug("Presenting remote tool '{}' of '{}' as '{}'", tool.originalName, serverId, name);
            tool.name = std::move(name);
        }
        catalog._tools.push_back(std::move(tool));
    }
    return catalog;
}

auto ToolCatalog::resolve(std::string_view name) const -> const ToolDescriptor*
{
    auto const it = std::ranges::find(_tools, name, &ToolDescriptor::name);
    return it != _tools.end() ? &*it : nullptr;
}

ToolDispatcher::ToolDispatcher(ToolRegistry& registry, McpClientManager& servers):
    _registry(registry), _servers(servers)
{
}

auto ToolDispatcher::buildCatalog(std::stop_token stopToken) -> ToolCatalog
{
    _servers.refreshIfStale(std::move(stopToken));
    return currentCatalog();
}

auto ToolDispatcher::currentCatalog() const -> ToolCatalog
{
    return ToolCatalog::merge(_registry.list(), _servers.listTools());
}

auto ToolDispatcher::invoke(const ToolDescriptor& tool, const nlohmann::json& arguments, std::stop_token stopToken)
    -> Result<ToolResultBlock>
{
    return std::visit(
        Overloaded {
            [&](const LocalOrigin&) -> Result<ToolResultBlock> {
                return _registry.invoke(tool.originalName, arguments, std::move(stopToken))
                    .transform([](ContentBlock block) -> ToolResultBlock {
                        if (auto* result = std::get_if<ToolResultBlock>(&block))
                            return std::move(*result);
                        auto wrapped = ToolResultBlock {};
                        if (auto* text = std::get_if<TextBlock>(&block))
                            wrapped.content.emplace_back(std::move(*text));
                        else if (auto* image = std::get_if<ImageBlock>(&block))
                            wrapped.content.emplace_back(std::move(*image));
                        return wrapped;
                    });
            },
            [&](const RemoteOrigin& remote) -> Result<ToolResultBlock> {
                return _servers.invoke(remote.serverId, tool.originalName, arguments, std::move(stopToken));
            },
        },
        tool.origin);
}

} // namespace rigchat
