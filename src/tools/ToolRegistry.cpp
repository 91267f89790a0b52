// SPDX-License-Identifier: Apache-2.0
#include "ToolRegistry.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <tools/BuiltinTools.hpp>
#include <tools/SchemaValidator.hpp>

#include <algorithm>
#include <format>

namespace rigchat
{

ToolRegistry::ToolRegistry() = default;

ToolRegistry::~ToolRegistry() = default;

auto ToolRegistry::withBuiltinTools(std::string workingDirectory) -> std::unique_ptr<ToolRegistry>
{
    auto registry = std::make_unique<ToolRegistry>();
    for (auto& tool: makeBuiltinTools(std::move(workingDirectory)))
        registry->registerTool(std::move(tool));
    return registry;
}

void ToolRegistry::registerTool(std::unique_ptr<Tool> tool)
{
    auto const it = std::ranges::find_if(_tools, [&](const auto& t) { return t->name() == tool->name(); });
    if (it != _tools.end())
    {
        log::debug("Replacing local tool '{}'", tool->name());
        *it = std::move(tool);
        return;
    }
    _tools.push_back(std::move(tool));
}

auto ToolRegistry::list() const -> std::vector<ToolDescriptor>
{
    auto descriptors = std::vector<ToolDescriptor> {};
    descriptors.reserve(_tools.size());
    for (const auto& tool: _tools)
    {
        descriptors.push_back(ToolDescriptor {
            .name = std::string(tool->name()),
            .description = std::string(tool->description()),
            .inputSchema = tool->inputSchema(),
            .origin = LocalOrigin {},
            .originalName = std::string(tool->name()),
        });
    }
    std::ranges::sort(descriptors, {}, &ToolDescriptor::name);
    return descriptors;
}

auto ToolRegistry::contains(std::string_view name) const -> bool
{
    return find(name) != nullptr;
}

auto ToolRegistry::invoke(std::string_view name, const nlohmann::json& arguments, std::stop_token stopToken)
    -> Result<ContentBlock>
{
    auto* const tool = find(name);
    if (!tool)
        return makeError(ErrorCode::UnknownTool, std::format("Unknown tool: {}", name));

    if (auto valid = validateArguments(tool->inputSchema(), arguments); !valid)
    {
        log::warning("Rejected call to '{}': {}", name, valid.error().message);
        return std::unexpected(valid.error());
    }

    log::debug("Executing local tool '{}' with {}", name, json::dumpSafe(arguments));

    return tool->execute(arguments, std::move(stopToken))
        .transform([](ToolResultBlock result) -> ContentBlock { return result; });
}

auto ToolRegistry::find(std::string_view name) const -> Tool*
{
    auto const it = std::ranges::find_if(_tools, [&](const auto& t) { return t->name() == name; });
    return it != _tools.end() ? it->get() : nullptr;
}

} // namespace rigchat
