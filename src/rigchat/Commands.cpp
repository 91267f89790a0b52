// SPDX-License-Identifier: Apache-2.0
#include "Commands.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>
#include <utility>

namespace rigchat
{

namespace
{
    constexpr auto Aliases = std::array<std::pair<std::string_view, std::string_view>, 5> { {
        { "h", "help" },
        { "?", "help" },
        { "cls", "clear" },
        { "exit", "quit" },
        { "q", "quit" },
    } };

    constexpr auto Known = std::array<std::string_view, 9> {
        "help", "clear", "model", "yolo", "cancel", "tools", "mcp", "logs", "quit",
    };

    constexpr auto HelpText = std::string_view {
        R"(Commands:
  /help, /h, /?            Show this help
  /clear, /cls             Clear the conversation
  /model [name]            Show or set the model
  /yolo                    Toggle auto-confirm for tool calls
  /cancel                  Cancel the request in flight (also Ctrl+C)
  /tools                   List the tools offered to the model
  /mcp list                Show MCP server status
  /mcp refresh             Reconnect MCP servers and reload their tools
  /mcp add <url> [token]   Add an MCP server for this session
  /mcp remove <id>         Remove an MCP server
  /mcp enable <id>         Enable an MCP server
  /mcp disable <id>        Disable an MCP server
  /logs                    Show recent log lines
  /quit, /exit, /q         Exit

When a tool call needs confirmation, answer y (or Enter) to run it, n to decline.)"
    };
} // namespace

auto parseCommand(std::string_view line) -> std::optional<Command>
{
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.front())))
        line.remove_prefix(1);
    if (!line.starts_with('/'))
        return std::nullopt;
    line.remove_prefix(1);

    auto words = std::vector<std::string> {};
    auto current = std::string {};
    for (auto const c: line)
    {
        if (std::isspace(static_cast<unsigned char>(c)))
        {
            if (!current.empty())
                words.push_back(std::move(current));
            current.clear();
        }
        else
        {
            current += c;
        }
    }
    if (!current.empty())
        words.push_back(std::move(current));

    if (words.empty())
        return Command {};

    auto command = Command { .name = std::move(words.front()), .args = {} };
    std::ranges::transform(command.name, command.name.begin(), [](unsigned char c) { return std::tolower(c); });
    command.args.assign(std::make_move_iterator(words.begin() + 1), std::make_move_iterator(words.end()));

    for (auto const& [alias, canonical]: Aliases)
    {
        if (command.name == alias)
        {
            command.name = canonical;
            break;
        }
    }
    return command;
}

auto isKnownCommand(std::string_view name) -> bool
{
    return std::ranges::find(Known, name) != Known.end();
}

auto helpText() -> std::string_view
{
    return HelpText;
}

} // namespace rigchat
