// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rigchat
{

/// @brief A slash command typed at the prompt.
struct Command
{
    std::string name; ///< Canonical name without the slash; aliases are resolved ("cls" -> "clear").
    std::vector<std::string> args;
};

/// @brief Parses a line starting with '/' into a command.
/// @return std::nullopt if @p line is not a command.
[[nodiscard]] auto parseCommand(std::string_view line) -> std::optional<Command>;

/// @brief Returns true if @p name (canonical) is a known command.
[[nodiscard]] auto isKnownCommand(std::string_view name) -> bool;

/// @brief The text printed by /help.
[[nodiscard]] auto helpText() -> std::string_view;

} // namespace rigchat
