// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rigchat::base64
{

/// @brief Encodes bytes as standard, padded base64.
[[nodiscard]] auto encode(std::span<const std::uint8_t> bytes) -> std::string;

/// @brief Decodes standard base64.
///
/// ASCII whitespace is skipped and trailing padding may be omitted.
/// Returns std::nullopt for any other malformed input.
[[nodiscard]] auto decode(std::string_view text) -> std::optional<std::vector<std::uint8_t>>;

} // namespace rigchat::base64
