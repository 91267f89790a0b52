// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace rigchat
{

/// @brief Infers an image MIME type from the leading bytes of a payload.
///
/// Knows PNG, JPEG, GIF (87a and 89a) and WebP. When more than one signature
/// matches, the longest (most specific) one wins.
/// @return The MIME type, or std::nullopt if no signature matches.
[[nodiscard]] auto detectImageMime(std::span<const std::uint8_t> bytes) -> std::optional<std::string>;

/// @brief Classifies opaque tool output into typed content.
class ContentConverter
{
  public:
    /// @brief Turns a raw payload into an Image block if it is base64-encoded image data,
    ///        or a Text block holding @p raw unchanged otherwise. Never fails.
    [[nodiscard]] static auto normalize(std::string_view raw) -> ContentBlock;

    /// @brief Same as normalize(), narrowed to the content a tool result may hold.
    [[nodiscard]] static auto normalizeResult(std::string_view raw) -> ResultContent;

    /// @brief Converts one MCP content item ({"type": "text" | "image" | ...}) into result content.
    [[nodiscard]] static auto fromMcpItem(const nlohmann::json& item) -> ResultContent;
};

} // namespace rigchat
