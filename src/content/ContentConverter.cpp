// SPDX-License-Identifier: Apache-2.0
#include "ContentConverter.hpp"

#include <core/Base64.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>

namespace rigchat
{

namespace
{
    /// @brief A byte pattern at a fixed offset. 0x100 in a pattern is a wildcard.
    struct ImageSignature
    {
        std::string_view mimeType;
        std::array<std::uint16_t, 12> pattern;
        std::size_t length;
    };

    constexpr auto Any = std::uint16_t { 0x100 };

    // Sorted by length, longest first, so the first match is the most specific.
    constexpr auto Signatures = std::array {
        ImageSignature { "image/webp",
                         { 'R', 'I', 'F', 'F', Any, Any, Any, Any, 'W', 'E', 'B', 'P' },
                         12 },
        ImageSignature { "image/png", { 0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A }, 8 },
        ImageSignature { "image/gif", { 'G', 'I', 'F', '8', '9', 'a' }, 6 },
        ImageSignature { "image/gif", { 'G', 'I', 'F', '8', '7', 'a' }, 6 },
        ImageSignature { "image/jpeg", { 0xFF, 0xD8, 0xFF }, 3 },
    };

    auto matches(const ImageSignature& sig, std::span<const std::uint8_t> bytes) -> bool
    {
        if (bytes.size() < sig.length)
            return false;
        for (auto i = std::size_t { 0 }; i < sig.length; ++i)
        {
            if (sig.pattern[i] != Any && sig.pattern[i] != bytes[i])
                return false;
        }
        return true;
    }

    /// @brief Strips a "data:<mime>;base64," prefix if present.
    auto stripDataUrl(std::string_view raw) -> std::string_view
    {
        if (!raw.starts_with("data:"))
            return raw;
        auto const marker = raw.find(";base64,");
        if (marker == std::string_view::npos)
            return raw;
        return raw.substr(marker + 8);
    }

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    auto toResult(ContentBlock block) -> ResultContent
    {
        if (auto* image = std::get_if<ImageBlock>(&block))
            return std::move(*image);
        if (auto* text = std::get_if<TextBlock>(&block))
            return std::move(*text);
        return TextBlock {};
    }
} // namespace

auto detectImageMime(std::span<const std::uint8_t> bytes) -> std::optional<std::string>
{
    for (const auto& sig: Signatures)
    {
        if (matches(sig, bytes))
            return std::string(sig.mimeType);
    }
    return std::nullopt;
}

auto ContentConverter::normalize(std::string_view raw) -> ContentBlock
{
    auto const payload = stripDataUrl(trim(raw));

    // Shortest image signature is 3 bytes, i.e. 4 base64 symbols.
    if (payload.size() >= 4)
    {
        if (auto decoded = base64::decode(payload))
        {
            if (auto mime = detectImageMime(*decoded))
            {
                log::debug("Tool output classified as {} ({} bytes)", *mime, decoded->size());
                return ImageBlock { .mimeType = std::move(*mime), .bytes = std::move(*decoded) };
            }
        }
    }

    return TextBlock { std::string(raw) };
}

auto ContentConverter::normalizeResult(std::string_view raw) -> ResultContent
{
    return toResult(normalize(raw));
}

auto ContentConverter::fromMcpItem(const nlohmann::json& item) -> ResultContent
{
    auto const type = json::getStringOr(item, "type", "");

    if (type == "text")
        return normalizeResult(json::getStringOr(item, "text", ""));

    if (type == "image")
    {
        auto const data = json::getStringOr(item, "data", "");
        if (auto decoded = base64::decode(data))
        {
            auto mime = json::getStringOr(item, "mimeType", "");
            if (mime.empty())
                mime = detectImageMime(*decoded).value_or("application/octet-stream");
            return ImageBlock { .mimeType = std::move(mime), .bytes = std::move(*decoded) };
        }
        log::warning("MCP image item carried malformed base64 data, keeping it as text");
        return TextBlock { data };
    }

    // resource, audio and unknown item types are handed to the model verbatim
    return TextBlock { json::dumpSafe(item, 2) };
}

} // namespace rigchat
