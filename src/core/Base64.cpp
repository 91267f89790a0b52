// SPDX-License-Identifier: Apache-2.0
#include "Base64.hpp"

#include <array>

namespace rigchat::base64
{

namespace
{
    constexpr auto Alphabet =
        std::string_view { "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/" };

    constexpr auto Invalid = std::uint8_t { 0xFF };

    constexpr auto DecodeTable = [] {
        auto table = std::array<std::uint8_t, 256> {};
        table.fill(Invalid);
        for (auto i = std::size_t { 0 }; i < Alphabet.size(); ++i)
            table[static_cast<unsigned char>(Alphabet[i])] = static_cast<std::uint8_t>(i);
        return table;
    }();

    constexpr auto isSpace(char ch) -> bool
    {
        return ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t';
    }
} // namespace

auto encode(std::span<const std::uint8_t> bytes) -> std::string
{
    auto out = std::string {};
    out.reserve(((bytes.size() + 2) / 3) * 4);

    auto i = std::size_t { 0 };
    for (; i + 2 < bytes.size(); i += 3)
    {
        auto const n = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
        out += Alphabet[(n >> 18) & 0x3F];
        out += Alphabet[(n >> 12) & 0x3F];
        out += Alphabet[(n >> 6) & 0x3F];
        out += Alphabet[n & 0x3F];
    }

    auto const rest = bytes.size() - i;
    if (rest == 1)
    {
        auto const n = bytes[i] << 16;
        out += Alphabet[(n >> 18) & 0x3F];
        out += Alphabet[(n >> 12) & 0x3F];
        out += "==";
    }
    else if (rest == 2)
    {
        auto const n = (bytes[i] << 16) | (bytes[i + 1] << 8);
        out += Alphabet[(n >> 18) & 0x3F];
        out += Alphabet[(n >> 12) & 0x3F];
        out += Alphabet[(n >> 6) & 0x3F];
        out += '=';
    }

    return out;
}

auto decode(std::string_view text) -> std::optional<std::vector<std::uint8_t>>
{
    auto symbols = std::string {};
    symbols.reserve(text.size());
    auto padding = 0;

    for (auto const ch: text)
    {
        if (isSpace(ch))
            continue;
        if (ch == '=')
        {
            ++padding;
            continue;
        }
        // data after padding
        if (padding > 0)
            return std::nullopt;
        if (DecodeTable[static_cast<unsigned char>(ch)] == Invalid)
            return std::nullopt;
        symbols += ch;
    }

    if (symbols.empty() || padding > 2)
        return std::nullopt;

    auto const rem = symbols.size() % 4;
    if (rem == 1)
        return std::nullopt;
    if (padding > 0 && (symbols.size() + static_cast<std::size_t>(padding)) % 4 != 0)
        return std::nullopt;

    auto bytes = std::vector<std::uint8_t> {};
    bytes.reserve(symbols.size() * 3 / 4);

    auto buffer = std::uint32_t { 0 };
    auto bits = 0;
    for (auto const ch: symbols)
    {
        buffer = (buffer << 6) | DecodeTable[static_cast<unsigned char>(ch)];
        bits += 6;
        if (bits >= 8)
        {
            bits -= 8;
            bytes.push_back(static_cast<std::uint8_t>((buffer >> bits) & 0xFF));
        }
    }

    // Leftover bits of the final symbol must be zero in canonical encoding.
    if (bits > 0 && (buffer & ((1u << bits) - 1)) != 0)
        return std::nullopt;

    return bytes;
}

} // namespace rigchat::base64
