// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace rigchat
{

/// @brief Error codes for categorizing failures across the agent core.
enum class ErrorCode
{
    Unknown,
    InvalidRequest,
    InvalidArguments,
    UnknownTool,
    ToolExecutionError,
    Unreachable,
    Timeout,
    Cancelled,
    McpServerUnreachable,
    TransportError,
    ProtocolError,
    ConfigError,
    IoError,
};

/// @brief Returns a short, stable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidRequest: return "invalid-request";
        case ErrorCode::InvalidArguments: return "invalid-arguments";
        case ErrorCode::UnknownTool: return "unknown-tool";
        case ErrorCode::ToolExecutionError: return "tool-execution";
        case ErrorCode::Unreachable: return "unreachable";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::McpServerUnreachable: return "mcp-server-unreachable";
        case ErrorCode::TransportError: return "transport";
        case ErrorCode::ProtocolError: return "protocol";
        case ErrorCode::ConfigError: return "config";
        case ErrorCode::IoError: return "io";
    }
    return "unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

/// @brief Returns true for request errors after which the user may simply retry.
[[nodiscard]] constexpr auto isTransient(ErrorCode code) -> bool
{
    return code == ErrorCode::Unreachable || code == ErrorCode::Timeout;
}

} // namespace rigchat

template <>
struct std::formatter<rigchat::Error>: std::formatter<std::string>
{
    auto format(const rigchat::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", rigchat::errorCodeName(error.code), error.message), ctx);
    }
};
