// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <format>

namespace rigchat::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error"))
    {
        auto const& err = message["error"];
        if (!err.is_object())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC error member is not an object");

        response.error = RpcError {
            .code = err.value("code", 0),
            .message = err.value("message", "Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }
    else if (!message.contains("method"))
    {
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");
    }

    return response;
}

auto isResponseTo(const nlohmann::json& message, int64_t id) -> bool
{
    if (!message.is_object() || message.contains("method") || !message.contains("id"))
        return false;

    auto const& msgId = message["id"];
    if (msgId.is_number_integer())
        return msgId.get<int64_t>() == id;
    // Some servers echo ids back as strings.
    if (msgId.is_string())
        return msgId.get<std::string>() == std::to_string(id);
    return false;
}

auto unwrapResult(const nlohmann::json& message, int64_t expectedId) -> Result<nlohmann::json>
{
    return parseResponse(message).and_then([&](const Response& resp) -> Result<nlohmann::json> {
        if (!isResponseTo(message, expectedId))
            return makeError(ErrorCode::ProtocolError,
                             std::format("Response id {} does not match request id {}", resp.id.dump(), expectedId));
        if (resp.error)
            return makeError(ErrorCode::ProtocolError,
                             std::format("RPC error {}: {}", resp.error->code, resp.error->message));
        return resp.result.value_or(nlohmann::json::object());
    });
}

} // namespace rigchat::jsonrpc
