// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <stop_token>
#include <string>
#include <string_view>

namespace rigchat
{

/// @brief Receives response body bytes as they arrive.
using HttpChunkCallback = std::function<void(std::string_view chunk)>;

/// @brief An HTTP POST request.
struct HttpRequest
{
    std::string url;
    std::string body;
    std::map<std::string, std::string> headers;
    std::chrono::seconds timeout { 300 };
    std::chrono::seconds connectTimeout { 10 };
};

/// @brief A received HTTP response. Header names are lower-cased.
struct HttpResponse
{
    long status = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    [[nodiscard]] auto ok() const -> bool { return status >= 200 && status < 300; }

    [[nodiscard]] auto header(std::string_view name) const -> std::string
    {
        auto const it = headers.find(std::string(name));
        return it != headers.end() ? it->second : std::string {};
    }
};

/// @brief Performs a blocking HTTP POST via libcurl.
///
/// The stop token is checked while connecting and on every received chunk;
/// once signalled the transfer is aborted and ErrorCode::Cancelled returned.
/// Connection failures map to ErrorCode::Unreachable, expired timeouts to
/// ErrorCode::Timeout. Non-2xx statuses are not errors at this level.
/// @param onChunk Optional callback for streamed receipt; the body is accumulated either way.
[[nodiscard]] auto httpPost(const HttpRequest& request,
                            std::stop_token stopToken,
                            const HttpChunkCallback& onChunk = {}) -> Result<HttpResponse>;

} // namespace rigchat
