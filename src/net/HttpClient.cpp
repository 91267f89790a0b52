// SPDX-License-Identifier: Apache-2.0
#include "HttpClient.hpp"

#include <core/Log.hpp>

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <format>
#include <memory>
#include <mutex>

namespace rigchat
{

namespace
{
    void ensureCurlInitialized()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    struct CurlDeleter
    {
        void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
    };

    struct SlistDeleter
    {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };

    /// @brief State shared with the curl callbacks of one transfer.
    struct TransferContext
    {
        std::stop_token stopToken;
        const HttpChunkCallback* onChunk = nullptr;
        HttpResponse response;
    };

    // Returning a short count aborts the transfer with CURLE_WRITE_ERROR.
    auto writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t
    {
        auto* ctx = static_cast<TransferContext*>(userdata);
        auto const total = size * nmemb;
        if (ctx->stopToken.stop_requested())
            return 0;

        auto const chunk = std::string_view(ptr, total);
        ctx->response.body.append(chunk);
        if (ctx->onChunk && *ctx->onChunk)
            (*ctx->onChunk)(chunk);
        return total;
    }

    auto headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) -> size_t
    {
        auto* ctx = static_cast<TransferContext*>(userdata);
        auto const total = size * nitems;
        auto const line = std::string_view(buffer, total);

        auto const colon = line.find(':');
        if (colon != std::string_view::npos)
        {
            auto name = std::string(line.substr(0, colon));
            std::ranges::transform(name, name.begin(), [](unsigned char c) { return std::tolower(c); });
            auto value = line.substr(colon + 1);
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
                value.remove_prefix(1);
            while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' '))
                value.remove_suffix(1);
            ctx->response.headers[std::move(name)] = std::string(value);
        }
        return total;
    }

    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
    auto progressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int
    {
        auto* ctx = static_cast<TransferContext*>(userdata);
        return ctx->stopToken.stop_requested() ? 1 : 0;
    }

    auto classify(CURLcode code) -> ErrorCode
    {
        switch (code)
        {
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_COULDNT_CONNECT:
            case CURLE_SEND_ERROR:
            case CURLE_RECV_ERROR:
            case CURLE_GOT_NOTHING: return ErrorCode::Unreachable;
            case CURLE_OPERATION_TIMEDOUT: return ErrorCode::Timeout;
            default: return ErrorCode::TransportError;
        }
    }
} // namespace

auto httpPost(const HttpRequest& request, std::stop_token stopToken, const HttpChunkCallback& onChunk)
    -> Result<HttpResponse>
{
    ensureCurlInitialized();

    if (stopToken.stop_requested())
        return makeError(ErrorCode::Cancelled, "Request cancelled");

    auto curl = std::unique_ptr<CURL, CurlDeleter>(curl_easy_init());
    if (!curl)
        return makeError(ErrorCode::TransportError, "Failed to initialize libcurl");

    auto headerList = std::unique_ptr<curl_slist, SlistDeleter>();
    for (const auto& [name, value]: request.headers)
    {
        auto const line = std::format("{}: {}", name, value);
        auto* appended = curl_slist_append(headerList.get(), line.c_str());
        if (!appended)
            return makeError(ErrorCode::TransportError, "Failed to build request headers");
        (void) headerList.release();
        headerList.reset(appended);
    }

    auto ctx = TransferContext { .stopToken = stopToken, .onChunk = &onChunk, .response = {} };

    auto* const h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headerList.get());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(request.connectTimeout.count()));

    log::trace("POST {} ({} bytes)", request.url, request.body.size());

    auto const code = curl_easy_perform(h);

    if (stopToken.stop_requested())
        return makeError(ErrorCode::Cancelled, "Request cancelled");

    if (code != CURLE_OK)
        return makeError(classify(code), std::format("POST {} failed: {}", request.url, curl_easy_strerror(code)));

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &ctx.response.status);
    log::trace("POST {} -> HTTP {}", request.url, ctx.response.status);
    return std::move(ctx.response);
}

} // namespace rigchat
