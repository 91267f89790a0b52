// SPDX-License-Identifier: Apache-2.0
#include "Cancellation.hpp"

namespace rigchat
{

auto CancellationController::begin() -> std::stop_token
{
    _handle.emplace();
    return _handle->source.get_token();
}

auto CancellationController::cancel() -> bool
{
    if (!_handle)
        return false;
    return _handle->source.request_stop();
}

void CancellationController::finish()
{
    _handle.reset();
}

auto CancellationController::active() const -> bool
{
    return _handle.has_value();
}

auto CancellationController::cancelled() const -> bool
{
    return _handle && _handle->source.stop_requested();
}

auto CancellationController::elapsed() const -> std::chrono::steady_clock::duration
{
    if (!_handle)
        return {};
    return std::chrono::steady_clock::now() - _handle->startedAt;
}

} // namespace rigchat
