// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <optional>
#include <stop_token>

namespace rigchat
{

/// @brief The cancellation token and start time of one outstanding request.
struct RequestHandle
{
    std::stop_source source;
    std::chrono::steady_clock::time_point startedAt = std::chrono::steady_clock::now();
};

/// @brief Owns the RequestHandle of the request currently in flight.
///
/// begin() creates a fresh token for each request; cancel() signals the current
/// one and is idempotent. finish() destroys the handle once the request has
/// completed, failed or been cancelled.
class CancellationController
{
  public:
    /// @brief Starts a new request, replacing any previous handle.
    /// @return The token the request must observe.
    auto begin() -> std::stop_token;

    /// @brief Signals cancellation of the current request.
    /// @return True if this call requested the stop, false if there was nothing to cancel
    ///         or the stop had already been requested.
    auto cancel() -> bool;

    /// @brief Releases the current handle.
    void finish();

    /// @brief Returns true while a request handle exists.
    [[nodiscard]] auto active() const -> bool;

    /// @brief Returns true if the current request has been cancelled.
    [[nodiscard]] auto cancelled() const -> bool;

    /// @brief Returns the time elapsed since the current request began.
    [[nodiscard]] auto elapsed() const -> std::chrono::steady_clock::duration;

  private:
    std::optional<RequestHandle> _handle;
};

} // namespace rigchat
