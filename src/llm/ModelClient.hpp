// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <functional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace rigchat
{

/// @brief Callback invoked for each streamed fragment of assistant text.
using TokenCallback = std::function<void(std::string_view token)>;

/// @brief A cancellable request to a chat model endpoint.
///
/// Implementations must observe the stop token while connecting and while
/// receiving, and return ErrorCode::Cancelled promptly once it is signalled.
/// Network failures surface as ErrorCode::Unreachable or ErrorCode::Timeout;
/// no retry happens at this level.
class ModelClient
{
  public:
    virtual ~ModelClient() = default;

    /// @brief Sends the conversation and returns final text or tool calls.
    /// @param history The conversation, oldest first.
    /// @param tools The tool catalog presented to the model. May be empty.
    /// @param stopToken Cancels the request.
    /// @param onToken Optional streaming callback. Invoked on the calling thread.
    [[nodiscard]] virtual auto send(const std::vector<Message>& history,
                                    const std::vector<ToolDescriptor>& tools,
                                    std::stop_token stopToken,
                                    const TokenCallback& onToken = {}) -> Result<ModelTurn> = 0;

    [[nodiscard]] virtual auto modelName() const -> std::string = 0;

    virtual void setModelName(std::string name) = 0;
};

} // namespace rigchat
