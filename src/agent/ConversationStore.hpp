// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstdint>
#include <memory>
#include <vector>

namespace rigchat
{

/// @brief The ordered, append-only conversation history.
///
/// snapshot() hands out an immutable copy that stays valid across later
/// appends, so a request in flight never observes a changing history.
/// clear() empties the history and bumps generation(); anything captured
/// under an older generation must be treated as stale.
///
/// Owned and written by the control loop only.
class ConversationStore
{
  public:
    ConversationStore();

    void append(Message message);

    [[nodiscard]] auto snapshot() const -> std::shared_ptr<const std::vector<Message>>;

    void clear();

    [[nodiscard]] auto generation() const noexcept -> uint64_t { return _generation; }
    [[nodiscard]] auto size() const noexcept -> size_t { return _messages->size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return _messages->empty(); }
    [[nodiscard]] auto at(size_t index) const -> const Message& { return _messages->at(index); }

  private:
    // Copy-on-write: appends replace the vector when a snapshot still shares it.
    std::shared_ptr<std::vector<Message>> _messages;
    uint64_t _generation = 0;
};

} // namespace rigchat
