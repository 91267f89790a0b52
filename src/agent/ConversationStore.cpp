// SPDX-License-Identifier: Apache-2.0
#include "ConversationStore.hpp"

namespace rigchat
{

ConversationStore::ConversationStore(): _messages(std::make_shared<std::vector<Message>>())
{
}

void ConversationStore::append(Message message)
{
    if (_messages.use_count() > 1)
        _messages = std::make_shared<std::vector<Message>>(*_messages);
    _messages->push_back(std::move(message));
}

auto ConversationStore::snapshot() const -> std::shared_ptr<const std::vector<Message>>
{
    return _messages;
}

void ConversationStore::clear()
{
    _messages = std::make_shared<std::vector<Message>>();
    ++_generation;
}

} // namespace rigchat
