// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <llm/ModelClient.hpp>
#include <llm/OllamaProtocol.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace rigchat
{

/// @brief Connection settings for an Ollama endpoint.
struct OllamaConfig
{
    std::string host = std::string(ollama::DefaultHost);
    std::string model = std::string(ollama::DefaultModel);
    std::string systemPrompt; ///< Empty selects ollama::defaultSystemPrompt().
    std::chrono::seconds requestTimeout { 300 };
    std::chrono::seconds connectTimeout { 10 };
};

/// @brief ModelClient speaking Ollama's streamed /api/chat.
class OllamaClient final: public ModelClient
{
  public:
    explicit OllamaClient(OllamaConfig config);

    [[nodiscard]] auto send(const std::vector<Message>& history,
                            const std::vector<ToolDescriptor>& tools,
                            std::stop_token stopToken,
                            const TokenCallback& onToken = {}) -> Result<ModelTurn> override;

    [[nodiscard]] auto modelName() const -> std::string override;
    void setModelName(std::string name) override;

    [[nodiscard]] auto host() const -> std::string;

  private:
    [[nodiscard]] auto config() const -> OllamaConfig;

    mutable std::mutex _mutex;
    OllamaConfig _config;
    std::atomic<uint64_t> _replyCount = 0;
};

} // namespace rigchat
