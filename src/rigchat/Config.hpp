// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <llm/OllamaProtocol.hpp>
#include <mcp/McpClientManager.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace rigchat
{

/// @brief Model endpoint configuration section.
struct ModelSettings
{
    std::string name = std::string(ollama::DefaultModel);
    std::string host = std::string(ollama::DefaultHost);
    std::string systemPrompt; ///< Empty selects the built-in prompt.
    int requestTimeoutSeconds = 300;
    int connectTimeoutSeconds = 10;
};

/// @brief Agent loop configuration section.
struct AgentSettings
{
    bool autoConfirm = false;
    int maxToolSteps = 10;
    int maxRetries = 0;
};

/// @brief MCP configuration section.
struct McpSettings
{
    int refreshIntervalSeconds = 300;
    bool eagerConnect = true;
    std::vector<McpServer> servers;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    ModelSettings model;
    AgentSettings agent;
    McpSettings mcp;
};

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration, defaults if no file exists, or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses configuration JSON text. Missing fields take their defaults.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file. Session-only servers are not written.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Parses a pcli2-mcp style client configuration into servers.
///
/// Accepts `{"mcpServers": {name: {"url": ...}}}` and the `mcp-remote` form
/// `{"mcpServers": {name: {"command": ..., "args": [..., "http://..."]}}}`, where
/// the first http(s) argument is taken as the URL. Entries without a URL are skipped.
[[nodiscard]] auto parseMcpServersJson(std::string_view content) -> Result<std::vector<McpServer>>;

/// @brief Reads a whole file, or standard input when @p path is "-".
[[nodiscard]] auto readTextInput(std::string_view path) -> Result<std::string>;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace rigchat
