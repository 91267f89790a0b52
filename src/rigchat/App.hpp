// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <rigchat/Config.hpp>

#include <memory>
#include <vector>

namespace rigchat
{

/// @brief Wires the conversation, tools, MCP servers and model into an interactive console session.
class App
{
  public:
    /// @brief Constructs the application.
    /// @param config The application configuration.
    /// @param sessionServers Servers given on the command line; used for this run only.
    explicit App(AppConfig config, std::vector<McpServer> sessionServers = {});
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Registers MCP servers and, if configured, connects to them.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the main interactive loop.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace rigchat
