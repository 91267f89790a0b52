// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <rigchat/App.hpp>
#include <rigchat/Config.hpp>

#include <CLI/CLI.hpp>

#include <filesystem>
#include <format>
#include <print>
#include <string>
#include <vector>

namespace
{

auto importServers(const std::string& sourcePath, const std::string& configPath) -> int
{
    auto content = rigchat::readTextInput(sourcePath);
    if (!content)
    {
        rigchat::log::error("{}", content.error().message);
        return 1;
    }

    auto servers = rigchat::parseMcpServersJson(*content);
    if (!servers)
    {
        rigchat::log::error("Invalid MCP config: {}", servers.error().message);
        return 1;
    }
    if (servers->empty())
    {
        std::println(stderr, "No MCP servers with an HTTP URL found in {}", sourcePath);
        return 1;
    }

    auto const targetPath = configPath.empty() ? rigchat::defaultConfigPath() : configPath;
    auto config = rigchat::AppConfig {};
    if (std::filesystem::exists(targetPath))
    {
        auto existing = rigchat::loadConfigFromFile(targetPath);
        if (!existing)
        {
            rigchat::log::error("Failed to load config: {}", existing.error().message);
            return 1;
        }
        config = std::move(*existing);
    }

    for (auto& server: *servers)
    {
        std::erase_if(config.mcp.servers, [&](const rigchat::McpServer& s) { return s.id == server.id; });
        std::println("  {} -> {}", server.id, server.url);
        config.mcp.servers.push_back(std::move(server));
    }

    if (auto saved = rigchat::saveConfigToFile(targetPath, config); !saved)
    {
        rigchat::log::error("{}", saved.error().message);
        return 1;
    }

    std::println("Saved {} MCP server(s) to {}", servers->size(), targetPath);
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "rigchat - Ollama coding assistant with local tools and MCP servers" };

    auto modelName = std::string {};
    auto host = std::string {};
    auto configPath = std::string {};
    auto logFile = std::string {};
    auto mcpConfig = std::string {};
    auto mcpRemotes = std::vector<std::string> {};
    auto setupMcp = std::string {};
    auto yolo = false;
    auto verbose = false;

    app.add_option("-m,--model", modelName, "Ollama model name")->envname("OLLAMA_MODEL");
    app.add_option("--host", host, "Ollama endpoint, e.g. http://localhost:11434");
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--log-file", logFile, "Append log lines to this file");
    app.add_option("--mcp-config", mcpConfig, "Load MCP servers from a pcli2-mcp client config (- for stdin)");
    app.add_option("--mcp-remote", mcpRemotes, "Connect to an MCP server URL for this session (repeatable)");
    app.add_option("--setup-mcp", setupMcp, "Import MCP servers from a client config into the config file and exit");
    app.add_flag("-y,--yolo", yolo, "Run tool calls without asking for confirmation");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        rigchat::log::setLevel(rigchat::log::Level::Debug);

    if (!logFile.empty() && !rigchat::log::setLogFile(logFile))
        rigchat::log::warning("Cannot open log file {}", logFile);

    if (!setupMcp.empty())
        return importServers(setupMcp, configPath);

    // Load config
    auto configResult = configPath.empty() ? rigchat::loadConfig() : rigchat::loadConfigFromFile(configPath);

    if (!configResult)
    {
        rigchat::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!modelName.empty())
        config.model.name = modelName;
    if (!host.empty())
        config.model.host = host;
    if (yolo)
        config.agent.autoConfirm = true;

    auto sessionServers = std::vector<rigchat::McpServer> {};
    if (!mcpConfig.empty())
    {
        auto content = rigchat::readTextInput(mcpConfig);
        if (!content)
        {
            rigchat::log::error("{}", content.error().message);
            return 1;
        }
        auto servers = rigchat::parseMcpServersJson(*content);
        if (!servers)
        {
            rigchat::log::error("Invalid MCP config: {}", servers.error().message);
            return 1;
        }
        if (servers->empty())
            rigchat::log::warning("No MCP servers with an HTTP URL found in {}", mcpConfig);
        sessionServers = std::move(*servers);
    }

    for (const auto& url: mcpRemotes)
    {
        sessionServers.push_back(rigchat::McpServer {
            .id = std::format("remote-{}", sessionServers.size()),
            .url = url,
            .enabled = true,
            .authToken = std::nullopt,
            .sessionOnly = true,
        });
    }

    auto application = rigchat::App(std::move(config), std::move(sessionServers));
    auto initResult = application.initialize();
    if (!initResult)
    {
        rigchat::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
