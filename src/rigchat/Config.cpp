// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>

namespace rigchat
{

namespace
{
    auto parseServer(const nlohmann::json& serverJson) -> std::optional<McpServer>
    {
        auto server = McpServer {
            .id = json::getStringOr(serverJson, "id", ""),
            .url = json::getStringOr(serverJson, "url", ""),
            .enabled = json::getBoolOr(serverJson, "enabled", true),
            .authToken = std::nullopt,
            .sessionOnly = false,
        };
        if (server.id.empty() || server.url.empty())
            return std::nullopt;

        if (auto token = json::getStringOr(serverJson, "authToken", ""); !token.empty())
            server.authToken = std::move(token);
        return server;
    }

    auto isHttpUrl(std::string_view text) -> bool
    {
        return text.starts_with("http://") || text.starts_with("https://");
    }
} // namespace

auto defaultConfigDir() -> std::string
{
#if defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/rigchat";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/rigchat";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/rigchat";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto readTextInput(std::string_view path) -> Result<std::string>
{
    if (path == "-")
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());

    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    return ss.str();
}

auto parseConfig(std::string_view content) -> Result<AppConfig>
{
    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, parseResult.error().message);

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto config = AppConfig {};

    // Model section
    if (root.contains("model"))
    {
        auto const& model = root["model"];
        config.model.name = json::getStringOr(model, "name", config.model.name);
        config.model.host = json::getStringOr(model, "host", config.model.host);
        config.model.systemPrompt = json::getStringOr(model, "systemPrompt", "");
        config.model.requestTimeoutSeconds =
            json::getIntOr(model, "requestTimeoutSeconds", config.model.requestTimeoutSeconds);
        config.model.connectTimeoutSeconds =
            json::getIntOr(model, "connectTimeoutSeconds", config.model.connectTimeoutSeconds);
    }

    // Agent section
    if (root.contains("agent"))
    {
        auto const& agent = root["agent"];
        config.agent.autoConfirm = json::getBoolOr(agent, "autoConfirm", false);
        config.agent.maxToolSteps = json::getIntOr(agent, "maxToolSteps", config.agent.maxToolSteps);
        config.agent.maxRetries = json::getIntOr(agent, "maxRetries", config.agent.maxRetries);
    }

    // MCP section
    if (root.contains("mcp"))
    {
        auto const& mcp = root["mcp"];
        config.mcp.refreshIntervalSeconds =
            json::getIntOr(mcp, "refreshIntervalSeconds", config.mcp.refreshIntervalSeconds);
        config.mcp.eagerConnect = json::getBoolOr(mcp, "eagerConnect", config.mcp.eagerConnect);

        if (mcp.is_object() && mcp.contains("servers") && mcp["servers"].is_array())
        {
            for (const auto& serverJson: mcp["servers"])
            {
                if (auto server = parseServer(serverJson))
                    config.mcp.servers.push_back(std::move(*server));
                else
                    log::warning("Skipping MCP server entry without id or url: {}", json::dumpSafe(serverJson));
            }
        }
    }

    if (config.agent.maxToolSteps < 0 || config.agent.maxRetries < 0 || config.mcp.refreshIntervalSeconds < 0
        || config.model.requestTimeoutSeconds <= 0 || config.model.connectTimeoutSeconds <= 0)
        return makeError(ErrorCode::ConfigError, "Config contains a negative limit or a non-positive timeout");

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto content = readTextInput(path);
    if (!content)
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    return parseConfig(*content).transform_error([&](Error error) {
        error.message = std::format("{}: {}", path, error.message);
        return error;
    });
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    // Model section
    auto model = nlohmann::json::object();
    model["name"] = config.model.name;
    model["host"] = config.model.host;
    if (!config.model.systemPrompt.empty())
        model["systemPrompt"] = config.model.systemPrompt;
    model["requestTimeoutSeconds"] = config.model.requestTimeoutSeconds;
    model["connectTimeoutSeconds"] = config.model.connectTimeoutSeconds;
    root["model"] = std::move(model);

    // Agent section
    auto agent = nlohmann::json::object();
    agent["autoConfirm"] = config.agent.autoConfirm;
    agent["maxToolSteps"] = config.agent.maxToolSteps;
    agent["maxRetries"] = config.agent.maxRetries;
    root["agent"] = std::move(agent);

    // MCP section
    auto mcp = nlohmann::json::object();
    mcp["refreshIntervalSeconds"] = config.mcp.refreshIntervalSeconds;
    mcp["eagerConnect"] = config.mcp.eagerConnect;
    auto servers = nlohmann::json::array();
    for (const auto& server: config.mcp.servers)
    {
        if (server.sessionOnly)
            continue;
        auto entry = nlohmann::json {
            { "id", server.id },
            { "url", server.url },
            { "enabled", server.enabled },
        };
        if (server.authToken)
            entry["authToken"] = *server.authToken;
        servers.push_back(std::move(entry));
    }
    mcp["servers"] = std::move(servers);
    root["mcp"] = std::move(mcp);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Failed to write config file: {}", path));
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto parseMcpServersJson(std::string_view content) -> Result<std::vector<McpServer>>
{
    auto parsed = json::parse(content);
    if (!parsed)
        return makeError(ErrorCode::ConfigError, parsed.error().message);

    auto servers = std::vector<McpServer> {};
    auto const& root = *parsed;
    if (!root.is_object() || !root.contains("mcpServers") || !root["mcpServers"].is_object())
        return servers;

    for (const auto& [name, serverJson]: root["mcpServers"].items())
    {
        auto url = json::getStringOr(serverJson, "url", "");
        if (url.empty())
        {
            for (const auto& arg: json::getStringList(serverJson, "args"))
            {
                if (isHttpUrl(arg))
                {
                    url = arg;
                    break;
                }
            }
        }

        if (url.empty())
        {
            log::debug("Skipping MCP server '{}' without an HTTP URL", name);
            continue;
        }

        log::debug("Parsed MCP server: {} -> {}", name, url);
        servers.push_back(McpServer {
            .id = name,
            .url = std::move(url),
            .enabled = true,
            .authToken = std::nullopt,
            .sessionOnly = false,
        });
    }
    return servers;
}

} // namespace rigchat
