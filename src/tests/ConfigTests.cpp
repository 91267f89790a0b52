// SPDX-License-Identifier: Apache-2.0
#include <rigchat/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace rigchat;

TEST_CASE("defaultConfigDir returns a non-empty path", "[config]")
{
    auto const dir = defaultConfigDir();
    REQUIRE(!dir.empty());
}

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("config.json"));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.model.name == "qwen2.5-coder:3b");
    CHECK(config.model.host == "http://localhost:11434");
    CHECK(config.model.systemPrompt.empty());
    CHECK(config.agent.autoConfirm == false);
    CHECK(config.agent.maxToolSteps == 10);
    CHECK(config.agent.maxRetries == 0);
    CHECK(config.mcp.refreshIntervalSeconds == 300);
    CHECK(config.mcp.servers.empty());
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "rigchat_test_config.json";
    {
        auto file = std::ofstream(tempPath);
        file << R"({
            "model": {
                "name": "llama3.2",
                "host": "http://gpu-box:11434",
                "systemPrompt": "Test prompt",
                "requestTimeoutSeconds": 120
            },
            "agent": {
                "autoConfirm": true,
                "maxToolSteps": 5,
                "maxRetries": 2
            },
            "mcp": {
                "refreshIntervalSeconds": 60,
                "eagerConnect": false,
                "servers": [
                    { "id": "pcli2", "url": "http://localhost:8080/mcp", "authToken": "t0ken" },
                    { "id": "off", "url": "http://localhost:9090/mcp", "enabled": false },
                    { "url": "http://nameless/mcp" }
                ]
            }
        })";
    }

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());

    auto const& config = *result;

    SECTION("Model config")
    {
        CHECK(config.model.name == "llama3.2");
        CHECK(config.model.host == "http://gpu-box:11434");
        CHECK(config.model.systemPrompt == "Test prompt");
        CHECK(config.model.requestTimeoutSeconds == 120);
        CHECK(config.model.connectTimeoutSeconds == 10);
    }

    SECTION("Agent config")
    {
        CHECK(config.agent.autoConfirm == true);
        CHECK(config.agent.maxToolSteps == 5);
        CHECK(config.agent.maxRetries == 2);
    }

    SECTION("MCP server config")
    {
        CHECK(config.mcp.refreshIntervalSeconds == 60);
        CHECK(config.mcp.eagerConnect == false);
        REQUIRE(config.mcp.servers.size() == 2);
        CHECK(config.mcp.servers[0].id == "pcli2");
        CHECK(config.mcp.servers[0].authToken == "t0ken");
        CHECK(config.mcp.servers[0].enabled);
        CHECK(config.mcp.servers[1].id == "off");
        CHECK(!config.mcp.servers[1].enabled);
        CHECK(!config.mcp.servers[1].authToken.has_value());
    }

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile fails for a missing file", "[config]")
{
    auto result = loadConfigFromFile("/nonexistent/rigchat/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("parseConfig rejects malformed content", "[config]")
{
    auto invalid = parseConfig("{ not json");
    REQUIRE(!invalid.has_value());
    CHECK(invalid.error().code == ErrorCode::ConfigError);

    auto notObject = parseConfig("[1, 2]");
    REQUIRE(!notObject.has_value());
    CHECK(notObject.error().code == ErrorCode::ConfigError);

    auto negative = parseConfig(R"({ "agent": { "maxToolSteps": -1 } })");
    REQUIRE(!negative.has_value());
    CHECK(negative.error().code == ErrorCode::ConfigError);

    auto zeroTimeout = parseConfig(R"({ "model": { "connectTimeoutSeconds": 0 } })");
    REQUIRE(!zeroTimeout.has_value());
}

TEST_CASE("parseConfig uses defaults for absent sections", "[config]")
{
    auto result = parseConfig("{}");
    REQUIRE(result.has_value());
    CHECK(result->model.name == "qwen2.5-coder:3b");
    CHECK(result->agent.maxToolSteps == 10);
    CHECK(result->mcp.eagerConnect);
}

TEST_CASE("saveConfigToFile writes a config that loads back, without session servers", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "rigchat_test_save" / "config.json";
    std::filesystem::remove_all(tempPath.parent_path());

    auto config = AppConfig {};
    config.model.name = "llama3.2";
    config.agent.maxRetries = 1;
    config.mcp.servers.push_back(McpServer { .id = "kept", .url = "http://a/mcp", .enabled = false });
    config.mcp.servers.push_back(McpServer {
        .id = "session", .url = "http://b/mcp", .enabled = true, .authToken = std::nullopt, .sessionOnly = true });

    REQUIRE(saveConfigToFile(tempPath.string(), config).has_value());

    auto loaded = loadConfigFromFile(tempPath.string());
    REQUIRE(loaded.has_value());
    CHECK(loaded->model.name == "llama3.2");
    CHECK(loaded->agent.maxRetries == 1);
    REQUIRE(loaded->mcp.servers.size() == 1);
    CHECK(loaded->mcp.servers[0].id == "kept");
    CHECK(!loaded->mcp.servers[0].enabled);

    std::filesystem::remove_all(tempPath.parent_path());
}

TEST_CASE("parseMcpServersJson reads the MCP client config format", "[config]")
{
    auto result = parseMcpServersJson(R"({
        "mcpServers": {
            "pcli2": {
                "command": "npx",
                "args": ["mcp-remote", "http://localhost:8080/mcp", "--allow-http"]
            },
            "direct": { "url": "https://mcp.example.com/mcp" },
            "stdio-only": { "command": "some-server", "args": ["--stdio"] }
        }
    })");

    REQUIRE(result.has_value());
    REQUIRE(result->size() == 2);

    auto const find = [&](std::string_view id) -> const McpServer* {
        for (const auto& server: *result)
            if (server.id == id)
                return &server;
        return nullptr;
    };

    auto const* pcli2 = find("pcli2");
    REQUIRE(pcli2 != nullptr);
    CHECK(pcli2->url == "http://localhost:8080/mcp");

    auto const* direct = find("direct");
    REQUIRE(direct != nullptr);
    CHECK(direct->url == "https://mcp.example.com/mcp");

    CHECK(find("stdio-only") == nullptr);
}

TEST_CASE("parseMcpServersJson tolerates configs without servers", "[config]")
{
    auto empty = parseMcpServersJson(R"({ "other": 1 })");
    REQUIRE(empty.has_value());
    CHECK(empty->empty());

    auto invalid = parseMcpServersJson("nope");
    REQUIRE(!invalid.has_value());
    CHECK(invalid.error().code == ErrorCode::ConfigError);
}
