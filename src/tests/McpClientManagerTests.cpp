// SPDX-License-Identifier: Apache-2.0
#include <mcp/McpClientManager.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <map>
#include <optional>
#include <semaphore>
#include <thread>

using namespace rigchat;

namespace
{

/// @brief In-process MCP server answering initialize, tools/list and tools/call.
struct FakeServer
{
    bool reachable = true;
    std::vector<std::string> toolNames;
    nlohmann::json callContent = nlohmann::json::array({ { { "type", "text" }, { "text", "ok" } } });
    bool callIsError = false;
    std::optional<int> callRpcError;
    bool cancelList = false; ///< tools/list reports a cancelled exchange.
    bool blockCalls = false; ///< tools/call waits for releaseCall.
    std::binary_semaphore callStarted { 0 };
    std::binary_semaphore releaseCall { 0 };
    int connects = 0;
    std::vector<nlohmann::json> calls;
    std::atomic<int> transportsClosed = 0;
};

class FakeServerTransport: public Transport
{
  public:
    explicit FakeServerTransport(std::shared_ptr<FakeServer> server): _server(std::move(server)) {}
    ~FakeServerTransport() override { ++_server->transportsClosed; }

    auto roundTrip(const nlohmann::json& message, std::stop_token) -> Result<nlohmann::json> override
    {
        if (!_server->reachable)
            return makeError(ErrorCode::Unreachable, "connection refused");

        auto const method = message["method"].get<std::string>();
        auto reply = nlohmann::json { { "jsonrpc", "2.0" }, { "id", message["id"] } };

        if (method == "initialize")
        {
            ++_server->connects;
            reply["result"] = {
                { "protocolVersion", "2024-11-05" },
                { "serverInfo", { { "name", "fake" }, { "version", "1" } } },
                { "capabilities", { { "tools", nlohmann::json::object() } } },
            };
        }
        else if (method == "tools/list")
        {
            if (_server->cancelList)
                return makeError(ErrorCode::Cancelled, "Request cancelled");
            auto tools = nlohmann::json::array();
            for (const auto& name: _server->toolNames)
                tools.push_back({ { "name", name },
                                  { "description", "fake " + name },
                                  { "inputSchema", { { "type", "object" } } } });
            reply["result"] = { { "tools", tools } };
        }
        else if (method == "tools/call")
        {
            if (_server->blockCalls)
            {
                _server->callStarted.release();
                _server->releaseCall.acquire();
            }
            _server->calls.push_back(message["params"]);
            if (_server->callRpcError)
                reply["error"] = { { "code", *_server->callRpcError }, { "message", "bad arguments" } };
            else
                reply["result"] = { { "content", _server->callContent }, { "isError", _server->callIsError } };
        }
        return reply;
    }

    auto notify(const nlohmann::json&) -> VoidResult override { return {}; }

  private:
    std::shared_ptr<FakeServer> _server;
};

/// @brief Manager wired to fake servers keyed by URL.
struct Fixture
{
    std::map<std::string, std::shared_ptr<FakeServer>> servers;
    McpClientManager manager { [this](const McpServer& server) -> std::unique_ptr<Transport> {
        auto const it = servers.find(server.url);
        if (it == servers.end())
            return nullptr;
        return std::make_unique<FakeServerTransport>(it->second);
    } };

    auto add(std::string id, std::vector<std::string> tools) -> std::shared_ptr<FakeServer>
    {
        auto server = std::make_shared<FakeServer>();
        server->toolNames = std::move(tools);
        auto url = "http://" + id + "/mcp";
        servers[url] = server;
        auto added = manager.addServer(McpServer {
            .id = std::move(id), .url = url, .enabled = true, .authToken = std::nullopt, .sessionOnly = false });
        REQUIRE(added.has_value());
        return server;
    }

    auto status(std::string_view id) const -> McpServerStatus
    {
        for (const auto& report: manager.statuses())
            if (report.id == id)
                return report.status;
        FAIL("no such server");
        return McpServerStatus::Disconnected;
    }
};

} // namespace

TEST_CASE("McpClientManager rejects duplicate and empty server ids", "[mcp-manager]")
{
    auto fixture = Fixture {};
    fixture.add("pcli2", {});

    auto duplicate = fixture.manager.addServer(McpServer { .id = "pcli2", .url = "http://other/mcp" });
    REQUIRE(!duplicate.has_value());
    CHECK(duplicate.error().code == ErrorCode::InvalidRequest);

    auto empty = fixture.manager.addServer(McpServer { .id = "", .url = "http://x/mcp" });
    REQUIRE(!empty.has_value());
    CHECK(empty.error().code == ErrorCode::InvalidRequest);

    CHECK(fixture.manager.serverCount() == 1);
}

TEST_CASE("McpClientManager discovers tools of reachable servers", "[mcp-manager]")
{
    auto fixture = Fixture {};
    fixture.add("pcli2", { "pcli2_list_folders", "pcli2_geometric_match" });

    CHECK(fixture.manager.listTools().empty());
    fixture.manager.refresh(true);

    CHECK(fixture.status("pcli2") == McpServerStatus::Connected);
    auto const tools = fixture.manager.listTools();
    REQUIRE(tools.size() == 2);
    CHECK(tools[0].name == "pcli2_list_folders");
    CHECK(tools[0].originalName == "pcli2_list_folders");
    CHECK(tools[0].isRemote());
    REQUIRE(std::holds_alternative<RemoteOrigin>(tools[0].origin));
    CHECK(std::get<RemoteOrigin>(tools[0].origin).serverId == "pcli2");
}

TEST_CASE("McpClientManager isolates an unreachable server", "[mcp-manager]")
{
    auto fixture = Fixture {};
    fixture.add("good", { "alpha" });
    auto bad = fixture.add("bad", { "beta" });
    bad->reachable = false;

    fixture.manager.refresh(true);

    CHECK(fixture.status("good") == McpServerStatus::Connected);
    CHECK(fixture.status("bad") == McpServerStatus::Unreachable);

    auto const tools = fixture.manager.listTools();
    REQUIRE(tools.size() == 1);
    CHECK(tools[0].name == "alpha");

    auto const reports = fixture.manager.statuses();
    REQUIRE(reports.size() == 2);
    CHECK(reports[1].lastError.find("connection refused") != std::string::npos);
}

TEST_CASE("McpClientManager refreshIfStale does not reconnect within the interval", "[mcp-manager]")
{
    auto fixture = Fixture {};
    auto server = fixture.add("pcli2", { "alpha" });

    fixture.manager.refreshIfStale();
    fixture.manager.refreshIfStale();
    CHECK(server->connects == 1);

    server->toolNames.push_back("beta");
    fixture.manager.refresh(true);
    CHECK(server->connects == 1); // session reused
    CHECK(fixture.manager.listTools().size() == 2);
}

TEST_CASE("McpClientManager invoke converts content and keeps isError", "[mcp-manager]")
{
    auto fixture = Fixture {};
    auto server = fixture.add("pcli2", { "pcli2_list_folders" });
    server->callContent = nlohmann::json::array({
        { { "type", "text" }, { "text", "folder A" } },
        { { "type", "image" }, { "mimeType", "image/png" }, { "data", "iVBORw0K" } },
    });
    server->callIsError = true;
    fixture.manager.refresh(true);

    auto result = fixture.manager.invoke("pcli2", "pcli2_list_folders", { { "path", "/" } });
    REQUIRE(result.has_value());
    CHECK(result->isError);
    REQUIRE(result->content.size() == 2);
    REQUIRE(std::holds_alternative<TextBlock>(result->content[0]));
    CHECK(std::get<TextBlock>(result->content[0]).text == "folder A");
    REQUIRE(std::holds_alternative<ImageBlock>(result->content[1]));
    CHECK(std::get<ImageBlock>(result->content[1]).mimeType == "image/png");

    REQUIRE(server->calls.size() == 1);
    CHECK(server->calls[0]["name"] == "pcli2_list_folders");
    CHECK(server->calls[0]["arguments"]["path"] == "/");
}

TEST_CASE("McpClientManager invoke substitutes a placeholder for empty content", "[mcp-manager]")
{
    auto fixture = Fixture {};
    auto server = fixture.add("pcli2", { "noop" });
    server->callContent = nlohmann::json::array();
    fixture.manager.refresh(true);

    auto result = fixture.manager.invoke("pcli2", "noop", nlohmann::json::object());
    REQUIRE(result.has_value());
    CHECK(textOf(*result) == "(no content)");
}

TEST_CASE("McpClientManager invoke maps RPC errors to tool execution errors", "[mcp-manager]")
{
    auto fixture = Fixture {};
    auto server = fixture.add("pcli2", { "alpha" });
    server->callRpcError = -32602;
    fixture.manager.refresh(true);

    auto result = fixture.manager.invoke("pcli2", "alpha", nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ToolExecutionError);
    CHECK(fixture.status("pcli2") == McpServerStatus::Connected);
}

TEST_CASE("McpClientManager invoke marks a server unreachable when it goes away", "[mcp-manager]")
{
    auto fixture = Fixture {};
    auto server = fixture.add("pcli2", { "alpha" });
    fixture.manager.refresh(true);
    server->reachable = false;

    auto result = fixture.manager.invoke("pcli2", "alpha", nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::McpServerUnreachable);
    CHECK(fixture.status("pcli2") == McpServerStatus::Unreachable);
    CHECK(fixture.manager.listTools().empty());

    server->reachable = true;
    fixture.manager.refresh(true);
    CHECK(fixture.status("pcli2") == McpServerStatus::Connected);
}

TEST_CASE("McpClientManager invoke on unknown or disabled servers", "[mcp-manager]")
{
    auto fixture = Fixture {};
    fixture.add("pcli2", { "alpha" });
    fixture.manager.refresh(true);

    auto unknown = fixture.manager.invoke("nope", "alpha", nlohmann::json::object());
    REQUIRE(!unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::McpServerUnreachable);

    REQUIRE(fixture.manager.setEnabled("pcli2", false).has_value());
    CHECK(fixture.status("pcli2") == McpServerStatus::Disabled);
    CHECK(fixture.manager.listTools().empty());

    auto disabled = fixture.manager.invoke("pcli2", "alpha", nlohmann::json::object());
    REQUIRE(!disabled.has_value());
    CHECK(disabled.error().code == ErrorCode::McpServerUnreachable);

    REQUIRE(fixture.manager.setEnabled("pcli2", true).has_value());
    fixture.manager.refresh(false);
    CHECK(fixture.status("pcli2") == McpServerStatus::Connected);
}

TEST_CASE("McpClientManager removeServer drops its tools", "[mcp-manager]")
{
    auto fixture = Fixture {};
    fixture.add("a", { "alpha" });
    fixture.add("b", { "beta" });
    fixture.manager.refresh(true);
    REQUIRE(fixture.manager.listTools().size() == 2);

    REQUIRE(fixture.manager.removeServer("a").has_value());
    CHECK(!fixture.manager.hasServer("a"));
    auto const tools = fixture.manager.listTools();
    REQUIRE(tools.size() == 1);
    CHECK(tools[0].name == "beta");

    auto again = fixture.manager.removeServer("a");
    REQUIRE(!again.has_value());
    CHECK(again.error().code == ErrorCode::InvalidRequest);
}

TEST_CASE("McpClientManager does not connect when already stopped", "[mcp-manager]")
{
    auto fixture = Fixture {};
    auto server = fixture.add("pcli2", { "alpha" });

    auto source = std::stop_source {};
    source.request_stop();
    fixture.manager.refresh(true, source.get_token());

    CHECK(server->connects == 0);
    CHECK(fixture.status("pcli2") == McpServerStatus::Disconnected);
}

TEST_CASE("McpClientManager drops the tools of a server whose refresh was cancelled", "[mcp-manager]")
{
    auto fixture = Fixture {};
    auto server = fixture.add("pcli2", { "list_folders" });
    fixture.manager.refresh(true);
    REQUIRE(fixture.status("pcli2") == McpServerStatus::Connected);

    server->cancelList = true;
    fixture.manager.refresh(true);
    CHECK(fixture.status("pcli2") == McpServerStatus::Disconnected);
    CHECK(fixture.manager.listTools().empty());

    auto const call = fixture.manager.invoke("pcli2", "list_folders", nlohmann::json::object());
    REQUIRE(!call.has_value());
    CHECK(call.error().code == ErrorCode::McpServerUnreachable);

    // The next stale check reconnects without waiting for the refresh interval.
    server->cancelList = false;
    fixture.manager.refreshIfStale();
    CHECK(fixture.status("pcli2") == McpServerStatus::Connected);
    CHECK(fixture.manager.listTools().size() == 1);
    CHECK(server->connects == 2);
}

TEST_CASE("McpClientManager tears a server down after the call in flight returns", "[mcp-manager]")
{
    auto fixture = Fixture {};
    auto server = fixture.add("pcli2", { "slow" });
    fixture.manager.refresh(true);
    REQUIRE(fixture.status("pcli2") == McpServerStatus::Connected);
    server->blockCalls = true;

    auto result = std::optional<Result<ToolResultBlock>> {};
    auto call = std::jthread([&] { result = fixture.manager.invoke("pcli2", "slow", nlohmann::json::object()); });
    server->callStarted.acquire();

    SECTION("disabled")
    {
        REQUIRE(fixture.manager.setEnabled("pcli2", false).has_value());
        CHECK(fixture.status("pcli2") == McpServerStatus::Disabled);
    }

    SECTION("removed")
    {
        REQUIRE(fixture.manager.removeServer("pcli2").has_value());
        CHECK(!fixture.manager.hasServer("pcli2"));
    }

    CHECK(server->transportsClosed.load() == 0);
    server->releaseCall.release();
    call.join();

    REQUIRE(result.has_value());
    CHECK(result->has_value());
    CHECK(server->transportsClosed.load() == 1);
    CHECK(fixture.manager.listTools().empty());
}

TEST_CASE("McpClientManager refresh stops waiting for a busy server when cancelled", "[mcp-manager]")
{
    auto fixture = Fixture {};
    auto server = fixture.add("pcli2", { "slow" });
    fixture.manager.refresh(true);
    REQUIRE(fixture.status("pcli2") == McpServerStatus::Connected);
    server->blockCalls = true;

    auto result = std::optional<Result<ToolResultBlock>> {};
    auto call = std::jthread([&] { result = fixture.manager.invoke("pcli2", "slow", nlohmann::json::object()); });
    server->callStarted.acquire();

    auto refreshed = std::atomic<bool> { false };
    auto refresher = std::jthread([&](std::stop_token stopToken) {
        fixture.manager.refresh(true, stopToken);
        refreshed = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    CHECK(!refreshed.load());

    refresher.request_stop();
    refresher.join();
    CHECK(refreshed.load());
    CHECK(server->connects == 1);

    server->releaseCall.release();
    call.join();
    REQUIRE(result.has_value());
    CHECK(result->has_value());
    CHECK(fixture.status("pcli2") == McpServerStatus::Connected);
}

TEST_CASE("McpClientManager invoke gives up waiting for a busy server when cancelled", "[mcp-manager]")
{
    auto fixture = Fixture {};
    auto server = fixture.add("pcli2", { "slow" });
    fixture.manager.refresh(true);
    server->blockCalls = true;

    auto first = std::jthread([&] { (void) fixture.manager.invoke("pcli2", "slow", nlohmann::json::object()); });
    server->callStarted.acquire();

    auto stop = std::stop_source {};
    stop.request_stop();
    auto const second = fixture.manager.invoke("pcli2", "slow", nlohmann::json::object(), stop.get_token());
    REQUIRE(!second.has_value());
    CHECK(second.error().code == ErrorCode::Cancelled);

    server->releaseCall.release();
    first.join();
    CHECK(server->calls.size() == 1);
}
