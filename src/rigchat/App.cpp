// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <agent/ConversationStore.hpp>
#include <agent/Orchestrator.hpp>
#include <agent/ToolCatalog.hpp>
#include <core/Channel.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <llm/OllamaClient.hpp>
#include <mcp/McpClientManager.hpp>
#include <rigchat/Commands.hpp>
#include <tools/ToolRegistry.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <format>
#include <optional>
#include <print>
#include <thread>

#include <poll.h>
#include <unistd.h>

namespace rigchat
{

namespace
{
    std::atomic<bool> interruptRequested = false;

    void onInterrupt(int)
    {
        interruptRequested.store(true);
    }

    struct McpRefreshDone
    {
        bool cancelled = false;
    };

    struct InputLine
    {
        std::string text;
        bool endOfInput = false;
    };

    /// @brief Reads stdin line by line until EOF or until stopped.
    void readInput(std::stop_token stopToken, Channel<InputLine>& lines)
    {
        auto buffer = std::string {};
        auto chunk = std::array<char, 4096> {};

        auto postCompleteLines = [&] {
            auto pos = size_t { 0 };
            for (auto eol = buffer.find('\n'); eol != std::string::npos; eol = buffer.find('\n', pos))
            {
                auto line = buffer.substr(pos, eol - pos);
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                lines.post(InputLine { .text = std::move(line), .endOfInput = false });
                pos = eol + 1;
            }
            buffer.erase(0, pos);
        };

        while (!stopToken.stop_requested())
        {
            auto pfd = pollfd { .fd = STDIN_FILENO, .events = POLLIN, .revents = 0 };
            auto const rc = ::poll(&pfd, 1, 100);
            if (rc < 0 && errno == EINTR)
                continue;
            if (rc < 0)
            {
                log::error("Polling standard input failed: {}", std::strerror(errno));
                break;
            }
            if (rc == 0)
                continue;

            auto const n = ::read(STDIN_FILENO, chunk.data(), chunk.size());
            if (n < 0 && (errno == EINTR || errno == EAGAIN))
                continue;
            if (n <= 0)
                break;

            buffer.append(chunk.data(), static_cast<size_t>(n));
            postCompleteLines();
        }

        if (!buffer.empty())
            lines.post(InputLine { .text = std::move(buffer), .endOfInput = false });
        lines.post(InputLine { .text = {}, .endOfInput = true });
    }

    auto firstLine(std::string_view text, size_t maxLength) -> std::string
    {
        auto line = text.substr(0, text.find('\n'));
        if (line.size() > maxLength)
            return std::format("{}...", line.substr(0, maxLength));
        if (line.size() < text.size())
            return std::format("{} ...", line);
        return std::string(line);
    }

    auto summarize(const ToolResultBlock& result) -> std::string
    {
        auto summary = firstLine(textOf(result), 160);
        for (const auto& item: result.content)
        {
            if (auto const* image = std::get_if<ImageBlock>(&item))
                summary += std::format(" [image {}, {} bytes]", image->mimeType, image->bytes.size());
        }
        return summary;
    }

    auto originLabel(const ToolDescriptor& tool) -> std::string
    {
        if (auto const* remote = std::get_if<RemoteOrigin>(&tool.origin))
            return std::format("mcp:{}", remote->serverId);
        return "local";
    }
} // namespace

struct App::Impl
{
    AppConfig config;
    std::vector<McpServer> sessionServers;
    ConversationStore store;
    std::unique_ptr<ToolRegistry> registry;
    McpClientManager servers;
    OllamaClient model;
    ToolDispatcher dispatcher;
    Orchestrator orchestrator;
    Channel<InputLine> input;
    Channel<McpRefreshDone> mcpDone;

    bool running = true;
    bool inputClosed = false;
    bool streamed = false;

    // Declared last: joined before the servers it refreshes are destroyed.
    std::optional<std::jthread> mcpRefresh;

    Impl(AppConfig cfg, std::vector<McpServer> session):
        config(std::move(cfg)),
        sessionServers(std::move(session)),
        registry(ToolRegistry::withBuiltinTools(".")),
        servers(makeHttpTransportFactory(std::chrono::seconds(config.model.requestTimeoutSeconds),
                                         std::chrono::seconds(config.model.connectTimeoutSeconds)),
                std::chrono::seconds(config.mcp.refreshIntervalSeconds)),
        model(OllamaConfig {
            .host = config.model.host,
            .model = config.model.name,
            .systemPrompt = config.model.systemPrompt,
            .requestTimeout = std::chrono::seconds(config.model.requestTimeoutSeconds),
            .connectTimeout = std::chrono::seconds(config.model.connectTimeoutSeconds),
        }),
        dispatcher(*registry, servers),
        orchestrator(store,
                     model,
                     dispatcher,
                     OrchestratorConfig {
                         .autoConfirm = config.agent.autoConfirm,
                         .maxToolSteps = config.agent.maxToolSteps,
                         .maxRetries = config.agent.maxRetries,
                     })
    {
        orchestrator.setListener(OrchestratorListener {
            .onStateChanged = [this](OrchestratorState state) { onStateChanged(state); },
            .onMessageAppended = [this](const Message& message) { onMessageAppended(message); },
            .onConfirmationRequested = [this](const PendingConfirmation& pending) { askConfirmation(pending); },
            .onToken =
                [this](std::string_view token) {
                    streamed = true;
                    std::print("{}", token);
                    std::fflush(stdout);
                },
            .onNotice = [](std::string_view text) { std::println("! {}", text); },
            .onTurnFinished = [this](const TurnOutcome& outcome) { onTurnFinished(outcome); },
        });
    }

    // --- Orchestrator observers ---

    void onStateChanged(OrchestratorState state)
    {
        if (state == OrchestratorState::AwaitingModel)
        {
            streamed = false;
            std::println("thinking...");
        }
    }

    void onMessageAppended(const Message& message)
    {
        if (message.role == Role::Assistant)
        {
            if (streamed)
                std::println("");
            else
                std::println("{}", textOf(message));
            return;
        }

        if (message.role != Role::Tool)
            return;

        if (streamed)
        {
            std::println("");
            streamed = false;
        }

        auto const* result = findToolResult(message);
        for (const auto& block: message.content)
        {
            if (auto const* call = std::get_if<ToolCallBlock>(&block); call && result)
                std::println("[{}{}] {}", call->toolName, result->isError ? " failed" : "", summarize(*result));
        }
    }

    void askConfirmation(const PendingConfirmation& pending)
    {
        if (streamed)
        {
            std::println("");
            streamed = false;
        }
        std::println("Tool call: {} {}", pending.toolCall.toolName, json::dumpSafe(pending.toolCall.arguments));
        if (pending.tool.isRemote())
            std::println("  (provided by {})", originLabel(pending.tool));
        std::print("Execute? [Y/n] ");
        std::fflush(stdout);
    }

    void onTurnFinished(const TurnOutcome& outcome)
    {
        switch (outcome.status)
        {
            case TurnStatus::Completed: break;
            case TurnStatus::Cancelled: std::println("\nRequest cancelled."); break;
            case TurnStatus::Failed:
                std::println("\nError: {}", outcome.error ? outcome.error->message : outcome.text);
                break;
        }
        streamed = false;
        prompt();
    }

    void prompt()
    {
        if (orchestrator.busy() || mcpRefresh || inputClosed)
            return;
        std::print("\n> ");
        std::fflush(stdout);
    }

    // --- Input handling ---

    void handleInterrupt()
    {
        auto const cancelledTurn = orchestrator.cancel();
        auto const cancelledRefresh = cancelMcpRefresh();
        if (cancelledTurn || cancelledRefresh)
            return;
        std::println("\nNothing to cancel. Type /quit to exit.");
        prompt();
    }

    void handleLine(const std::string& line)
    {
        if (auto command = parseCommand(line))
        {
            handleCommand(*command);
            return;
        }

        if (orchestrator.pending())
        {
            handleConfirmationAnswer(line);
            return;
        }

        switch (orchestrator.submit(line))
        {
            case SubmitStatus::Started: break;
            case SubmitStatus::Queued:
                std::println("(queued; {} message(s) waiting)", orchestrator.queuedCount());
                break;
            case SubmitStatus::Ignored: prompt(); break;
        }
    }

    void handleConfirmationAnswer(std::string_view answer)
    {
        while (!answer.empty() && std::isspace(static_cast<unsigned char>(answer.back())))
            answer.remove_suffix(1);
        while (!answer.empty() && std::isspace(static_cast<unsigned char>(answer.front())))
            answer.remove_prefix(1);

        auto result = VoidResult {};
        if (answer.empty() || answer == "y" || answer == "Y" || answer == "yes")
            result = orchestrator.confirm();
        else if (answer == "n" || answer == "N" || answer == "no")
            result = orchestrator.decline();
        else
        {
            std::print("Please answer y or n (or /cancel): ");
            std::fflush(stdout);
            return;
        }

        if (!result)
            std::println("{}", result.error().message);
    }

    void handleCommand(const Command& command)
    {
        if (!isKnownCommand(command.name))
        {
            std::println("Unknown command: /{}. Type /help for available commands.", command.name);
            if (!orchestrator.pending())
                prompt();
            return;
        }

        if (command.name == "quit")
        {
            running = false;
            return;
        }

        if (command.name == "help")
            std::println("{}", helpText());
        else if (command.name == "clear")
        {
            orchestrator.clearConversation();
            std::println("Conversation cleared.");
        }
        else if (command.name == "model")
            handleModelCommand(command.args);
        else if (command.name == "yolo")
        {
            orchestrator.setAutoConfirm(!orchestrator.autoConfirm());
            std::println("Auto-confirm is now {}.", orchestrator.autoConfirm() ? "ON (tools run without asking)" : "OFF");
        }
        else if (command.name == "cancel")
        {
            auto const cancelledTurn = orchestrator.cancel();
            auto const cancelledRefresh = cancelMcpRefresh();
            if (!cancelledTurn && !cancelledRefresh)
                std::println("Nothing to cancel.");
            return;
        }
        else if (command.name == "tools")
            printTools();
        else if (command.name == "mcp")
            handleMcpCommand(command.args);
        else if (command.name == "logs")
        {
            for (const auto& line: log::recent(50))
                std::println("{}", line);
        }

        if (!orchestrator.pending())
            prompt();
    }

    void handleModelCommand(const std::vector<std::string>& args)
    {
        if (args.empty())
        {
            std::println("Model: {} at {}", model.modelName(), model.host());
            return;
        }
        if (orchestrator.busy())
        {
            std::println("Cannot change the model while a request is in flight.");
            return;
        }
        model.setModelName(args.front());
        log::info("Model changed to {}", args.front());
        std::println("Model set to {}.", args.front());
    }

    void printTools()
    {
        auto const catalog = dispatcher.currentCatalog();
        std::println("{} tool(s):", catalog.size());
        for (const auto& tool: catalog.tools())
            std::println("  {:<24} [{}] {}", tool.name, originLabel(tool), firstLine(tool.description, 80));
    }

    void printServerStatuses()
    {
        auto const reports = servers.statuses();
        if (reports.empty())
        {
            std::println("No MCP servers configured. Use /mcp add <url> to add one.");
            return;
        }
        for (const auto& report: reports)
        {
            std::println("  {:<16} {:<12} {:>3} tool(s)  {}{}",
                         report.id,
                         statusName(report.status),
                         report.toolCount,
                         report.url,
                         report.sessionOnly ? "  (session)" : "");
            if (!report.lastError.empty())
                std::println("  {:<16} last error: {}", "", report.lastError);
        }
    }

    // --- MCP refresh task ---

    /// @brief Connects servers on a worker; the loop prints the outcome once it reports back.
    void startMcpRefresh(bool force)
    {
        if (mcpRefresh)
        {
            std::println("An MCP refresh is already running; /cancel stops it.");
            return;
        }
        mcpRefresh.emplace([this, force](std::stop_token stopToken) {
            servers.refresh(force, stopToken);
            mcpDone.post(McpRefreshDone { .cancelled = stopToken.stop_requested() });
        });
    }

    auto cancelMcpRefresh() -> bool
    {
        if (!mcpRefresh)
            return false;
        log::info("Cancelling MCP refresh");
        mcpRefresh->request_stop();
        return true;
    }

    void finishMcpRefresh(const McpRefreshDone& done)
    {
        mcpRefresh.reset();
        if (done.cancelled)
            std::println("\nMCP refresh cancelled.");
        printServerStatuses();
        if (!orchestrator.pending())
            prompt();
    }

    void handleMcpCommand(const std::vector<std::string>& args)
    {
        auto const sub = args.empty() ? std::string("list") : args.front();

        if (sub == "list")
        {
            printServerStatuses();
            return;
        }
        if (sub == "refresh")
        {
            std::println("Refreshing MCP servers...");
            startMcpRefresh(true);
            return;
        }
        if (sub == "add")
        {
            if (args.size() < 2)
            {
                std::println("Usage: /mcp add <url> [token]");
                return;
            }
            addSessionServer(args[1], args.size() > 2 ? std::optional<std::string>(args[2]) : std::nullopt);
            return;
        }

        auto const needsId = sub == "remove" || sub == "enable" || sub == "disable";
        if (!needsId)
        {
            std::println("Unknown MCP command: {}. Use list, refresh, add, remove, enable or disable.", sub);
            return;
        }
        if (args.size() < 2)
        {
            std::println("Usage: /mcp {} <id>", sub);
            return;
        }

        auto const& id = args[1];
        auto const result = sub == "remove" ? servers.removeServer(id) : servers.setEnabled(id, sub == "enable");
        if (!result)
        {
            std::println("{}", result.error().message);
            return;
        }
        std::println("MCP server '{}' {}.", id, sub == "remove" ? "removed" : sub + "d");
        if (sub == "enable")
            startMcpRefresh(false);
    }

    void addSessionServer(std::string url, std::optional<std::string> token)
    {
        auto index = servers.serverCount();
        auto id = std::format("remote-{}", index);
        while (servers.hasServer(id))
            id = std::format("remote-{}", ++index);

        auto added = servers.addServer(McpServer {
            .id = id,
            .url = std::move(url),
            .enabled = true,
            .authToken = std::move(token),
            .sessionOnly = true,
        });
        if (!added)
        {
            std::println("{}", added.error().message);
            return;
        }
        std::println("Added MCP server '{}'; connecting...", id);
        startMcpRefresh(false);
    }
};

App::App(AppConfig config, std::vector<McpServer> sessionServers):
    _impl(std::make_unique<Impl>(std::move(config), std::move(sessionServers)))
{
    // Keep the console readable: warnings and errors go to stderr, the rest
    // only to the history (/logs) and the optional log file.
    log::setCallback([](log::Level level, std::string_view message) {
        if (level <= log::Level::Warning || log::getLevel() >= log::Level::Debug)
            std::println(stderr, "[{}] {}", log::levelPrefix(level), message);
    });
}

App::~App()
{
    log::setCallback({});
}

auto App::initialize() -> VoidResult
{
    if (_impl->config.model.host.empty())
        return makeError(ErrorCode::ConfigError, "No model endpoint host configured");

    for (auto server: _impl->config.mcp.servers)
    {
        server.sessionOnly = false;
        if (auto added = _impl->servers.addServer(std::move(server)); !added)
            log::warning("Skipping MCP server: {}", added.error().message);
    }
    for (auto server: _impl->sessionServers)
    {
        server.sessionOnly = true;
        if (auto added = _impl->servers.addServer(std::move(server)); !added)
            log::warning("Skipping MCP server: {}", added.error().message);
    }

    auto const count = _impl->servers.serverCount();
    if (count > 0 && _impl->config.mcp.eagerConnect)
    {
        std::println("Connecting to {} MCP server(s)...", count);
        _impl->startMcpRefresh(true);
    }

    log::info("Using model {} at {}", _impl->model.modelName(), _impl->model.host());
    return {};
}

auto App::run() -> int
{
    auto const previousHandler = std::signal(SIGINT, onInterrupt);

    std::println("rigchat: {} at {}{}",
                 _impl->model.modelName(),
                 _impl->model.host(),
                 _impl->orchestrator.autoConfirm() ? " (auto-confirm ON)" : "");
    std::println("Type /help for commands, /quit to exit. Ctrl+C cancels a running request.");
    _impl->prompt();

    auto reader = std::jthread([this](std::stop_token stopToken) { readInput(stopToken, _impl->input); });

    while (_impl->running)
    {
        if (interruptRequested.exchange(false))
            _impl->handleInterrupt();

        _impl->orchestrator.pump(std::chrono::milliseconds(50));

        for (const auto& done: _impl->mcpDone.drain(std::chrono::milliseconds(0)))
            _impl->finishMcpRefresh(done);

        for (auto& line: _impl->input.drain(std::chrono::milliseconds(0)))
        {
            if (line.endOfInput)
                _impl->inputClosed = true;
            else
                _impl->handleLine(line.text);
            if (!_impl->running)
                break;
        }

        if (_impl->inputClosed)
        {
            // Nobody is left to answer a confirmation prompt.
            if (_impl->orchestrator.pending())
                _impl->orchestrator.cancel();
            if (!_impl->orchestrator.busy() && !_impl->mcpRefresh)
                _impl->running = false;
        }
    }

    reader.request_stop();
    _impl->orchestrator.cancel();
    _impl->cancelMcpRefresh();
    _impl->mcpRefresh.reset();
    _impl->servers.shutdown();
    std::signal(SIGINT, previousHandler == SIG_ERR ? SIG_DFL : previousHandler);
    std::println("");
    return 0;
}

} // namespace rigchat
