// SPDX-License-Identifier: Apache-2.0
#include "BuiltinTools.hpp"

#include <content/ContentConverter.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Subprocess.hpp>

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>

namespace rigchat
{

namespace fs = std::filesystem;

namespace
{
    constexpr auto MaxReadBytes = std::uintmax_t { 512 * 1024 };

    auto stringProperty(std::string_view description) -> nlohmann::json
    {
        return nlohmann::json { { "type", "string" }, { "description", description } };
    }

    auto objectSchema(nlohmann::json properties, std::vector<std::string> required) -> nlohmann::json
    {
        return nlohmann::json {
            { "type", "object" },
            { "properties", std::move(properties) },
            { "required", std::move(required) },
        };
    }

    auto resolveIn(const std::string& base, const std::string& path) -> fs::path
    {
        auto p = fs::path(path);
        if (p.is_relative() && !base.empty())
            return fs::path(base) / p;
        return p;
    }

    class ReadFileTool: public Tool
    {
      public:
        explicit ReadFileTool(std::string workingDirectory): _workingDirectory(std::move(workingDirectory)) {}

        auto name() const -> std::string_view override { return "read_file"; }
        auto description() const -> std::string_view override { return "Read the contents of a file"; }

        auto inputSchema() const -> nlohmann::json override
        {
            return objectSchema({ { "path", stringProperty("Path to the file to read") } }, { "path" });
        }

        auto execute(const nlohmann::json& arguments, std::stop_token) -> Result<ToolResultBlock> override
        {
            auto const path = arguments["path"].get<std::string>();
            auto const file = resolveIn(_workingDirectory, path);

            auto ec = std::error_code {};
            if (!fs::is_regular_file(file, ec))
                return makeError(ErrorCode::ToolExecutionError, std::format("Not a readable file: {}", path));

            auto const size = fs::file_size(file, ec);
            if (ec)
                return makeError(ErrorCode::ToolExecutionError,
                                 std::format("Failed to read file {}: {}", path, ec.message()));

            auto in = std::ifstream(file, std::ios::binary);
            if (!in)
                return makeError(ErrorCode::ToolExecutionError, std::format("Failed to open file: {}", path));

            auto bytes = std::vector<std::uint8_t>(static_cast<std::size_t>(std::min(size, MaxReadBytes)));
            in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            bytes.resize(static_cast<std::size_t>(in.gcount()));

            if (auto mime = detectImageMime(bytes); mime && size <= MaxReadBytes)
            {
                auto result = makeTextResult(std::format("Image file {} ({}, {} bytes)", path, *mime, size));
                result.content.emplace_back(ImageBlock { .mimeType = std::move(*mime), .bytes = std::move(bytes) });
                return result;
            }

            auto text = std::format("Contents of {}:\n\n", path);
            text.append(bytes.begin(), bytes.end());
            if (size > MaxReadBytes)
                text += std::format("\n[truncated after {} of {} bytes]", MaxReadBytes, size);
            return makeTextResult(std::move(text));
        }

      private:
        std::string _workingDirectory;
    };

    class WriteFileTool: public Tool
    {
      public:
        explicit WriteFileTool(std::string workingDirectory): _workingDirectory(std::move(workingDirectory)) {}

        auto name() const -> std::string_view override { return "write_file"; }
        auto description() const -> std::string_view override { return "Write contents to a file"; }

        auto inputSchema() const -> nlohmann::json override
        {
            return objectSchema(
                {
                    { "path", stringProperty("Path to the file to write") },
                    { "content", stringProperty("Contents to write to the file") },
                },
                { "path", "content" });
        }

        auto execute(const nlohmann::json& arguments, std::stop_token) -> Result<ToolResultBlock> override
        {
            auto const path = arguments["path"].get<std::string>();
            auto const content = arguments["content"].get<std::string>();

            auto out = std::ofstream(resolveIn(_workingDirectory, path), std::ios::binary | std::ios::trunc);
            if (!out)
                return makeError(ErrorCode::ToolExecutionError, std::format("Failed to write file: {}", path));

            out << content;
            out.close();
            if (!out)
                return makeError(ErrorCode::ToolExecutionError, std::format("Failed to write file: {}", path));

            return makeTextResult(std::format("Successfully wrote {} bytes to {}", content.size(), path));
        }

      private:
        std::string _workingDirectory;
    };

    class ListDirectoryTool: public Tool
    {
      public:
        explicit ListDirectoryTool(std::string workingDirectory):
            _workingDirectory(std::move(workingDirectory))
        {
        }

        auto name() const -> std::string_view override { return "list_directory"; }
        auto description() const -> std::string_view override { return "List the contents of a directory"; }

        auto inputSchema() const -> nlohmann::json override
        {
            return objectSchema({ { "path", stringProperty("Path to the directory to list") } }, { "path" });
        }

        auto execute(const nlohmann::json& arguments, std::stop_token) -> Result<ToolResultBlock> override
        {
            auto const path = arguments["path"].get<std::string>();

            auto ec = std::error_code {};
            auto it = fs::directory_iterator(resolveIn(_workingDirectory, path), ec);
            if (ec)
                return makeError(ErrorCode::ToolExecutionError,
                                 std::format("Failed to read directory {}: {}", path, ec.message()));

            auto names = std::vector<std::string> {};
            for (const auto& entry: it)
            {
                auto entryName = entry.path().filename().string();
                if (entry.is_directory(ec))
                    entryName += '/';
                names.push_back(std::move(entryName));
            }
            std::ranges::sort(names);

            auto text = std::format("Contents of {}:\n\n", path);
            for (const auto& n: names)
                text += n + '\n';
            return makeTextResult(std::move(text));
        }

      private:
        std::string _workingDirectory;
    };

    class RunCommandTool: public Tool
    {
      public:
        explicit RunCommandTool(std::string workingDirectory): _workingDirectory(std::move(workingDirectory)) {}

        auto name() const -> std::string_view override { return "run_command"; }
        auto description() const -> std::string_view override { return "Run a shell command"; }

        auto inputSchema() const -> nlohmann::json override
        {
            return objectSchema(
                {
                    { "command", stringProperty("Command to run") },
                    { "cwd", stringProperty("Working directory for the command") },
                },
                { "command" });
        }

        auto execute(const nlohmann::json& arguments, std::stop_token stopToken)
            -> Result<ToolResultBlock> override
        {
            auto const command = arguments["command"].get<std::string>();
            auto const cwd = json::getStringOr(arguments, "cwd", _workingDirectory);

            auto output = runProcess(
                ProcessRequest { .program = "bash", .args = { "-c", command }, .workingDirectory = cwd },
                std::move(stopToken));
            if (!output)
                return std::unexpected(output.error());

            auto text = std::format("Command: {}\n\n", command);
            if (!output->standardOutput.empty())
                text += std::format("STDOUT:\n{}\n", output->standardOutput);
            if (!output->standardError.empty())
                text += std::format("STDERR:\n{}\n", output->standardError);
            if (output->truncated)
                text += "[output truncated]\n";
            text += std::format("Exit code: {}", output->exitCode);

            // A failing command is information for the model, not a tool failure.
            return makeTextResult(std::move(text), output->exitCode != 0);
        }

      private:
        std::string _workingDirectory;
    };

    class SearchCodeTool: public Tool
    {
      public:
        explicit SearchCodeTool(std::string workingDirectory): _workingDirectory(std::move(workingDirectory)) {}

        auto name() const -> std::string_view override { return "search_code"; }
        auto description() const -> std::string_view override { return "Search code with grep"; }

        auto inputSchema() const -> nlohmann::json override
        {
            return objectSchema(
                {
                    { "pattern", stringProperty("Pattern to search for") },
                    { "path", stringProperty("Directory to search in") },
                    { "glob", stringProperty("File pattern to filter (e.g., \"*.cpp\")") },
                },
                { "pattern" });
        }

        auto execute(const nlohmann::json& arguments, std::stop_token stopToken)
            -> Result<ToolResultBlock> override
        {
            auto const pattern = arguments["pattern"].get<std::string>();
            auto const path = json::getStringOr(arguments, "path", ".");
            auto const glob = json::getStringOr(arguments, "glob", "");

            auto args = std::vector<std::string> { "-rn", "--color=never" };
            if (!glob.empty())
                args.push_back("--include=" + glob);
            args.insert(args.end(), { "-e", pattern, "--", path });

            auto output = runProcess(
                ProcessRequest { .program = "grep", .args = std::move(args), .workingDirectory = _workingDirectory },
                std::move(stopToken));
            if (!output)
                return std::unexpected(output.error());

            // grep: 0 = matches, 1 = no matches, 2 = trouble
            if (output->exitCode == 1 || (output->exitCode == 0 && output->standardOutput.empty()))
                return makeTextResult("No matches found.");
            if (output->exitCode != 0)
                return makeTextResult(std::format("Search failed: {}", output->standardError), true);

            auto text = std::format("Search results for '{}':\n\n{}", pattern, output->standardOutput);
            if (output->truncated)
                text += "\n[output truncated]";
            return makeTextResult(std::move(text));
        }

      private:
        std::string _workingDirectory;
    };
} // namespace

auto makeBuiltinTools(std::string workingDirectory) -> std::vector<std::unique_ptr<Tool>>
{
    auto tools = std::vector<std::unique_ptr<Tool>> {};
    tools.push_back(std::make_unique<ReadFileTool>(workingDirectory));
    tools.push_back(std::make_unique<WriteFileTool>(workingDirectory));
    tools.push_back(std::make_unique<ListDirectoryTool>(workingDirectory));
    tools.push_back(std::make_unique<RunCommandTool>(workingDirectory));
    tools.push_back(std::make_unique<SearchCodeTool>(std::move(workingDirectory)));
    return tools;
}

} // namespace rigchat
