// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <tools/Tool.hpp>

#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace rigchat
{

/// @brief Holds the local tools and runs them by name.
class ToolRegistry
{
  public:
    ToolRegistry();
    ~ToolRegistry();

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    /// @brief Creates a registry holding the built-in tools.
    /// @param workingDirectory Default directory for run_command and search_code.
    [[nodiscard]] static auto withBuiltinTools(std::string workingDirectory = ".")
        -> std::unique_ptr<ToolRegistry>;

    /// @brief Adds a tool. A tool with the same name is replaced.
    void registerTool(std::unique_ptr<Tool> tool);

    /// @brief Returns the descriptors of all registered tools, sorted by name.
    [[nodiscard]] auto list() const -> std::vector<ToolDescriptor>;

    /// @brief Returns true if a tool with the given name is registered.
    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    /// @brief Validates the arguments and runs the named tool.
    ///
    /// A schema mismatch fails with InvalidArguments without running the tool.
    /// Conditions the model should see (e.g. non-zero exit codes) come back as
    /// a successful result with isError set.
    /// @param stopToken Signalled when the surrounding request is cancelled.
    /// @return A ToolResultBlock wrapped in a ContentBlock, or an error.
    [[nodiscard]] auto invoke(std::string_view name,
                              const nlohmann::json& arguments,
                              std::stop_token stopToken = {}) -> Result<ContentBlock>;

  private:
    std::vector<std::unique_ptr<Tool>> _tools;

    [[nodiscard]] auto find(std::string_view name) const -> Tool*;
};

} // namespace rigchat
