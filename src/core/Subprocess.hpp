// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <stop_token>
#include <string>
#include <vector>

namespace rigchat
{

/// @brief Bytes kept per captured stream; the rest is drained and dropped.
constexpr auto MaxCapturedBytes = std::size_t { 256 * 1024 };

/// @brief Describes a child process to run.
struct ProcessRequest
{
    std::string program;
    std::vector<std::string> args;
    std::string workingDirectory; ///< Empty inherits the current directory.
};

/// @brief Captured result of a finished child process.
struct ProcessOutput
{
    int exitCode = -1; ///< Exit status, or 128 + signal number if the child was killed.
    std::string standardOutput;
    std::string standardError;
    bool truncated = false;
};

/// @brief Runs a program to completion, capturing stdout and stderr.
///
/// The program is looked up in PATH. stdin is connected to /dev/null.
/// If @p stopToken is signalled while the child runs, the child is terminated
/// and ErrorCode::Cancelled is returned.
/// @return The captured output, or ToolExecutionError if the process could not be spawned.
[[nodiscard]] auto runProcess(const ProcessRequest& request, std::stop_token stopToken) -> Result<ProcessOutput>;

} // namespace rigchat
