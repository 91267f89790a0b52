// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tools/Tool.hpp>

#include <memory>
#include <string>
#include <vector>

namespace rigchat
{

/// @brief Creates read_file, write_file, list_directory, run_command and search_code.
/// @param workingDirectory Directory commands and searches run in unless told otherwise.
[[nodiscard]] auto makeBuiltinTools(std::string workingDirectory) -> std::vector<std::unique_ptr<Tool>>;

} // namespace rigchat
