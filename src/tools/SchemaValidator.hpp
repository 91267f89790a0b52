// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

namespace rigchat
{

/// @brief Validates tool arguments against a JSON schema.
///
/// Understands the subset tool schemas use in practice: `type`, `properties`,
/// `required`, `items` and `additionalProperties: false`. Unknown keywords are
/// ignored. Failures are reported as ErrorCode::InvalidArguments.
[[nodiscard]] auto validateArguments(const nlohmann::json& schema, const nlohmann::json& arguments)
    -> VoidResult;

} // namespace rigchat
