// SPDX-License-Identifier: Apache-2.0
#include "SchemaValidator.hpp"

#include <format>
#include <string>

namespace rigchat
{

namespace
{
    auto typeMatches(std::string_view type, const nlohmann::json& value) -> bool
    {
        if (type == "string")
            return value.is_string();
        if (type == "integer")
            return value.is_number_integer();
        if (type == "number")
            return value.is_number();
        if (type == "boolean")
            return value.is_boolean();
        if (type == "array")
            return value.is_array();
        if (type == "object")
            return value.is_object();
        if (type == "null")
            return value.is_null();
        return true;
    }

    auto describe(const nlohmann::json& value) -> std::string_view
    {
        return value.type_name();
    }

    auto validateValue(const nlohmann::json& schema, const nlohmann::json& value, const std::string& path)
        -> VoidResult
    {
        if (!schema.is_object())
            return {};

        if (schema.contains("type"))
        {
            auto const& type = schema["type"];
            auto ok = true;
            if (type.is_string())
                ok = typeMatches(type.get<std::string>(), value);
            else if (type.is_array())
            {
                ok = false;
                for (const auto& alt: type)
                    ok = ok || (alt.is_string() && typeMatches(alt.get<std::string>(), value));
            }

            if (!ok)
                return makeError(
                    ErrorCode::InvalidArguments,
                    std::format("'{}' must be of type {}, got {}", path, type.dump(), describe(value)));
        }

        if (value.is_object())
        {
            auto const properties = schema.value("properties", nlohmann::json::object());

            if (schema.contains("required") && schema["required"].is_array())
            {
                for (const auto& key: schema["required"])
                {
                    if (key.is_string() && !value.contains(key.get<std::string>()))
                        return makeError(ErrorCode::InvalidArguments,
                                         std::format("Missing required argument '{}'",
                                                     path.empty() ? key.get<std::string>()
                                                                  : path + "." + key.get<std::string>()));
                }
            }

            auto const closed = schema.contains("additionalProperties")
                                && schema["additionalProperties"].is_boolean()
                                && !schema["additionalProperties"].get<bool>();

            for (const auto& [key, item]: value.items())
            {
                auto const childPath = path.empty() ? key : path + "." + key;
                if (properties.is_object() && properties.contains(key))
                {
                    if (auto r = validateValue(properties[key], item, childPath); !r)
                        return r;
                }
                else if (closed)
                {
                    return makeError(ErrorCode::InvalidArguments,
                                     std::format("Unexpected argument '{}'", childPath));
                }
            }
        }
        else if (value.is_array() && schema.contains("items"))
        {
            for (auto i = std::size_t { 0 }; i < value.size(); ++i)
            {
                if (auto r = validateValue(schema["items"], value[i], std::format("{}[{}]", path, i)); !r)
                    return r;
            }
        }

        return {};
    }
} // namespace

auto validateArguments(const nlohmann::json& schema, const nlohmann::json& arguments) -> VoidResult
{
    if (!arguments.is_object())
        return makeError(ErrorCode::InvalidArguments,
                         std::format("Arguments must be a JSON object, got {}", describe(arguments)));
    return validateValue(schema, arguments, "");
}

} // namespace rigchat
