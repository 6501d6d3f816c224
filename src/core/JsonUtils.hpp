// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <concepts>
#include <string>
#include <string_view>

#include "Error.hpp"

namespace mcprunner::json
{

/// @brief Parses a JSON document.
/// @return The parsed value, or a ProtocolError describing the syntax error.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Returns the member @p key of @p obj, or nullptr if @p obj is no object or lacks it.
[[nodiscard]] inline auto find(const nlohmann::json& obj, std::string_view key) -> const nlohmann::json*
{
    if (!obj.is_object())
        return nullptr;
    auto const it = obj.find(std::string(key));
    return it != obj.end() ? &*it : nullptr;
}

/// @brief Field types the accessors below can extract.
template <typename T>
concept FieldType = std::same_as<T, std::string> || std::same_as<T, bool> || std::same_as<T, int>;

template <FieldType T>
[[nodiscard]] constexpr auto fieldTypeName() -> std::string_view
{
    if constexpr (std::same_as<T, std::string>)
        return "string";
    else if constexpr (std::same_as<T, bool>)
        return "boolean";
    else
        return "integer";
}

template <FieldType T>
[[nodiscard]] inline auto holds(const nlohmann::json& value) -> bool
{
    if constexpr (std::same_as<T, std::string>)
        return value.is_string();
    else if constexpr (std::same_as<T, bool>)
        return value.is_boolean();
    else
        return value.is_number_integer();
}

/// @brief Extracts a required field.
/// @return The value, or an InvalidArgument error naming the field.
template <FieldType T>
[[nodiscard]] auto get(const nlohmann::json& obj, std::string_view key) -> Result<T>
{
    auto const* const value = find(obj, key);
    if (!value || !holds<T>(*value))
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Missing or invalid {} field: {}", fieldTypeName<T>(), key));
    return value->get<T>();
}

/// @brief Extracts an optional field, falling back to @p defaultValue when it is missing or mistyped.
template <FieldType T>
[[nodiscard]] auto getOr(const nlohmann::json& obj, std::string_view key, T defaultValue) -> T
{
    auto const* const value = find(obj, key);
    if (!value || !holds<T>(*value))
        return defaultValue;
    return value->get<T>();
}

} // namespace mcprunner::json
