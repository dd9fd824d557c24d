// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <initializer_list>
#include <string>
#include <string_view>

#include "Error.hpp"

namespace xcaption::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON value or an InvalidArgument error.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::InvalidArgument, std::format("JSON parse error: {}", e.what()));
    }
}

[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_string())
        return it->get<std::string>();
    return std::string(defaultValue);
}

[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_number_integer())
        return it->get<int>();
    return defaultValue;
}

[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_boolean())
        return it->get<bool>();
    return defaultValue;
}

/// @brief Returns the first member of @p obj whose key is in @p keys and whose value is not null.
/// @return Pointer into @p obj, or nullptr if @p obj is not an object or no key matched.
[[nodiscard]] inline auto findFirst(const nlohmann::json& obj, std::initializer_list<std::string_view> keys)
    -> const nlohmann::json*
{
    if (!obj.is_object())
        return nullptr;

    for (auto const key: keys)
    {
        auto const it = obj.find(std::string(key));
        if (it != obj.end() && !it->is_null())
            return &*it;
    }
    return nullptr;
}

} // namespace xcaption::json
