/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <rapidjson/document.h>

#include <concepts>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

//-------------------------------------------------------------------------

namespace binomkit::json
{

//-------------------------------------------------------------------------

inline constexpr uint32_t kMaxDecimalPlaces = 12;

//-------------------------------------------------------------------------

struct IndentOptions
{
    char indentChar = ' ';
    uint8_t indentCharCount = 4;
};

struct FormatOptions
{
    std::optional<IndentOptions> indent = {};
    uint32_t decimals = kMaxDecimalPlaces;
};

[[nodiscard]] std::string json2str(
    const rapidjson::Value& json, const FormatOptions& formatOptions = {});

[[nodiscard]] rapidjson::Document str2json(const std::string& str);

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer);

template<typename T>
requires std::constructible_from<rapidjson::Value, T>
void setOptionalMember(rapidjson::Document& json, const std::string& key, std::optional<T> opt)
{
    auto& allocator = json.GetAllocator();
    json.AddMember(
        rapidjson::Value{key.c_str(), allocator},
        [&] {
            if (!opt.has_value()) {
                return rapidjson::Value{rapidjson::kNullType};
            }
            return rapidjson::Value{opt.value()};
        }(),
        allocator);
}

//-------------------------------------------------------------------------

}  // namespace binomkit::json

//-------------------------------------------------------------------------
