/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "json_util.hpp"

#include <fmt/format.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <source_location>
#include <stdexcept>
#include <string_view>

//-------------------------------------------------------------------------

namespace binomkit::json
{

//-------------------------------------------------------------------------

std::string json2str(const rapidjson::Value& json, const FormatOptions& formatOptions)
{
    const auto& [indent, decimals] = formatOptions;
    rapidjson::StringBuffer buffer;
    if (indent.has_value()) {
        const auto& opts = indent.value();
        rapidjson::PrettyWriter writer{buffer};
        writer.SetIndent(opts.indentChar, opts.indentCharCount);
        writer.SetMaxDecimalPlaces(decimals);
        json.Accept(writer);
    } else {
        rapidjson::Writer writer{buffer};
        writer.SetMaxDecimalPlaces(decimals);
        json.Accept(writer);
    }
    return buffer.GetString();
}

//-------------------------------------------------------------------------

rapidjson::Document str2json(const std::string& str)
{
    rapidjson::Document json;
    if (json.Parse(str.c_str()).HasParseError()) {
        static constexpr size_t maxCharsShown = 200uz;
        std::string_view facade{str.data(), std::min(maxCharsShown, str.size())};
        throw std::invalid_argument{fmt::format(
            "{}: Error parsing Json string: {}{}",
            std::source_location::current().function_name(),
            facade,
            facade.size() < str.size() ? "..." : "")};
    }
    return json;
}

//-------------------------------------------------------------------------

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer)
{
    if (key.empty()) return serializer(json);
    auto& allocator = json.GetAllocator();
    rapidjson::Document subJson{&allocator};
    serializer(subJson);
    json.AddMember(rapidjson::Value{key.c_str(), allocator}, subJson, allocator);
}

//-------------------------------------------------------------------------

}  // namespace binomkit::json

//-------------------------------------------------------------------------
