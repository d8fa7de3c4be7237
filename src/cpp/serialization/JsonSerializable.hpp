/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "json_util.hpp"

#include <string>

//-------------------------------------------------------------------------

namespace binomkit
{

class JsonSerializable
{
public:
    virtual ~JsonSerializable() noexcept = default;

    virtual void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const = 0;

protected:
    JsonSerializable() noexcept = default;
};

}  // namespace binomkit

//-------------------------------------------------------------------------

namespace binomkit::json
{

template<typename T>
concept IsJsonSerializable =
    requires (const T& t, rapidjson::Document& json, const std::string& key) {
        { t.jsonSerialize(json, key) };
    };

[[nodiscard]] std::string jsonSerializable2str(
    const IsJsonSerializable auto& serializable, const FormatOptions& formatOptions = {})
{
    rapidjson::Document json;
    serializable.jsonSerialize(json);
    return json2str(json, formatOptions);
}

}  // namespace binomkit::json

//-------------------------------------------------------------------------
