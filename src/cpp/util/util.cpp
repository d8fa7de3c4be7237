/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "util.hpp"

#include "binomkit/util/Exceptions.hpp"

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

#include <charconv>
#include <source_location>

//-------------------------------------------------------------------------

namespace binomkit::util
{

//-------------------------------------------------------------------------

std::vector<std::string> split(std::string_view str, char delim) noexcept
{
    std::vector<std::string> res;
    boost::split(res, str, [delim](auto c) { return c == delim; });
    return res;
}

//-------------------------------------------------------------------------

std::pair<double, double> parseRange(std::string_view str)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const auto parts = split(str, ':');
    if (parts.size() != 2) {
        throw std::invalid_argument{fmt::format(
            "{}: expected a range of the form K1:K2, got '{}'", ctx, str)};
    }

    auto toDouble = [&](const std::string& part) {
        if (const auto value = parseNumber(part)) {
            return *value;
        }
        throw std::invalid_argument{fmt::format(
            "{}: '{}' in range '{}' is not a number", ctx, part, str)};
    };

    return {toDouble(parts[0]), toDouble(parts[1])};
}

//-------------------------------------------------------------------------

std::optional<double> parseNumber(std::string_view str)
{
    std::string text{str};
    boost::trim(text);
    double value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

//-------------------------------------------------------------------------

double numericAttribute(pugi::xml_node node, const char* name, std::source_location loc)
{
    const pugi::xml_attribute attr = node.attribute(name);
    if (!attr) {
        throw std::invalid_argument{fmt::format(
            "{}: <{}> is missing required attribute '{}'",
            loc.function_name(), node.name(), name)};
    }
    if (const auto value = parseNumber(attr.as_string())) {
        return *value;
    }
    throw TypeError{fmt::format(
        "{}: attribute '{}' of <{}> must be a number, was '{}'",
        loc.function_name(), name, node.name(), attr.as_string())};
}

//-------------------------------------------------------------------------

}  // namespace binomkit::util

//-------------------------------------------------------------------------
