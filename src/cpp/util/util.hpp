/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

//-------------------------------------------------------------------------

namespace binomkit::util
{

//-------------------------------------------------------------------------

[[nodiscard]] std::vector<std::string> split(std::string_view str, char delim) noexcept;

/**
 * Parses "K1:K2" into a pair of outcome bounds.
 *
 * @throws std::invalid_argument if @p str is not two numbers separated by ':'.
 */
[[nodiscard]] std::pair<double, double> parseRange(std::string_view str);

/**
 * Parses the whole of @p str, ignoring surrounding whitespace, as a number.
 */
[[nodiscard]] std::optional<double> parseNumber(std::string_view str);

/**
 * Reads attribute @p name of @p node as a number.
 *
 * @throws std::invalid_argument if the attribute is missing.
 * @throws TypeError if its text is not a number.
 */
[[nodiscard]] double numericAttribute(
    pugi::xml_node node,
    const char* name,
    std::source_location loc = std::source_location::current());

//-------------------------------------------------------------------------

}  // namespace binomkit::util

//-------------------------------------------------------------------------
