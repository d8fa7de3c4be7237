/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "binomkit/util/Exceptions.hpp"
#include "common.hpp"

#include <fmt/format.h>

#include <cmath>
#include <concepts>
#include <limits>
#include <source_location>
#include <string_view>
#include <utility>

//-------------------------------------------------------------------------

namespace binomkit::util
{

//-------------------------------------------------------------------------

template<typename T>
concept Numeric =
    (std::integral<T> && !std::same_as<T, bool>) || std::floating_point<T>;

//-------------------------------------------------------------------------

/**
 * Checks that @p x holds a non-negative integer.
 *
 * Integer types always pass the integrality check. Floating point values
 * pass only when finite with no fractional part, so 3.0 is accepted as 3.
 *
 * @throws TypeError if @p x is not integral.
 * @throws ValueError if @p x is negative.
 */
template<Numeric T>
void validateNonNegativeInteger(
    T x,
    std::string_view name = "value",
    std::source_location loc = std::source_location::current())
{
    if constexpr (std::floating_point<T>) {
        if (!std::isfinite(x) || std::trunc(x) != x) {
            throw TypeError{fmt::format(
                "{}: '{}' must be an integer, was {}", loc.function_name(), name, x)};
        }
    }
    if constexpr (!std::unsigned_integral<T>) {
        if (x < 0) {
            throw ValueError{fmt::format(
                "{}: '{}' must be non-negative, was {}", loc.function_name(), name, x)};
        }
    }
}

//-------------------------------------------------------------------------

/**
 * Checks that both arguments are non-negative integers and that x <= y.
 */
template<Numeric T, Numeric U>
void validateLessEqual(
    T x,
    U y,
    std::string_view xName = "x",
    std::string_view yName = "y",
    std::source_location loc = std::source_location::current())
{
    validateNonNegativeInteger(x, xName, loc);
    validateNonNegativeInteger(y, yName, loc);

    const bool greater = [&] {
        if constexpr (std::integral<T> && std::integral<U>) {
            return std::cmp_greater(x, y);
        } else {
            return static_cast<long double>(x) > static_cast<long double>(y);
        }
    }();
    if (greater) {
        throw ValueError{fmt::format(
            "{}: '{}' ({}) must be less than or equal to '{}' ({})",
            loc.function_name(), xName, x, yName, y)};
    }
}

//-------------------------------------------------------------------------

/**
 * Validates @p x as a non-negative integer and narrows it to Count.
 *
 * @throws ValueError if @p x does not fit in Count.
 */
template<Numeric T>
[[nodiscard]] Count toCount(
    T x,
    std::string_view name = "value",
    std::source_location loc = std::source_location::current())
{
    static constexpr Count kMaxCount = std::numeric_limits<Count>::max();

    validateNonNegativeInteger(x, name, loc);

    const bool tooLarge = [&] {
        if constexpr (std::integral<T>) {
            return std::cmp_greater(x, kMaxCount);
        } else {
            return static_cast<long double>(x) > static_cast<long double>(kMaxCount);
        }
    }();
    if (tooLarge) {
        throw ValueError{fmt::format(
            "{}: '{}' must not exceed {}, was {}", loc.function_name(), name, kMaxCount, x)};
    }
    return static_cast<Count>(x);
}

//-------------------------------------------------------------------------

}  // namespace binomkit::util

//-------------------------------------------------------------------------
