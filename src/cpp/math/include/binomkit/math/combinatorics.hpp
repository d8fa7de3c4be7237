/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "binomkit/util/validation.hpp"
#include "common.hpp"

#include <boost/multiprecision/cpp_int.hpp>

//-------------------------------------------------------------------------

namespace binomkit::math
{

//-------------------------------------------------------------------------

using BigInt = boost::multiprecision::cpp_int;

//-------------------------------------------------------------------------

namespace detail
{

[[nodiscard]] BigInt factorial(Count n);
[[nodiscard]] BigInt combinations(Count n, Count r);
[[nodiscard]] double logCombinations(Count n, Count r);

}  // namespace detail

//-------------------------------------------------------------------------

/**
 * Exact n!, with 0! = 1.
 *
 * @throws TypeError if @p n is not integral.
 * @throws ValueError if @p n is negative.
 */
template<util::Numeric T>
[[nodiscard]] BigInt factorial(T n)
{
    return detail::factorial(util::toCount(n, "n"));
}

/**
 * Exact number of r-combinations of n elements, n! / (r! (n - r)!).
 *
 * @throws TypeError if @p n or @p r is not integral.
 * @throws ValueError if @p n or @p r is negative or r > n.
 */
template<util::Numeric T, util::Numeric U>
[[nodiscard]] BigInt combinations(T n, U r)
{
    const Count cn = util::toCount(n, "n");
    const Count cr = util::toCount(r, "r");
    util::validateLessEqual(cr, cn, "r", "n");
    return detail::combinations(cn, cr);
}

/**
 * Natural logarithm of C(n, r), finite for every valid pair.
 */
template<util::Numeric T, util::Numeric U>
[[nodiscard]] double logCombinations(T n, U r)
{
    const Count cn = util::toCount(n, "n");
    const Count cr = util::toCount(r, "r");
    util::validateLessEqual(cr, cn, "r", "n");
    return detail::logCombinations(cn, cr);
}

//-------------------------------------------------------------------------

}  // namespace binomkit::math

//-------------------------------------------------------------------------
