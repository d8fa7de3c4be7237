/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "binomkit/math/combinatorics.hpp"

#include <boost/multiprecision/cpp_bin_float.hpp>

#include <algorithm>

//-------------------------------------------------------------------------

namespace binomkit::math::detail
{

//-------------------------------------------------------------------------

BigInt factorial(Count n)
{
    BigInt result{1};
    for (Count i = 2; i <= n; ++i) {
        result *= i;
    }
    return result;
}

//-------------------------------------------------------------------------

BigInt combinations(Count n, Count r)
{
    // C(n, r) == C(n, n - r); each partial product below is itself a
    // binomial coefficient so the division is always exact.
    const Count k = std::min(r, n - r);
    BigInt result{1};
    for (Count i = 1; i <= k; ++i) {
        result *= n - k + i;
        result /= i;
    }
    return result;
}

//-------------------------------------------------------------------------

double logCombinations(Count n, Count r)
{
    using boost::multiprecision::cpp_bin_float_50;

    const cpp_bin_float_50 coefficient{combinations(n, r)};
    const cpp_bin_float_50 logCoefficient = log(coefficient);
    return logCoefficient.convert_to<double>();
}

//-------------------------------------------------------------------------

}  // namespace binomkit::math::detail

//-------------------------------------------------------------------------
