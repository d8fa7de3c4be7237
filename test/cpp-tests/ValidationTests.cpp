/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "binomkit/util/validation.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>
#include <tuple>

//-------------------------------------------------------------------------

using namespace binomkit;
using namespace binomkit::util;

using namespace testing;

//-------------------------------------------------------------------------

TEST(ValidationTest, NonNegativeIntegerAccepted)
{
    EXPECT_NO_THROW(validateNonNegativeInteger(0));
    EXPECT_NO_THROW(validateNonNegativeInteger(4));
    EXPECT_NO_THROW(validateNonNegativeInteger(15));
    EXPECT_NO_THROW(validateNonNegativeInteger(std::numeric_limits<uint64_t>::max()));
    EXPECT_NO_THROW(validateNonNegativeInteger(3.0));
}

//-------------------------------------------------------------------------

TEST(ValidationTest, NegativeIntegerIsValueError)
{
    EXPECT_THROW(validateNonNegativeInteger(-1), ValueError);
    EXPECT_THROW(validateNonNegativeInteger(int64_t{-4}), ValueError);
    EXPECT_THROW(validateNonNegativeInteger(-2.0), ValueError);
}

//-------------------------------------------------------------------------

TEST(ValidationTest, NonIntegralIsTypeError)
{
    EXPECT_THROW(validateNonNegativeInteger(1.5), TypeError);
    EXPECT_THROW(validateNonNegativeInteger(-1.5), TypeError);
    EXPECT_THROW(validateNonNegativeInteger(0.1f), TypeError);
    EXPECT_THROW(
        validateNonNegativeInteger(std::numeric_limits<double>::quiet_NaN()), TypeError);
    EXPECT_THROW(
        validateNonNegativeInteger(std::numeric_limits<double>::infinity()), TypeError);
}

//-------------------------------------------------------------------------

TEST(ValidationTest, MessageNamesTheArgument)
{
    EXPECT_THAT(
        [] { validateNonNegativeInteger(-3, "trials"); },
        ThrowsMessage<ValueError>(AllOf(HasSubstr("'trials'"), HasSubstr("-3"))));
    EXPECT_THAT(
        [] { validateNonNegativeInteger(2.5, "k"); },
        ThrowsMessage<TypeError>(AllOf(HasSubstr("'k'"), HasSubstr("2.5"))));
}

//-------------------------------------------------------------------------

TEST(ValidationTest, LessEqualAccepted)
{
    EXPECT_NO_THROW(validateLessEqual(2, 4));
    EXPECT_NO_THROW(validateLessEqual(0, 4));
    EXPECT_NO_THROW(validateLessEqual(2, 8));
    EXPECT_NO_THROW(validateLessEqual(4, 4));
    EXPECT_NO_THROW(validateLessEqual(2.0, 4u));
}

//-------------------------------------------------------------------------

TEST(ValidationTest, LessEqualRejectsOutOfOrderOrNegative)
{
    EXPECT_THROW(validateLessEqual(4, 2), ValueError);
    EXPECT_THROW(validateLessEqual(-4, 2), ValueError);
    EXPECT_THROW(validateLessEqual(4, -2), ValueError);
    EXPECT_THROW(validateLessEqual(-4, -2), ValueError);
    EXPECT_THROW(validateLessEqual(5.0, 3), ValueError);
}

//-------------------------------------------------------------------------

TEST(ValidationTest, LessEqualRejectsNonIntegral)
{
    EXPECT_THROW(validateLessEqual(4.5, 2), TypeError);
    EXPECT_THROW(validateLessEqual(4, 2.5), TypeError);
    EXPECT_THROW(validateLessEqual(4.5, 2.5), TypeError);
}

//-------------------------------------------------------------------------

TEST(ValidationTest, ToCount)
{
    EXPECT_EQ(toCount(0), Count{0});
    EXPECT_EQ(toCount(7.0), Count{7});
    EXPECT_EQ(toCount(std::numeric_limits<Count>::max()), std::numeric_limits<Count>::max());

    EXPECT_THROW(std::ignore = toCount(int64_t{1} << 32), ValueError);
    EXPECT_THROW(std::ignore = toCount(1e20), ValueError);
    EXPECT_THROW(std::ignore = toCount(-1), ValueError);
    EXPECT_THROW(std::ignore = toCount(0.5), TypeError);
}

//-------------------------------------------------------------------------
