/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "binomkit/util/Exceptions.hpp"
#include "binomkit/util/logging.hpp"
#include "util.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <pugixml.hpp>

#include <optional>
#include <tuple>

//-------------------------------------------------------------------------

using namespace testing;

//-------------------------------------------------------------------------

TEST(UtilTest, Split)
{
    static constexpr std::string_view kTestStr1{"foo|bar|baz"};
    static constexpr char delim = '|';

    EXPECT_THAT(binomkit::util::split(kTestStr1, delim), ElementsAre("foo", "bar", "baz"));

    static constexpr std::string_view kTestStr2{"foo,bar,baz"};

    EXPECT_THAT(binomkit::util::split(kTestStr2, delim), ElementsAre(kTestStr2));
}

//-------------------------------------------------------------------------

TEST(UtilTest, ParseRange)
{
    EXPECT_THAT(binomkit::util::parseRange("2:5"), Pair(2.0, 5.0));
    EXPECT_THAT(binomkit::util::parseRange(" 0 : 10 "), Pair(0.0, 10.0));
    EXPECT_THAT(binomkit::util::parseRange("1.5:3"), Pair(1.5, 3.0));
}

//-------------------------------------------------------------------------

TEST(UtilTest, ParseRangeRejectsMalformedInput)
{
    EXPECT_THROW(std::ignore = binomkit::util::parseRange("5"), std::invalid_argument);
    EXPECT_THROW(std::ignore = binomkit::util::parseRange("1:2:3"), std::invalid_argument);
    EXPECT_THROW(std::ignore = binomkit::util::parseRange("a:3"), std::invalid_argument);
    EXPECT_THROW(std::ignore = binomkit::util::parseRange("2:"), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(UtilTest, ParseNumber)
{
    EXPECT_THAT(binomkit::util::parseNumber("3"), Optional(3.0));
    EXPECT_THAT(binomkit::util::parseNumber(" 0.25 "), Optional(0.25));
    EXPECT_THAT(binomkit::util::parseNumber("1e3"), Optional(1000.0));
    EXPECT_FALSE(binomkit::util::parseNumber("").has_value());
    EXPECT_FALSE(binomkit::util::parseNumber("ten").has_value());
    EXPECT_FALSE(binomkit::util::parseNumber("4x").has_value());
}

//-------------------------------------------------------------------------

TEST(UtilTest, NumericAttribute)
{
    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_string(R"(<Node a="1.5" b="abc"/>)"));
    const pugi::xml_node node = doc.child("Node");

    EXPECT_DOUBLE_EQ(binomkit::util::numericAttribute(node, "a"), 1.5);
    EXPECT_THROW(std::ignore = binomkit::util::numericAttribute(node, "b"), binomkit::TypeError);
    EXPECT_THAT(
        [&] { std::ignore = binomkit::util::numericAttribute(node, "c"); },
        ThrowsMessage<std::invalid_argument>(HasSubstr("'c'")));
}

//-------------------------------------------------------------------------

TEST(UtilTest, SetupLoggingWithUnopenableFileThrows)
{
    const auto logger = binomkit::util::logger();
    const auto sinkCount = logger->sinks().size();
    const auto level = logger->level();

    EXPECT_THROW(
        binomkit::util::setupLogging({
            .level = spdlog::level::trace,
            .logFile = fs::path{"/proc"} / "binomkit-missing" / "test.log"
        }),
        std::exception);

    EXPECT_EQ(logger->sinks().size(), sinkCount);
    EXPECT_EQ(logger->level(), level);
}

//-------------------------------------------------------------------------
