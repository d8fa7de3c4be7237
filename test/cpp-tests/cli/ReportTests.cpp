/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "OutputFormat.hpp"
#include "Report.hpp"
#include "formatting.hpp"
#include "json_util.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>

//-------------------------------------------------------------------------

using namespace binomkit;
using namespace binomkit::cli;
using namespace binomkit::stats;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

std::string render(const Report& report, OutputFormat format)
{
    std::ostringstream oss;
    report.render(oss, format);
    return oss.str();
}

}  // namespace

//-------------------------------------------------------------------------

TEST(ReportTest, OutputFormatsByName)
{
    EXPECT_THAT(
        outputFormatsByName(),
        ElementsAre(
            Pair("csv", OutputFormat::csv),
            Pair("human", OutputFormat::human),
            Pair("json", OutputFormat::json)));
}

//-------------------------------------------------------------------------

TEST(ReportTest, HumanWithAllSections)
{
    const Report report{Binomial{6, 0.25}, {ProbabilityQuery{.k = 2}}, {}};

    EXPECT_EQ(
        render(report, OutputFormat::human),
        "Binomial experiment: n = 6, p = 0.25, q = 0.75\n"
        "P(X=0) = 0.1780\n"
        "P(X=1) = 0.3560\n"
        "P(X=2) = 0.2966\n"
        "P(X=3) = 0.1318\n"
        "P(X=4) = 0.0330\n"
        "P(X=5) = 0.0044\n"
        "P(X=6) = 0.0002\n"
        "Expected Value (μ): 1.5000\n"
        "Variance (σ²): 1.1250\n"
        "Skewness (γ₁): 0.4714\n"
        "P(X=2) = 0.296631\n");
}

//-------------------------------------------------------------------------

TEST(ReportTest, HumanQueriesOnly)
{
    const Report report{
        Binomial{10, 0.3},
        {CumulativeQuery{.k = 4}, CumulativeRangeQuery{.from = 2, .to = 5}},
        {.table = false, .stats = false}};

    EXPECT_EQ(
        render(report, OutputFormat::human),
        "Binomial experiment: n = 10, p = 0.30, q = 0.70\n"
        "P(X<=4) = 0.849732\n"
        "P(2<=X<=5) = 0.803343\n");
}

//-------------------------------------------------------------------------

TEST(ReportTest, CSVBlocksAreSeparatedByBlankLines)
{
    const Report report{
        Binomial{4, 0.5}, {CumulativeQuery{.k = 2}}, {.table = false, .stats = true}};

    EXPECT_EQ(
        render(report, OutputFormat::csv),
        "statistic,value\n"
        "expectedValue,2\n"
        "variance,1\n"
        "skewness,0\n"
        "\n"
        "query,value\n"
        "P(X<=2),0.6875\n");
}

//-------------------------------------------------------------------------

TEST(ReportTest, CSVUndefinedSkewnessIsEmpty)
{
    const Report report{Binomial{2, 1.0}, {}, {.table = true, .stats = true}};

    EXPECT_EQ(
        render(report, OutputFormat::csv),
        "k,probability,cumulative\n"
        "0,0,0\n"
        "1,0,0\n"
        "2,1,1\n"
        "\n"
        "statistic,value\n"
        "expectedValue,2\n"
        "variance,0\n"
        "skewness,\n");
}

//-------------------------------------------------------------------------

TEST(ReportTest, Json)
{
    const Report report{
        Binomial{10, 0.3},
        {ProbabilityQuery{.k = 2}, CumulativeQuery{.k = 4}},
        {.table = false, .stats = false}};

    const auto document = json::str2json(render(report, OutputFormat::json));

    ASSERT_TRUE(document.HasMember("binomial"));
    EXPECT_EQ(document["binomial"]["n"].GetUint(), 10u);
    EXPECT_EQ(document["binomial"]["distribution"].Size(), 11u);
    EXPECT_NEAR(document["binomial"]["skewness"].GetDouble(), 0.2760262237, 1e-9);

    const auto& queries = document["queries"];
    ASSERT_TRUE(queries.IsArray());
    ASSERT_EQ(queries.Size(), 2u);
    EXPECT_STREQ(queries[0]["query"].GetString(), "P(X=2)");
    EXPECT_NEAR(queries[0]["value"].GetDouble(), 0.2334744405, 1e-9);
    EXPECT_STREQ(queries[1]["query"].GetString(), "P(X<=4)");
    EXPECT_NEAR(queries[1]["value"].GetDouble(), 0.8497316674, 1e-9);
}

//-------------------------------------------------------------------------

TEST(ReportTest, RenderPropagatesQueryErrors)
{
    const Report report{Binomial{10, 0.3}, {ProbabilityQuery{.k = 11}}, {}};

    std::ostringstream oss;
    EXPECT_THROW(report.render(oss, OutputFormat::human), ValueError);
    EXPECT_THROW(report.render(oss, OutputFormat::json), ValueError);
}

//-------------------------------------------------------------------------
