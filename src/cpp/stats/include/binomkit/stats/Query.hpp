/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "binomkit/stats/Binomial.hpp"

#include <fmt/format.h>
#include <pugixml.hpp>

#include <concepts>
#include <type_traits>
#include <variant>

//-------------------------------------------------------------------------

namespace binomkit::stats
{

//-------------------------------------------------------------------------

// Outcome bounds are kept as read so that a non-integral bound surfaces as
// a TypeError when the query is evaluated.

struct ProbabilityQuery
{
    double k;
};

struct CumulativeQuery
{
    double k;
};

struct CumulativeRangeQuery
{
    double from;
    double to;
};

using Query = std::variant<ProbabilityQuery, CumulativeQuery, CumulativeRangeQuery>;

[[nodiscard]] double evaluate(const Binomial& binomial, const Query& query);

/**
 * Builds a query from one of <Probability k=""/>, <Cumulative k=""/> or
 * <CumulativeRange from="" to=""/>.
 */
[[nodiscard]] Query queryFromXML(pugi::xml_node node);

//-------------------------------------------------------------------------

}  // namespace binomkit::stats

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<binomkit::stats::Query>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const binomkit::stats::Query& query, FormatContext& ctx) const
    {
        using namespace binomkit::stats;
        return std::visit(
            [&](const auto& q) {
                using Q = std::decay_t<decltype(q)>;
                if constexpr (std::same_as<Q, ProbabilityQuery>) {
                    return fmt::format_to(ctx.out(), "P(X={})", q.k);
                } else if constexpr (std::same_as<Q, CumulativeQuery>) {
                    return fmt::format_to(ctx.out(), "P(X<={})", q.k);
                } else {
                    return fmt::format_to(ctx.out(), "P({}<=X<={})", q.from, q.to);
                }
            },
            query);
    }
};

//-------------------------------------------------------------------------
