/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "binomkit/stats/Query.hpp"

#include "util.hpp"

#include <concepts>
#include <source_location>
#include <string_view>
#include <type_traits>

//-------------------------------------------------------------------------

namespace binomkit::stats
{

//-------------------------------------------------------------------------

double evaluate(const Binomial& binomial, const Query& query)
{
    return std::visit(
        [&](const auto& q) {
            using Q = std::decay_t<decltype(q)>;
            if constexpr (std::same_as<Q, ProbabilityQuery>) {
                return binomial.probabilityK(q.k);
            } else if constexpr (std::same_as<Q, CumulativeQuery>) {
                return binomial.cumulative(q.k);
            } else {
                return binomial.cumulativeRange(q.from, q.to);
            }
        },
        query);
}

//-------------------------------------------------------------------------

Query queryFromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto getAttr = [&](const char* name) { return util::numericAttribute(node, name); };

    const std::string_view type = node.name();

    if (type == "Probability") {
        return ProbabilityQuery{.k = getAttr("k")};
    }
    else if (type == "Cumulative") {
        return CumulativeQuery{.k = getAttr("k")};
    }
    else if (type == "CumulativeRange") {
        return CumulativeRangeQuery{.from = getAttr("from"), .to = getAttr("to")};
    }

    throw std::invalid_argument{fmt::format("{}: Unknown query type '{}'", ctx, type)};
}

//-------------------------------------------------------------------------

}  // namespace binomkit::stats

//-------------------------------------------------------------------------
