/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "Printable.hpp"
#include "binomkit/util/validation.hpp"
#include "common.hpp"

#include <fmt/format.h>
#include <pugixml.hpp>

#include <iosfwd>
#include <map>
#include <string_view>

//-------------------------------------------------------------------------

namespace binomkit::stats
{

//-------------------------------------------------------------------------

/**
 * Binomial distribution B(n, p): the number of successes in n independent
 * trials, each succeeding with probability p.
 *
 * Immutable once constructed. Every query validates its own arguments and
 * throws TypeError or ValueError on bad input.
 */
class Binomial : public IHumanPrintable, public CSVPrintable, public JsonSerializable
{
public:
    using Table = std::map<Count, double>;

    /**
     * @throws TypeError if @p trials is not integral.
     * @throws ValueError if @p trials is negative or @p successProbability
     *         lies outside [0, 1].
     */
    template<util::Numeric T>
    Binomial(T trials, double successProbability)
        : Binomial{CheckedTrials{util::toCount(trials, "n")}, successProbability}
    {}

    [[nodiscard]] Count trials() const noexcept { return m_trials; }
    [[nodiscard]] double successProbability() const noexcept { return m_successProbability; }
    [[nodiscard]] double failureProbability() const noexcept { return 1.0 - m_successProbability; }

    [[nodiscard]] double expectedValue() const noexcept;
    [[nodiscard]] double variance() const noexcept;

    /**
     * False when n * p * q == 0, i.e. p is 0 or 1, or n is 0.
     */
    [[nodiscard]] bool hasDefinedSkewness() const noexcept;

    /**
     * (q - p) / sqrt(n * p * q).
     *
     * @throws ValueError if the skewness is undefined (see hasDefinedSkewness).
     */
    [[nodiscard]] double skewness() const;

    /**
     * P(X = k) = C(n, k) * p^k * q^(n - k), with 0^0 = 1.
     */
    template<util::Numeric T>
    [[nodiscard]] double probabilityK(T k) const
    {
        return pmf(checkOutcome(k, "k"));
    }

    /**
     * P(X <= k).
     */
    template<util::Numeric T>
    [[nodiscard]] double cumulative(T k) const
    {
        return accumulate(0, checkOutcome(k, "k"));
    }

    /**
     * P(k1 <= X <= k2).
     */
    template<util::Numeric T, util::Numeric U>
    [[nodiscard]] double cumulativeRange(T k1, U k2) const
    {
        const Count first = checkOutcome(k1, "k1");
        const Count last = checkOutcome(k2, "k2");
        util::validateLessEqual(first, last, "k1", "k2");
        return accumulate(first, last);
    }

    /**
     * The full probability mass function {0: P(X=0), ..., n: P(X=n)}.
     * Recomputed on every call.
     */
    [[nodiscard]] Table distribution() const;

    void printTable(std::ostream& os) const;
    void printStats(std::ostream& os) const;

    virtual void printHuman(std::ostream& os) const override;
    virtual void printCSV(std::ostream& os) const override;
    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static Binomial fromXML(pugi::xml_node node);

private:
    struct CheckedTrials
    {
        Count value;
    };

    Binomial(CheckedTrials trials, double successProbability);

    template<util::Numeric T>
    [[nodiscard]] Count checkOutcome(T k, std::string_view name) const
    {
        const Count outcome = util::toCount(k, name);
        util::validateLessEqual(outcome, m_trials, name, "n");
        return outcome;
    }

    [[nodiscard]] double pmf(Count k) const;
    [[nodiscard]] double accumulate(Count first, Count last) const;

    Count m_trials;
    double m_successProbability;
};

//-------------------------------------------------------------------------

}  // namespace binomkit::stats

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<binomkit::stats::Binomial>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const binomkit::stats::Binomial& binomial, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "Binomial experiment: n = {}, p = {:.2f}, q = {:.2f}",
            binomial.trials(),
            binomial.successProbability(),
            binomial.failureProbability());
    }
};

//-------------------------------------------------------------------------
