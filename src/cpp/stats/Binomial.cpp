/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "binomkit/stats/Binomial.hpp"

#include "binomkit/math/combinatorics.hpp"
#include "binomkit/util/logging.hpp"
#include "util.hpp"

#include <fmt/ostream.h>

#include <cmath>
#include <ostream>
#include <source_location>

//-------------------------------------------------------------------------

namespace binomkit::stats
{

//-------------------------------------------------------------------------

namespace
{

// Largest bit index for which a BigInt still converts to a finite double.
constexpr unsigned kMaxDoubleMsb = 1022;

}  // namespace

//-------------------------------------------------------------------------

Binomial::Binomial(CheckedTrials trials, double successProbability)
    : m_trials{trials.value},
      m_successProbability{successProbability}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!(successProbability >= 0.0 && successProbability <= 1.0)) {
        throw ValueError{fmt::format(
            "{}: parameter 'p' should be in [0, 1], was {}", ctx, successProbability)};
    }
}

//-------------------------------------------------------------------------

double Binomial::expectedValue() const noexcept
{
    return m_trials * m_successProbability;
}

//-------------------------------------------------------------------------

double Binomial::variance() const noexcept
{
    return m_trials * m_successProbability * failureProbability();
}

//-------------------------------------------------------------------------

bool Binomial::hasDefinedSkewness() const noexcept
{
    return variance() > 0.0;
}

//-------------------------------------------------------------------------

double Binomial::skewness() const
{
    if (!hasDefinedSkewness()) {
        throw ValueError{fmt::format(
            "{}: skewness is undefined for n = {}, p = {} (n * p * q == 0)",
            std::source_location::current().function_name(),
            m_trials,
            m_successProbability)};
    }
    return (failureProbability() - m_successProbability) / std::sqrt(variance());
}

//-------------------------------------------------------------------------

Binomial::Table Binomial::distribution() const
{
    util::logger()->debug("computing {} outcome table", *this);

    Table table;
    for (Count k = 0; k <= m_trials; ++k) {
        table.emplace_hint(table.end(), k, pmf(k));
        if (k == m_trials) break;
    }
    return table;
}

//-------------------------------------------------------------------------

void Binomial::printTable(std::ostream& os) const
{
    for (const auto& [k, probability] : distribution()) {
        fmt::print(os, "P(X={}) = {:.4f}\n", k, probability);
    }
}

//-------------------------------------------------------------------------

void Binomial::printStats(std::ostream& os) const
{
    fmt::print(os, "Expected Value (μ): {:.4f}\n", expectedValue());
    fmt::print(os, "Variance (σ²): {:.4f}\n", variance());
    if (hasDefinedSkewness()) {
        fmt::print(os, "Skewness (γ₁): {:.4f}\n", skewness());
    } else {
        fmt::print(os, "Skewness (γ₁): undefined\n");
    }
}

//-------------------------------------------------------------------------

void Binomial::printHuman(std::ostream& os) const
{
    fmt::print(os, "{}\n", *this);
    printTable(os);
    printStats(os);
}

//-------------------------------------------------------------------------

void Binomial::printCSV(std::ostream& os) const
{
    fmt::print(os, "k,probability,cumulative\n");
    double cumulative = 0.0;
    for (const auto& [k, probability] : distribution()) {
        cumulative += probability;
        fmt::print(os, "{},{},{}\n", k, probability, cumulative);
    }
}

//-------------------------------------------------------------------------

void Binomial::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("n", rapidjson::Value{m_trials}, allocator);
        json.AddMember("p", rapidjson::Value{m_successProbability}, allocator);
        json.AddMember("q", rapidjson::Value{failureProbability()}, allocator);
        json.AddMember("expectedValue", rapidjson::Value{expectedValue()}, allocator);
        json.AddMember("variance", rapidjson::Value{variance()}, allocator);
        json::setOptionalMember(
            json,
            "skewness",
            hasDefinedSkewness() ? std::make_optional(skewness()) : std::nullopt);
        rapidjson::Value distributionJson{rapidjson::kArrayType};
        for (const auto& [k, probability] : distribution()) {
            rapidjson::Value entryJson{rapidjson::kObjectType};
            entryJson.AddMember("k", rapidjson::Value{k}, allocator);
            entryJson.AddMember("probability", rapidjson::Value{probability}, allocator);
            distributionJson.PushBack(entryJson, allocator);
        }
        json.AddMember("distribution", distributionJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

Binomial Binomial::fromXML(pugi::xml_node node)
{
    return Binomial{util::numericAttribute(node, "n"), util::numericAttribute(node, "p")};
}

//-------------------------------------------------------------------------

double Binomial::pmf(Count k) const
{
    const double p = m_successProbability;
    const double q = failureProbability();

    if (p == 0.0) {
        return k == 0 ? 1.0 : 0.0;
    }
    if (q == 0.0) {
        return k == m_trials ? 1.0 : 0.0;
    }

    const math::BigInt coefficient = math::detail::combinations(m_trials, k);
    const double pk = std::pow(p, k);
    const double qk = std::pow(q, m_trials - k);

    if (boost::multiprecision::msb(coefficient) <= kMaxDoubleMsb
        && std::isnormal(pk) && std::isnormal(qk)) {
        return coefficient.convert_to<double>() * pk * qk;
    }

    util::logger()->trace("P(X={}) for {} evaluated in log space", k, *this);
    return std::exp(
        math::detail::logCombinations(m_trials, k)
        + k * std::log(p)
        + (m_trials - k) * std::log1p(-p));
}

//-------------------------------------------------------------------------

double Binomial::accumulate(Count first, Count last) const
{
    double sum = 0.0;
    for (Count k = first; k <= last; ++k) {
        sum += pmf(k);
        if (k == last) break;
    }
    return sum;
}

//-------------------------------------------------------------------------

}  // namespace binomkit::stats

//-------------------------------------------------------------------------
