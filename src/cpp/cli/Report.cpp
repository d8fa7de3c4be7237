/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Report.hpp"

#include <fmt/ostream.h>

#include <ostream>
#include <utility>

//-------------------------------------------------------------------------

namespace binomkit::cli
{

//-------------------------------------------------------------------------

Report::Report(
    stats::Binomial binomial, std::vector<stats::Query> queries, ReportSections sections)
    : m_binomial{std::move(binomial)},
      m_queries{std::move(queries)},
      m_sections{sections}
{}

//-------------------------------------------------------------------------

void Report::render(std::ostream& os, OutputFormat format) const
{
    switch (format) {
        case OutputFormat::human:
            printHuman(os);
            break;
        case OutputFormat::csv:
            printCSV(os);
            break;
        case OutputFormat::json:
            os << json::jsonSerializable2str(*this, {.indent = json::IndentOptions{}}) << '\n';
            break;
    }
}

//-------------------------------------------------------------------------

void Report::printHuman(std::ostream& os) const
{
    fmt::print(os, "{}\n", m_binomial);
    if (m_sections.table) {
        m_binomial.printTable(os);
    }
    if (m_sections.stats) {
        m_binomial.printStats(os);
    }
    for (const auto& query : m_queries) {
        fmt::print(os, "{} = {:.6f}\n", query, stats::evaluate(m_binomial, query));
    }
}

//-------------------------------------------------------------------------

void Report::printCSV(std::ostream& os) const
{
    bool first = true;
    auto separate = [&] {
        if (!first) os << '\n';
        first = false;
    };

    if (m_sections.table) {
        separate();
        m_binomial.printCSV(os);
    }
    if (m_sections.stats) {
        separate();
        fmt::print(os, "statistic,value\n");
        fmt::print(os, "expectedValue,{}\n", m_binomial.expectedValue());
        fmt::print(os, "variance,{}\n", m_binomial.variance());
        if (m_binomial.hasDefinedSkewness()) {
            fmt::print(os, "skewness,{}\n", m_binomial.skewness());
        } else {
            fmt::print(os, "skewness,\n");
        }
    }
    if (!m_queries.empty()) {
        separate();
        fmt::print(os, "query,value\n");
        for (const auto& query : m_queries) {
            fmt::print(os, "{},{}\n", query, stats::evaluate(m_binomial, query));
        }
    }
}

//-------------------------------------------------------------------------

void Report::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        m_binomial.jsonSerialize(json, "binomial");
        rapidjson::Value queriesJson{rapidjson::kArrayType};
        for (const auto& query : m_queries) {
            rapidjson::Value queryJson{rapidjson::kObjectType};
            queryJson.AddMember(
                "query", rapidjson::Value{fmt::format("{}", query).c_str(), allocator}, allocator);
            queryJson.AddMember(
                "value", rapidjson::Value{stats::evaluate(m_binomial, query)}, allocator);
            queriesJson.PushBack(queryJson, allocator);
        }
        json.AddMember("queries", queriesJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace binomkit::cli

//-------------------------------------------------------------------------
