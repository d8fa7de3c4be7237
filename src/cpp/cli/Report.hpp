/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "OutputFormat.hpp"
#include "Printable.hpp"
#include "binomkit/stats/Binomial.hpp"
#include "binomkit/stats/Query.hpp"

#include <iosfwd>
#include <vector>

//-------------------------------------------------------------------------

namespace binomkit::cli
{

//-------------------------------------------------------------------------

struct ReportSections
{
    bool table = true;
    bool stats = true;
};

/**
 * What the binomkit CLI prints for one distribution: the summary line, the
 * requested sections and the answers to each query.
 *
 * Query answers are computed when rendering, so argument errors surface
 * from the render calls.
 */
class Report : public IHumanPrintable, public CSVPrintable, public JsonSerializable
{
public:
    Report(stats::Binomial binomial, std::vector<stats::Query> queries, ReportSections sections);

    void render(std::ostream& os, OutputFormat format) const;

    virtual void printHuman(std::ostream& os) const override;
    virtual void printCSV(std::ostream& os) const override;
    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    stats::Binomial m_binomial;
    std::vector<stats::Query> m_queries;
    ReportSections m_sections;
};

//-------------------------------------------------------------------------

}  // namespace binomkit::cli

//-------------------------------------------------------------------------
