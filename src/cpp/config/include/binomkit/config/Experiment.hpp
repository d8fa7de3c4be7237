/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "binomkit/stats/Binomial.hpp"
#include "binomkit/stats/Query.hpp"
#include "common.hpp"

#include <pugixml.hpp>

#include <vector>

//-------------------------------------------------------------------------

namespace binomkit::config
{

//-------------------------------------------------------------------------

struct Experiment
{
    stats::Binomial distribution;
    std::vector<stats::Query> queries;
};

/**
 * Reads an <Experiment> element:
 *
 *   <Experiment>
 *     <Distribution type="binomial" n="10" p="0.3"/>
 *     <Queries>
 *       <Probability k="2"/>
 *       <Cumulative k="4"/>
 *       <CumulativeRange from="2" to="5"/>
 *     </Queries>
 *   </Experiment>
 *
 * The <Queries> element is optional.
 */
[[nodiscard]] Experiment experimentFromXML(pugi::xml_node node);

[[nodiscard]] Experiment parseExperimentFile(const fs::path& path);

//-------------------------------------------------------------------------

}  // namespace binomkit::config

//-------------------------------------------------------------------------
