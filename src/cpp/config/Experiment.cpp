/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "binomkit/config/Experiment.hpp"

#include "binomkit/util/logging.hpp"

#include <fmt/format.h>

#include <source_location>
#include <string_view>

//-------------------------------------------------------------------------

namespace binomkit::config
{

//-------------------------------------------------------------------------

Experiment experimentFromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (std::string_view{node.name()} != "Experiment") {
        throw std::invalid_argument{fmt::format(
            "{}: expected <Experiment> element, got <{}>", ctx, node.name())};
    }

    pugi::xml_node distributionNode = node.child("Distribution");
    if (!distributionNode) {
        throw std::invalid_argument{fmt::format(
            "{}: missing required element <Distribution>", ctx)};
    }
    if (std::string_view type = distributionNode.attribute("type").as_string("binomial");
        type != "binomial") {
        throw std::invalid_argument{fmt::format(
            "{}: Unknown distribution type '{}'", ctx, type)};
    }

    Experiment experiment{.distribution = stats::Binomial::fromXML(distributionNode)};

    for (pugi::xml_node queryNode : node.child("Queries").children()) {
        if (queryNode.type() != pugi::node_element) continue;
        experiment.queries.push_back(stats::queryFromXML(queryNode));
    }

    util::logger()->debug(
        "read {} with {} queries", experiment.distribution, experiment.queries.size());

    return experiment;
}

//-------------------------------------------------------------------------

Experiment parseExperimentFile(const fs::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_document doc;
    if (pugi::xml_parse_result parseResult = doc.load_file(path.c_str()); !parseResult) {
        throw std::invalid_argument{fmt::format(
            "{}: unable to parse '{}': {} (offset {})",
            ctx,
            path.string(),
            parseResult.description(),
            parseResult.offset)};
    }

    return experimentFromXML(doc.document_element());
}

//-------------------------------------------------------------------------

}  // namespace binomkit::config

//-------------------------------------------------------------------------
