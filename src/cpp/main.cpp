/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "OutputFormat.hpp"
#include "Report.hpp"
#include "binomkit/config/Experiment.hpp"
#include "binomkit/util/logging.hpp"
#include "common.hpp"
#include "util.hpp"

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

//-------------------------------------------------------------------------

using namespace binomkit;

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"binomkit - binomial distribution tables and statistics"};

    CLI::Option_group* sourceGroup = app.add_option_group("Distribution");

    double trials{};
    auto optTrials = sourceGroup->add_option("-n,--trials", trials, "Number of trials");

    fs::path configFile;
    sourceGroup->add_option("-f,--config-file", configFile, "Experiment config file")
        ->check(CLI::ExistingFile);

    sourceGroup->require_option(1);

    double probability{};
    auto optProbability = app.add_option(
        "-p,--probability", probability, "Probability of success in a single trial")
        ->needs(optTrials);
    optTrials->needs(optProbability);

    bool printTable = false;
    app.add_flag("--table", printTable, "Print the probability mass function table");

    bool printStats = false;
    app.add_flag("--stats", printStats, "Print expected value, variance and skewness");

    std::vector<double> pmfQueries;
    app.add_option("--pmf", pmfQueries, "Probability of exactly K successes")
        ->delimiter(',');

    std::vector<double> cdfQueries;
    app.add_option("--cdf", cdfQueries, "Probability of at most K successes")
        ->delimiter(',');

    std::vector<std::string> rangeQueries;
    app.add_option("--range", rangeQueries, "Probability of K1 to K2 successes, as K1:K2");

    cli::OutputFormat format = cli::OutputFormat::human;
    app.add_option("--format", format, "Output format")
        ->transform(CLI::CheckedTransformer(cli::outputFormatsByName(), CLI::ignore_case));

    std::string logLevel = "warn";
    app.add_option("--log-level", logLevel, "Log level")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));

    fs::path logFile;
    app.add_option("--log-file", logFile, "Additionally write the log to this file");

    CLI11_PARSE(app, argc, argv);

    try {
        util::setupLogging({
            .level = spdlog::level::from_str(logLevel),
            .logFile = logFile.empty() ? std::nullopt : std::make_optional(logFile)
        });

        auto [binomial, queries] = [&] {
            if (!configFile.empty()) {
                return config::parseExperimentFile(configFile);
            }
            return config::Experiment{.distribution = stats::Binomial{trials, probability}};
        }();

        for (double k : pmfQueries) {
            queries.push_back(stats::ProbabilityQuery{.k = k});
        }
        for (double k : cdfQueries) {
            queries.push_back(stats::CumulativeQuery{.k = k});
        }
        for (const auto& range : rangeQueries) {
            const auto [from, to] = util::parseRange(range);
            queries.push_back(stats::CumulativeRangeQuery{.from = from, .to = to});
        }

        const bool sectionsRequested = printTable || printStats;
        const cli::ReportSections sections{
            .table = sectionsRequested ? printTable : queries.empty(),
            .stats = sectionsRequested ? printStats : queries.empty()
        };

        cli::Report report{std::move(binomial), std::move(queries), sections};
        report.render(std::cout, format);
    }
    catch (const std::exception& exc) {
        // The file sink may be what failed, and --log-level off mutes the logger.
        fmt::print(stderr, "binomkit: {}\n", exc.what());
        util::logger()->error("{}", exc.what());
        return 1;
    }

    return 0;
}

//-------------------------------------------------------------------------
