/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>

//-------------------------------------------------------------------------

namespace binomkit::util
{

//-------------------------------------------------------------------------

inline constexpr std::string_view kLoggerName = "binomkit";

/**
 * Process-wide logger shared by the library and the CLI. Created on first
 * use with a stderr sink at level warn.
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

struct LoggingOptions
{
    spdlog::level::level_enum level = spdlog::level::warn;
    std::optional<fs::path> logFile = {};
};

/**
 * Sets the level of logger() and adds a file sink when requested.
 *
 * @throws spdlog::spdlog_ex if the log file cannot be opened; the logger is
 *         left unchanged in that case.
 */
void setupLogging(const LoggingOptions& options);

//-------------------------------------------------------------------------

}  // namespace binomkit::util

//-------------------------------------------------------------------------
