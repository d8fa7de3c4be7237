/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "binomkit/util/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

//-------------------------------------------------------------------------

namespace binomkit::util
{

//-------------------------------------------------------------------------

std::shared_ptr<spdlog::logger> logger()
{
    static const std::shared_ptr<spdlog::logger> s_logger = [] {
        auto logger = std::make_shared<spdlog::logger>(
            std::string{kLoggerName},
            std::make_shared<spdlog::sinks::stderr_sink_mt>());
        logger->set_level(spdlog::level::warn);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        return logger;
    }();
    return s_logger;
}

//-------------------------------------------------------------------------

void setupLogging(const LoggingOptions& options)
{
    auto log = logger();

    // Open the file first so that a failure leaves the logger untouched.
    if (options.logFile.has_value()) {
        const fs::path& filepath = options.logFile.value();
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filepath.string());
        sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        log->sinks().push_back(std::move(sink));
    }

    log->set_level(options.level);
    if (options.logFile.has_value()) {
        log->debug("logging to '{}'", options.logFile->string());
    }
}

//-------------------------------------------------------------------------

}  // namespace binomkit::util

//-------------------------------------------------------------------------
