/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <magic_enum.hpp>

#include <map>
#include <string>

//-------------------------------------------------------------------------

namespace binomkit::cli
{

//-------------------------------------------------------------------------

enum class OutputFormat { human, csv, json };

[[nodiscard]] inline std::map<std::string, OutputFormat> outputFormatsByName()
{
    static constexpr auto kEntries = magic_enum::enum_entries<OutputFormat>();
    return kEntries
        | views::transform([](const auto& entry) {
            return std::pair{std::string{entry.second}, entry.first};
        })
        | ranges::to<std::map<std::string, OutputFormat>>();
}

//-------------------------------------------------------------------------

}  // namespace binomkit::cli

//-------------------------------------------------------------------------
