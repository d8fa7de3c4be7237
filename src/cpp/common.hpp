/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <magic_enum.hpp>
#include <pugixml.hpp>
#include <range/v3/all.hpp>

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

namespace views = ranges::views;

//-------------------------------------------------------------------------

namespace binomkit
{

using Count = uint32_t;

}  // namespace binomkit

//-------------------------------------------------------------------------
