/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------

namespace binomkit
{

//-------------------------------------------------------------------------

/**
 * Raised when an argument that must be an integer is not integral.
 */
class TypeError : public std::invalid_argument
{
public:
    TypeError(const std::string& message) : std::invalid_argument(message) {}
    TypeError(const TypeError& exception) = default;
    TypeError(TypeError&& exception) = default;
};

//-------------------------------------------------------------------------

/**
 * Raised when an argument lies outside its valid domain.
 */
class ValueError : public std::domain_error
{
public:
    ValueError(const std::string& message) : std::domain_error(message) {}
    ValueError(const ValueError& exception) = default;
    ValueError(ValueError&& exception) = default;
};

//-------------------------------------------------------------------------

}  // namespace binomkit

//-------------------------------------------------------------------------
