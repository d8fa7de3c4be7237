/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <iosfwd>

//-------------------------------------------------------------------------

namespace binomkit
{

//-------------------------------------------------------------------------

class IPrintable
{
public:
    virtual ~IPrintable() noexcept = default;

    virtual void print(std::ostream& os) const = 0;

protected:
    IPrintable() noexcept = default;
};

//-------------------------------------------------------------------------

class IHumanPrintable : public virtual IPrintable
{
public:
    virtual void printHuman(std::ostream& os) const = 0;
    void print(std::ostream& os) const override { printHuman(os); }

protected:
    IHumanPrintable() noexcept = default;
};

//-------------------------------------------------------------------------

class CSVPrintable
{
public:
    virtual ~CSVPrintable() noexcept = default;

    virtual void printCSV(std::ostream& os) const = 0;

protected:
    CSVPrintable() noexcept = default;
};

//-------------------------------------------------------------------------

}  // namespace binomkit

//-------------------------------------------------------------------------
