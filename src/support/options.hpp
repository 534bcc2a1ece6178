//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.hpp
// Purpose: Declares command-line settings shared by the analysis tools.
// Key invariants: symbolsOnly and pifOnly are never both set.
// Ownership/Lifetime: Caller owns option values.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace lexis::support
{

/// @brief Holds global command-line settings that influence analysis output.
/// @ownership Value type.
struct Options
{
    /// @brief Trace analysis stages (scan, classify, build) to stderr.
    bool trace = false;

    /// @brief Print every raw lexeme with its position before the tables.
    bool dumpTokens = false;

    /// @brief Print only the symbol table section.
    bool symbolsOnly = false;

    /// @brief Print only the program internal form section.
    bool pifOnly = false;

    /// @brief Destination file for the report; empty selects stdout.
    std::string outputPath{};
};
} // namespace lexis::support
