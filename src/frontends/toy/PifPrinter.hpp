//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/toy/PifPrinter.hpp
// Purpose: Declares text renderers for symbol tables, PIFs and lexeme dumps.
// Key invariants: Output is deterministic and newline terminated.
// Ownership/Lifetime: Printers borrow their inputs and the output stream.
// Links: docs/toy-language.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/toy/Analyzer.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace lexis::frontends::toy
{

/// @brief Write "TS (symbol table):" followed by "<index> <symbol>" lines.
void printSymbolTable(const std::vector<std::string> &symbols, std::ostream &os);

/// @brief Write "FIP (program internal form):" followed by "(<code>, <index>)" lines.
void printPif(const std::vector<PifEntry> &pif, std::ostream &os);

/// @brief Write the symbol table, a blank line, then the PIF.
void printAnalysis(const AnalysisResult &result, std::ostream &os);

/// @brief Write one "<line>:<column> <kind> <lexeme>" line per lexeme.
/// @details Lexemes outside the vocabulary print with kind "invalid".
void printLexemes(const std::vector<RawLexeme> &lexemes, std::ostream &os);

} // namespace lexis::frontends::toy
