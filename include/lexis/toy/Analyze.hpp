// File: include/lexis/toy/Analyze.hpp
// Purpose: Stable façade for toy-language lexical analysis.
// Key invariants: Re-exports the supported analysis interfaces; scanner internals stay internal.
// Ownership/Lifetime: Types mirror the underlying frontend implementations.
// Links: docs/toy-language.md
#pragma once

#include "frontends/toy/Analyzer.hpp"
#include "frontends/toy/PifPrinter.hpp"
#include "frontends/toy/TokenKind.hpp"

/// @file include/lexis/toy/Analyze.hpp
/// @brief Aggregated public header for toy lexical analysis.  Provides
///        analyze()/analyzeSource(), the PIF and symbol table types, token
///        kind codes, and the text printers.
