//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/toy/Analyzer.hpp
// Purpose: Declares the lexical analysis driver for toy source text.
//
// ## Analysis Pipeline
//
// 1. **Scanning** - Split source text into raw lexemes (Scanner)
// 2. **Classification** - Map each lexeme to a token kind (Classifier);
//    the first invalid lexeme aborts the run
// 3. **PIF construction** - Insert symbols and resolve final ranks (PifBuilder)
//
// ## Usage
//
// ```cpp
// SourceManager sm;
// AnalyzerInput input{.source = text, .path = "prog.toy"};
// AnalyzerResult result = analyzeSource(input, AnalyzerOptions{}, sm);
// if (result.succeeded()) {
//     // result.analysis.symbols, result.analysis.pif
// } else {
//     // result.invalidToken, result.diagnostics
// }
// ```
//
// Key invariants: On failure the analysis holds no symbols and no PIF entries.
// Ownership/Lifetime: Results own their data; the SourceManager is borrowed.
// Links: docs/toy-language.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/toy/PifBuilder.hpp"
#include "frontends/toy/Scanner.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace lexis::frontends::toy
{

/// @brief Symbol table keys and the PIF produced for one source buffer.
struct AnalysisResult
{
    /// @brief Distinct identifiers and constants in ascending byte order.
    std::vector<std::string> symbols;

    /// @brief One entry per lexeme; symbol entries index into symbols.
    std::vector<PifEntry> pif;

    friend bool operator==(const AnalysisResult &, const AnalysisResult &) = default;
};

/// @brief The first lexeme that failed classification.
struct InvalidToken
{
    std::string lexeme;
    support::SourceLoc loc; ///< Line and column of the first character.
    std::size_t offset{0};  ///< Byte offset of the first character.
};

/// @brief Analyze @p source in memory.
/// @param source Text to analyze.
/// @param fileId Identifier stamped into diagnostic locations; 0 when anonymous.
/// @return Symbols and PIF, or the L0001 diagnostic of the first invalid token.
support::Expected<AnalysisResult> analyze(std::string_view source, uint32_t fileId = 0);

/// @brief Input parameters describing the source to analyze.
struct AnalyzerInput
{
    /// @brief Source text to analyze.
    std::string_view source;

    /// @brief Path used for diagnostics; defaults to "<input>" when empty.
    std::string_view path{"<input>"};

    /// @brief Existing file id within the supplied source manager, if any.
    std::optional<uint32_t> fileId{};
};

/// @brief Options controlling what analyzeSource records besides the tables.
struct AnalyzerOptions
{
    /// @brief Keep the raw lexemes in AnalyzerResult::lexemes.
    bool keepLexemes{false};

    /// @brief Destination for per-stage trace lines; nullptr disables tracing.
    std::ostream *trace{nullptr};
};

/// @brief Aggregated result of analyzing one source buffer.
struct AnalyzerResult
{
    /// @brief Diagnostics accumulated during analysis.
    support::DiagnosticEngine diagnostics{};

    /// @brief File identifier used for the analyzed source.
    uint32_t fileId{0};

    /// @brief Tables produced on success; empty on failure.
    AnalysisResult analysis{};

    /// @brief First invalid lexeme when classification failed.
    std::optional<InvalidToken> invalidToken{};

    /// @brief Raw lexemes, populated when AnalyzerOptions::keepLexemes is set.
    std::vector<RawLexeme> lexemes{};

    /// @brief Helper indicating whether analysis completed without errors.
    [[nodiscard]] bool succeeded() const;
};

/// @brief Analyze source text registered with @p sm.
/// @param input Source information describing the buffer to analyze.
/// @param options Recording and tracing options.
/// @param sm Source manager used to resolve diagnostic file names.
/// @return Tables, diagnostics and the invalid token if any.
AnalyzerResult analyzeSource(const AnalyzerInput &input,
                             const AnalyzerOptions &options,
                             support::SourceManager &sm);

} // namespace lexis::frontends::toy
