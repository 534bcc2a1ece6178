//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/toy/Analyzer.cpp
// Purpose: Implements the scan, classify and PIF construction pipeline.
// Key invariants: Fail-fast; nothing is built once a lexeme fails to classify.
// Ownership/Lifetime: Every run owns a fresh symbol table.
// Links: docs/toy-language.md
//
//===----------------------------------------------------------------------===//

#include "frontends/toy/Analyzer.hpp"
#include "frontends/toy/Classifier.hpp"

#include <utility>

namespace lexis::frontends::toy
{
namespace
{
/// Outcome of classifying every lexeme of a buffer.
struct Classification
{
    std::vector<ClassifiedToken> tokens;
    std::optional<std::size_t> failedAt; ///< Index of the first invalid lexeme
    std::optional<support::Diag> error;
};

Classification classifyAll(const std::vector<RawLexeme> &lexemes)
{
    Classification out;
    out.tokens.reserve(lexemes.size());
    for (std::size_t i = 0; i < lexemes.size(); ++i)
    {
        auto token = classify(lexemes[i]);
        if (!token)
        {
            out.failedAt = i;
            out.error = token.error();
            out.tokens.clear();
            return out;
        }
        out.tokens.push_back(std::move(token.value()));
    }
    return out;
}

AnalysisResult toAnalysis(PifBuild build)
{
    return AnalysisResult{build.table.inOrderKeys(), std::move(build.pif)};
}

void traceLine(std::ostream *trace, std::string_view stage, const std::string &detail)
{
    if (trace)
        *trace << "[toy] " << stage << ": " << detail << '\n';
}
} // namespace

support::Expected<AnalysisResult> analyze(std::string_view source, uint32_t fileId)
{
    Classification classified = classifyAll(scan(source, fileId));
    if (classified.error)
        return std::move(*classified.error);
    return toAnalysis(buildPif(classified.tokens));
}

bool AnalyzerResult::succeeded() const
{
    return diagnostics.errorCount() == 0;
}

AnalyzerResult analyzeSource(const AnalyzerInput &input,
                             const AnalyzerOptions &options,
                             support::SourceManager &sm)
{
    AnalyzerResult result{};

    if (input.fileId.has_value())
    {
        result.fileId = *input.fileId;
    }
    else
    {
        std::string path = input.path.empty() ? std::string{"<input>"} : std::string{input.path};
        result.fileId = sm.addFile(std::move(path));
    }

    if (result.fileId == 0)
    {
        result.diagnostics.report(
            support::makeError({},
                               std::string{support::kSourceManagerFileIdOverflowMessage},
                               std::string{support::kSourceManagerOverflowCode}));
        return result;
    }

    // Phase 1: Scanning
    std::vector<RawLexeme> lexemes = scan(input.source, result.fileId);
    traceLine(options.trace, "scan", std::to_string(lexemes.size()) + " lexemes");

    // Phase 2: Classification
    Classification classified = classifyAll(lexemes);
    if (classified.error)
    {
        const RawLexeme &bad = lexemes[*classified.failedAt];
        traceLine(options.trace, "classify", "rejected '" + bad.text + "' at lexeme " +
                                                 std::to_string(*classified.failedAt));
        result.invalidToken = InvalidToken{bad.text, bad.loc, bad.offset};
        result.diagnostics.report(std::move(*classified.error));
        if (options.keepLexemes)
            result.lexemes = std::move(lexemes);
        return result;
    }
    traceLine(options.trace, "classify", std::to_string(classified.tokens.size()) + " tokens");

    // Phase 3: PIF construction
    PifBuild build = buildPif(classified.tokens);
    traceLine(options.trace,
              "pif",
              std::to_string(build.table.size()) + " symbols, tree height " +
                  std::to_string(build.table.height()) + ", " +
                  std::to_string(build.pif.size()) + " entries");
    result.analysis = toAnalysis(std::move(build));

    if (options.keepLexemes)
        result.lexemes = std::move(lexemes);
    return result;
}

} // namespace lexis::frontends::toy
