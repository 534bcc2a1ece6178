//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// Implements the text renderers used by the toylex tool and golden tests.
// The symbol table and PIF sections use the layout of the classic
// lexical-analysis lab reports: an index/value listing for the table and
// parenthesised (code, index) pairs for the PIF.
//
//===----------------------------------------------------------------------===//

#include "frontends/toy/PifPrinter.hpp"
#include "frontends/toy/Classifier.hpp"

namespace lexis::frontends::toy
{

void printSymbolTable(const std::vector<std::string> &symbols, std::ostream &os)
{
    os << "TS (symbol table):\n";
    for (std::size_t i = 0; i < symbols.size(); ++i)
        os << i << ' ' << symbols[i] << '\n';
}

void printPif(const std::vector<PifEntry> &pif, std::ostream &os)
{
    os << "FIP (program internal form):\n";
    for (const PifEntry &entry : pif)
        os << '(' << entry.code() << ", " << entry.index << ")\n";
}

void printAnalysis(const AnalysisResult &result, std::ostream &os)
{
    printSymbolTable(result.symbols, os);
    os << '\n';
    printPif(result.pif, os);
}

void printLexemes(const std::vector<RawLexeme> &lexemes, std::ostream &os)
{
    for (const RawLexeme &lexeme : lexemes)
    {
        os << lexeme.loc.line << ':' << lexeme.loc.column << ' ';
        auto token = classify(lexeme);
        os << (token ? tokenKindToString(token.value().kind) : "invalid");
        os << ' ' << lexeme.text << '\n';
    }
}

} // namespace lexis::frontends::toy
