// File: tests/frontends/toy/AnalyzerTests.cpp
// Purpose: Exercise the end-to-end analysis pipeline and its driver.
// Key invariants: Success yields a sorted table and a consistent PIF; failure
//                 reports the first invalid lexeme and builds nothing.
// Ownership/Lifetime: Tests own the source managers and results.
// Links: docs/toy-language.md

#include <gtest/gtest.h>

#include "lexis/toy/Analyze.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

using namespace lexis::frontends::toy;
using lexis::support::SourceManager;

namespace
{
PifEntry sym(TokenKind kind, int64_t index)
{
    return PifEntry{kind, index};
}

PifEntry res(TokenKind kind)
{
    return PifEntry{kind, kNoSymbol};
}

AnalysisResult analyzeOk(std::string_view source)
{
    auto result = analyze(source);
    EXPECT_TRUE(result.hasValue()) << source;
    return result ? result.value() : AnalysisResult{};
}
} // namespace

TEST(ToyAnalyzer, DeclarationAndAssignment)
{
    AnalysisResult result = analyzeOk("int a ; a = 5 ;");
    EXPECT_EQ(result.symbols, (std::vector<std::string>{"5", "a"}));
    const std::vector<PifEntry> expected = {res(TokenKind::KwInt),
                                            sym(TokenKind::Identifier, 1),
                                            res(TokenKind::Semicolon),
                                            sym(TokenKind::Identifier, 1),
                                            res(TokenKind::Assign),
                                            sym(TokenKind::Constant, 0),
                                            res(TokenKind::Semicolon)};
    EXPECT_EQ(result.pif, expected);
}

TEST(ToyAnalyzer, ReservedOnlyInputHasEmptyTable)
{
    AnalysisResult result = analyzeOk("return ;");
    EXPECT_TRUE(result.symbols.empty());
    EXPECT_EQ(result.pif,
              (std::vector<PifEntry>{res(TokenKind::KwReturn), res(TokenKind::Semicolon)}));
}

TEST(ToyAnalyzer, ShiftOperatorSplitsIntoTwoLessThanTokens)
{
    AnalysisResult result = analyzeOk("if ( a == b ) { cout << a ; }");
    EXPECT_EQ(result.symbols, (std::vector<std::string>{"a", "b"}));
    const std::vector<PifEntry> expected = {res(TokenKind::KwIf),
                                            res(TokenKind::LParen),
                                            sym(TokenKind::Identifier, 0),
                                            res(TokenKind::EqualEqual),
                                            sym(TokenKind::Identifier, 1),
                                            res(TokenKind::RParen),
                                            res(TokenKind::LBrace),
                                            res(TokenKind::KwCout),
                                            res(TokenKind::Less),
                                            res(TokenKind::Less),
                                            sym(TokenKind::Identifier, 0),
                                            res(TokenKind::Semicolon),
                                            res(TokenKind::RBrace)};
    EXPECT_EQ(result.pif, expected);
}

TEST(ToyAnalyzer, EmptySourceProducesEmptyTables)
{
    AnalysisResult result = analyzeOk("");
    EXPECT_TRUE(result.symbols.empty());
    EXPECT_TRUE(result.pif.empty());
    EXPECT_EQ(analyzeOk(" \n\t "), AnalysisResult{});
}

TEST(ToyAnalyzer, RepeatedIdentifierSharesIndex)
{
    AnalysisResult result = analyzeOk("x x x x");
    EXPECT_EQ(result.symbols, (std::vector<std::string>{"x"}));
    ASSERT_EQ(result.pif.size(), 4u);
    for (const PifEntry &entry : result.pif)
        EXPECT_EQ(entry, sym(TokenKind::Identifier, 0));
}

TEST(ToyAnalyzer, UnicodeSpacesAreSkipped)
{
    const AnalysisResult expected{{"a", "b"},
                                  {sym(TokenKind::Identifier, 0), sym(TokenKind::Identifier, 1)}};
    EXPECT_EQ(analyzeOk("a\x1c" "b"), expected);
    EXPECT_EQ(analyzeOk("a\xC2\xA0" "b"), expected);
    EXPECT_EQ(analyzeOk("a\xE3\x80\x80" "b\n"), expected);
}

TEST(ToyAnalyzer, FailsOnFirstInvalidLexeme)
{
    auto result = analyze("int a ; a = 5 # ;");
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().message, "invalid token '#'");
    EXPECT_EQ(result.error().code, kInvalidTokenCode);
    EXPECT_EQ(result.error().loc.line, 1u);
    EXPECT_EQ(result.error().loc.column, 15u);
}

TEST(ToyAnalyzer, PropertiesHoldForLargerProgram)
{
    const std::string source = "int main ( ) {\n"
                               "  int n ; int i ; int s ;\n"
                               "  cin >> n ;\n"
                               "  s = 0 ; i = 1 ;\n"
                               "  while ( i <= n ) { s = s + i * i ; i = i + 1 ; }\n"
                               "  if ( s != 0 && n > 1 || n == 1 ) { cout << s ; }\n"
                               "  return 0 ;\n"
                               "}\n";
    AnalysisResult result = analyzeOk(source);

    EXPECT_TRUE(std::is_sorted(result.symbols.begin(), result.symbols.end()));
    EXPECT_EQ(std::adjacent_find(result.symbols.begin(), result.symbols.end()),
              result.symbols.end());
    const std::vector<RawLexeme> lexemes = scan(source);
    ASSERT_EQ(result.pif.size(), lexemes.size());
    for (std::size_t i = 0; i < lexemes.size(); ++i)
    {
        const PifEntry &entry = result.pif[i];
        if (isSymbolKind(entry.kind))
        {
            ASSERT_GE(entry.index, 0);
            ASSERT_LT(static_cast<std::size_t>(entry.index), result.symbols.size());
            EXPECT_EQ(result.symbols[static_cast<std::size_t>(entry.index)], lexemes[i].text);
        }
        else
        {
            EXPECT_EQ(entry.index, kNoSymbol);
            EXPECT_EQ(reservedSpelling(entry.kind), lexemes[i].text);
        }
    }
    EXPECT_EQ(analyzeOk(source), result);
}

TEST(ToyAnalyzerDriver, ReportsInvalidTokenPosition)
{
    SourceManager sm;
    AnalyzerInput input{"int x;\nx = 'ab';", "bad.toy"};
    AnalyzerResult result = analyzeSource(input, AnalyzerOptions{}, sm);

    EXPECT_FALSE(result.succeeded());
    ASSERT_TRUE(result.invalidToken.has_value());
    EXPECT_EQ(result.invalidToken->lexeme, "'");
    EXPECT_EQ(result.invalidToken->offset, 11u);
    EXPECT_EQ(result.invalidToken->loc.line, 2u);
    EXPECT_EQ(result.invalidToken->loc.column, 5u);
    EXPECT_TRUE(result.analysis.pif.empty());
    EXPECT_TRUE(result.analysis.symbols.empty());

    std::ostringstream err;
    result.diagnostics.printAll(err, &sm);
    EXPECT_EQ(err.str(), "bad.toy:2:5: error: invalid token ''' [L0001]\n");
}

TEST(ToyAnalyzerDriver, RegistersPlaceholderPath)
{
    SourceManager sm;
    AnalyzerResult result = analyzeSource(AnalyzerInput{"a = 1 ;"}, AnalyzerOptions{}, sm);
    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(sm.getPath(result.fileId), "<input>");
    EXPECT_EQ(result.analysis, analyzeOk("a = 1 ;"));
    EXPECT_TRUE(result.lexemes.empty());
}

TEST(ToyAnalyzerDriver, UsesProvidedFileId)
{
    SourceManager sm;
    const uint32_t id = sm.addFile("main.toy");
    AnalyzerInput input{"int main", "ignored.toy", id};
    AnalyzerOptions options;
    options.keepLexemes = true;
    AnalyzerResult result = analyzeSource(input, options, sm);

    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.fileId, id);
    EXPECT_EQ(sm.fileCount(), 1u);
    ASSERT_EQ(result.lexemes.size(), 2u);
    EXPECT_EQ(result.lexemes[1].loc.file_id, id);
}

TEST(ToyAnalyzerDriver, TraceNamesEachStage)
{
    SourceManager sm;
    std::ostringstream trace;
    AnalyzerOptions options;
    options.trace = &trace;
    AnalyzerResult ok = analyzeSource(AnalyzerInput{"int a ; a = 5 ;"}, options, sm);
    ASSERT_TRUE(ok.succeeded());
    EXPECT_EQ(trace.str(),
              "[toy] scan: 7 lexemes\n"
              "[toy] classify: 7 tokens\n"
              "[toy] pif: 2 symbols, tree height 2, 7 entries\n");

    trace.str("");
    AnalyzerResult bad = analyzeSource(AnalyzerInput{"a # b", "other"}, options, sm);
    EXPECT_FALSE(bad.succeeded());
    EXPECT_EQ(trace.str(),
              "[toy] scan: 3 lexemes\n"
              "[toy] classify: rejected '#' at lexeme 1\n");
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
