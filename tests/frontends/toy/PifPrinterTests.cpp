// File: tests/frontends/toy/PifPrinterTests.cpp
// Purpose: Golden checks for the symbol table, PIF and lexeme listings.
// Key invariants: Output layout is stable line by line.
// Ownership/Lifetime: N/A (test).
// Links: docs/toy-language.md

#include <gtest/gtest.h>

#include "lexis/toy/Analyze.hpp"

#include <sstream>

using namespace lexis::frontends::toy;

TEST(ToyPifPrinter, PrintsTableThenPif)
{
    auto result = analyze("int a ; a = 5 ;");
    ASSERT_TRUE(result.hasValue());
    std::ostringstream os;
    printAnalysis(result.value(), os);
    EXPECT_EQ(os.str(),
              "TS (symbol table):\n"
              "0 5\n"
              "1 a\n"
              "\n"
              "FIP (program internal form):\n"
              "(2, -1)\n"
              "(0, 1)\n"
              "(16, -1)\n"
              "(0, 1)\n"
              "(30, -1)\n"
              "(1, 0)\n"
              "(16, -1)\n");
}

TEST(ToyPifPrinter, EmptySectionsKeepHeadings)
{
    std::ostringstream os;
    printAnalysis(AnalysisResult{}, os);
    EXPECT_EQ(os.str(), "TS (symbol table):\n\nFIP (program internal form):\n");
}

TEST(ToyPifPrinter, LexemeListingMarksInvalidText)
{
    std::ostringstream os;
    printLexemes(scan("int #\n  x1 'c'"), os);
    EXPECT_EQ(os.str(),
              "1:1 int int\n"
              "1:5 invalid #\n"
              "2:3 identifier x1\n"
              "2:6 constant 'c'\n");
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
