// File: tests/frontends/toy/TokenKindTests.cpp
// Purpose: Verify the reserved catalog and the stable PIF codes of every token kind.
// Key invariants: Codes are dense, fixed, and each reserved spelling maps to one kind.
// Ownership/Lifetime: N/A (test).
// Links: docs/toy-language.md

#include <gtest/gtest.h>

#include "frontends/toy/TokenKind.hpp"

#include <string_view>
#include <utility>
#include <vector>

using namespace lexis::frontends::toy;

TEST(ToyTokenKind, ReservedSpellingsMapToFixedCodes)
{
    const std::vector<std::pair<std::string_view, int>> expected = {
        {"int", 2},   {"char", 3},  {"string", 4}, {"bool", 5},    {"const", 6}, {"for", 7},
        {"while", 8}, {"do", 9},    {"if", 10},    {"else", 11},   {"cin", 12},  {"cout", 13},
        {"return", 14}, {"main", 15}, {";", 16},   {",", 17},      {".", 18},    {"+", 19},
        {"*", 20},    {"(", 21},    {")", 22},     {"[", 23},      {"]", 24},    {"{", 25},
        {"}", 26},    {"-", 27},    {"<", 28},     {">", 29},      {"=", 30},    {"==", 31},
        {":", 32},    {"<=", 33},   {">=", 34},    {"!=", 35},     {"&&", 36},   {"||", 37},
    };

    for (const auto &[lexeme, code] : expected)
    {
        auto kind = lookupReserved(lexeme);
        ASSERT_TRUE(kind.has_value()) << lexeme;
        EXPECT_EQ(tokenKindCode(*kind), code) << lexeme;
        EXPECT_EQ(reservedSpelling(*kind), lexeme);
    }
}

TEST(ToyTokenKind, SymbolKindsHaveCodesZeroAndOne)
{
    EXPECT_EQ(tokenKindCode(TokenKind::Identifier), 0);
    EXPECT_EQ(tokenKindCode(TokenKind::Constant), 1);
    EXPECT_TRUE(isSymbolKind(TokenKind::Identifier));
    EXPECT_TRUE(isSymbolKind(TokenKind::Constant));
    EXPECT_FALSE(isSymbolKind(TokenKind::KwInt));
    EXPECT_FALSE(isSymbolKind(TokenKind::Semicolon));
    EXPECT_TRUE(reservedSpelling(TokenKind::Identifier).empty());
}

TEST(ToyTokenKind, LookupIsExactAndCaseSensitive)
{
    EXPECT_FALSE(lookupReserved("While").has_value());
    EXPECT_FALSE(lookupReserved("INT").has_value());
    EXPECT_FALSE(lookupReserved("<<").has_value());
    EXPECT_FALSE(lookupReserved("!").has_value());
    EXPECT_FALSE(lookupReserved("&").has_value());
    EXPECT_FALSE(lookupReserved("").has_value());
    EXPECT_FALSE(lookupReserved("whiles").has_value());
    EXPECT_EQ(lookupReserved("while"), TokenKind::KwWhile);
}

TEST(ToyTokenKind, CodesRoundTripThroughKinds)
{
    for (int code = 0; code < kTokenKindCount; ++code)
    {
        auto kind = tokenKindFromCode(code);
        ASSERT_TRUE(kind.has_value());
        EXPECT_EQ(tokenKindCode(*kind), code);
    }
    EXPECT_FALSE(tokenKindFromCode(-1).has_value());
    EXPECT_FALSE(tokenKindFromCode(kTokenKindCount).has_value());
}

TEST(ToyTokenKind, KindNamesUseSpellings)
{
    EXPECT_STREQ(tokenKindToString(TokenKind::Identifier), "identifier");
    EXPECT_STREQ(tokenKindToString(TokenKind::Constant), "constant");
    EXPECT_STREQ(tokenKindToString(TokenKind::LessEqual), "<=");
    EXPECT_STREQ(tokenKindToString(TokenKind::KwReturn), "return");
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
