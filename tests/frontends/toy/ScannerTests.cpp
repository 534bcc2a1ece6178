// File: tests/frontends/toy/ScannerTests.cpp
// Purpose: Verify longest-match splitting, literal shapes and position tracking.
// Key invariants: Whitespace never appears in lexemes; the scanner never fails.
// Ownership/Lifetime: Tests own all source buffers.
// Links: docs/toy-language.md

#include <gtest/gtest.h>

#include "frontends/toy/Scanner.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace lexis::frontends::toy;

namespace
{
std::vector<std::string> texts(std::string_view source)
{
    std::vector<std::string> out;
    for (const RawLexeme &lexeme : scan(source))
        out.push_back(lexeme.text);
    return out;
}

using Texts = std::vector<std::string>;
} // namespace

TEST(ToyScanner, SplitsOnWhitespace)
{
    EXPECT_EQ(texts("int a ; a = 5 ;"), (Texts{"int", "a", ";", "a", "=", "5", ";"}));
}

TEST(ToyScanner, SplitsWithoutWhitespace)
{
    EXPECT_EQ(texts("a=b+c*(d-e);"),
              (Texts{"a", "=", "b", "+", "c", "*", "(", "d", "-", "e", ")", ";"}));
}

TEST(ToyScanner, PrefersTwoCharacterOperators)
{
    EXPECT_EQ(texts("a<=b==c!=d>=e&&f||g"),
              (Texts{"a", "<=", "b", "==", "c", "!=", "d", ">=", "e", "&&", "f", "||", "g"}));
    EXPECT_EQ(texts("==="), (Texts{"==", "="}));
    EXPECT_EQ(texts("=<"), (Texts{"=", "<"}));
}

TEST(ToyScanner, ShiftOperatorIsTwoLessThans)
{
    EXPECT_EQ(texts("cout << a"), (Texts{"cout", "<", "<", "a"}));
}

TEST(ToyScanner, IdentifiersAndIntegers)
{
    EXPECT_EQ(texts("_x1 9abc x_9_"), (Texts{"_x1", "9", "abc", "x_9_"}));
    EXPECT_EQ(texts("007"), (Texts{"007"}));
}

TEST(ToyScanner, CharacterLiteralHoldsOneAlphanumeric)
{
    EXPECT_EQ(texts("'a'"), (Texts{"'a'"}));
    EXPECT_EQ(texts("'7'"), (Texts{"'7'"}));
    EXPECT_EQ(texts("'ab'"), (Texts{"'", "ab", "'"}));
    EXPECT_EQ(texts("'_'"), (Texts{"'", "_", "'"}));
    EXPECT_EQ(texts("''"), (Texts{"'", "'"}));
    EXPECT_EQ(texts("'a"), (Texts{"'", "a"}));
}

TEST(ToyScanner, StringLiteralHoldsAlphanumericsOnly)
{
    EXPECT_EQ(texts("\"abc\""), (Texts{"\"abc\""}));
    EXPECT_EQ(texts("\"\""), (Texts{"\"\""}));
    EXPECT_EQ(texts("\"a b\""), (Texts{"\"", "a", "b", "\""}));
    EXPECT_EQ(texts("\"abc"), (Texts{"\"", "abc"}));
    EXPECT_EQ(texts("\"a_b\""), (Texts{"\"", "a_b", "\""}));
}

TEST(ToyScanner, UnknownCharactersBecomeSingleLexemes)
{
    EXPECT_EQ(texts("a#b"), (Texts{"a", "#", "b"}));
    EXPECT_EQ(texts("!x"), (Texts{"!", "x"}));
    EXPECT_EQ(texts("&|"), (Texts{"&", "|"}));
    // U+00E9 stays one lexeme.
    EXPECT_EQ(texts("x\xC3\xA9y"), (Texts{"x", "\xC3\xA9", "y"}));
}

TEST(ToyScanner, EmptyAndBlankSourcesYieldNothing)
{
    EXPECT_TRUE(scan("").empty());
    EXPECT_TRUE(scan(" \t\r\n\v\f ").empty());
}

TEST(ToyScanner, TracksOffsetsLinesAndColumns)
{
    auto lexemes = scan("int\n  x;\r\n\tb", 7);
    ASSERT_EQ(lexemes.size(), 4u);

    EXPECT_EQ(lexemes[0].text, "int");
    EXPECT_EQ(lexemes[0].offset, 0u);
    EXPECT_EQ(lexemes[0].loc.line, 1u);
    EXPECT_EQ(lexemes[0].loc.column, 1u);
    EXPECT_EQ(lexemes[0].loc.file_id, 7u);

    EXPECT_EQ(lexemes[1].text, "x");
    EXPECT_EQ(lexemes[1].offset, 6u);
    EXPECT_EQ(lexemes[1].loc.line, 2u);
    EXPECT_EQ(lexemes[1].loc.column, 3u);

    EXPECT_EQ(lexemes[2].text, ";");
    EXPECT_EQ(lexemes[2].offset, 7u);
    EXPECT_EQ(lexemes[2].loc.column, 4u);

    EXPECT_EQ(lexemes[3].text, "b");
    EXPECT_EQ(lexemes[3].offset, 11u);
    EXPECT_EQ(lexemes[3].loc.line, 3u);
    EXPECT_EQ(lexemes[3].loc.column, 2u);
}

TEST(ToyScanner, UnicodeSpacesSeparateLexemes)
{
    EXPECT_EQ(texts("a\xC2\xA0" "b"), (Texts{"a", "b"}));
    EXPECT_EQ(texts("a\x1c" "b\x1f" "c"), (Texts{"a", "b", "c"}));
    EXPECT_EQ(texts("x\xC2\x85y\xE1\x9A\x80z"), (Texts{"x", "y", "z"}));
    EXPECT_EQ(texts("\xE2\x80\x80" "a\xE2\x80\x8A=\xE2\x80\xA8" "b\xE2\x80\xA9;"),
              (Texts{"a", "=", "b", ";"}));
    EXPECT_EQ(texts("c\xE2\x80\xAF" "d\xE2\x81\x9F" "e\xE3\x80\x80"), (Texts{"c", "d", "e"}));
    // Zero-width space and a bare lead byte are not whitespace.
    EXPECT_EQ(texts("a\xE2\x80\x8B" "b"), (Texts{"a", "\xE2\x80\x8B", "b"}));
    EXPECT_EQ(texts("a\xC2"), (Texts{"a", "\xC2"}));
}

TEST(ToyScanner, MultiByteSpacesAdvanceColumnsByBytes)
{
    const auto lexemes = scan("a\xC2\xA0" "b");
    ASSERT_EQ(lexemes.size(), 2u);
    EXPECT_EQ(lexemes[1].offset, 3u);
    EXPECT_EQ(lexemes[1].loc.line, 1u);
    EXPECT_EQ(lexemes[1].loc.column, 4u);
}

TEST(ToyScanner, NextStopsAtEndOfInput)
{
    Scanner scanner("a  ");
    auto first = scanner.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->text, "a");
    EXPECT_FALSE(scanner.next().has_value());
    EXPECT_FALSE(scanner.next().has_value());
    EXPECT_TRUE(scanner.eof());
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
