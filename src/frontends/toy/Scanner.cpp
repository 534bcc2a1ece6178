//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/toy/Scanner.cpp
// Purpose: Implements longest-match splitting of toy source into raw lexemes.
// Key invariants: Earlier alternatives win; no backtracking into emitted lexemes.
// Ownership/Lifetime: Scanner borrows the source buffer.
// Links: docs/toy-language.md
//
//===----------------------------------------------------------------------===//

#include "frontends/toy/Scanner.hpp"

#include <array>

namespace lexis::frontends::toy
{
namespace
{
using namespace common::char_utils;

constexpr std::array<std::string_view, 6> kTwoCharOperators = {"==", "!=", "<=", ">=", "&&", "||"};

[[nodiscard]] bool isUtf8Lead(unsigned char c) noexcept
{
    return c >= 0xC0 && c <= 0xF7;
}

[[nodiscard]] bool isUtf8Continuation(unsigned char c) noexcept
{
    return (c & 0xC0) == 0x80;
}
} // namespace

Scanner::Scanner(std::string_view source, uint32_t fileId)
    : LexerCursor<Scanner>(fileId), source_(source)
{
}

std::optional<RawLexeme> Scanner::next()
{
    common::lexer_base::skipAllWhitespace(*this);
    if (eof())
        return std::nullopt;

    RawLexeme lexeme;
    lexeme.offset = position();
    lexeme.loc = currentLoc();

    const std::size_t length = matchLength();
    lexeme.text = std::string(source_.substr(lexeme.offset, length));
    advance(length);
    return lexeme;
}

std::vector<RawLexeme> Scanner::scanAll()
{
    std::vector<RawLexeme> lexemes;
    while (auto lexeme = next())
        lexemes.push_back(std::move(*lexeme));
    return lexemes;
}

std::size_t Scanner::matchLength() const
{
    if (hasAhead(2))
    {
        const std::string_view pair = source_.substr(position(), 2);
        for (std::string_view op : kTwoCharOperators)
        {
            if (pair == op)
                return 2;
        }
    }

    const char c = peek();
    if (isIdentifierStart(c))
    {
        std::size_t length = 1;
        while (isIdentifierContinue(peek(length)))
            ++length;
        return length;
    }

    if (isDigit(c))
    {
        std::size_t length = 1;
        while (isDigit(peek(length)))
            ++length;
        return length;
    }

    if (c == '\'')
    {
        if (std::size_t length = matchCharLiteral())
            return length;
    }
    else if (c == '"')
    {
        if (std::size_t length = matchStringLiteral())
            return length;
    }

    return matchFallback();
}

/// Exactly one alphanumeric between single quotes; 0 when the shape does not match.
std::size_t Scanner::matchCharLiteral() const
{
    if (hasAhead(3) && isAlphanumeric(peek(1)) && peek(2) == '\'')
        return 3;
    return 0;
}

/// Zero or more alphanumerics between double quotes; 0 when unterminated or
/// when a non-alphanumeric character appears before the closing quote.
std::size_t Scanner::matchStringLiteral() const
{
    std::size_t length = 1;
    while (hasAhead(length + 1) && isAlphanumeric(peek(length)))
        ++length;
    if (hasAhead(length + 1) && peek(length) == '"')
        return length + 1;
    return 0;
}

/// One character.  A UTF-8 encoded code point is kept whole so diagnostics
/// quote the character the author typed rather than a stray byte.
std::size_t Scanner::matchFallback() const
{
    const auto lead = static_cast<unsigned char>(peek());
    if (!isUtf8Lead(lead))
        return 1;

    const std::size_t expected = lead >= 0xF0 ? 4 : lead >= 0xE0 ? 3 : 2;
    std::size_t length = 1;
    while (length < expected && hasAhead(length + 1) &&
           isUtf8Continuation(static_cast<unsigned char>(peek(length))))
        ++length;
    return length;
}

std::vector<RawLexeme> scan(std::string_view source, uint32_t fileId)
{
    Scanner scanner(source, fileId);
    return scanner.scanAll();
}

} // namespace lexis::frontends::toy
