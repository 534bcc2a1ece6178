//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/toy/Classifier.cpp
// Purpose: Implements token classification against the catalog and literal patterns.
// Key invariants: Pure function of its input and the static catalog.
// Ownership/Lifetime: Returned tokens own copies of the lexeme text.
// Links: docs/toy-language.md
//
//===----------------------------------------------------------------------===//

#include "frontends/toy/Classifier.hpp"
#include "frontends/common/CharUtils.hpp"

namespace lexis::frontends::toy
{
using namespace common::char_utils;

bool isIdentifierLexeme(std::string_view text)
{
    return !text.empty() && isIdentifierStart(text.front()) &&
           allOf(text.substr(1), isIdentifierContinue);
}

bool isIntegerLexeme(std::string_view text)
{
    return !text.empty() && allOf(text, isDigit);
}

bool isCharLexeme(std::string_view text)
{
    return text.size() == 3 && text[0] == '\'' && isAlphanumeric(text[1]) && text[2] == '\'';
}

bool isStringLexeme(std::string_view text)
{
    return text.size() >= 2 && text.front() == '"' && text.back() == '"' &&
           allOf(text.substr(1, text.size() - 2), isAlphanumeric);
}

bool isConstantLexeme(std::string_view text)
{
    return isIntegerLexeme(text) || isCharLexeme(text) || isStringLexeme(text);
}

support::Diag makeInvalidTokenDiag(std::string_view text, support::SourceLoc loc)
{
    return support::makeError(
        loc, "invalid token '" + std::string(text) + "'", std::string(kInvalidTokenCode));
}

support::Expected<ClassifiedToken> classify(std::string_view text, support::SourceLoc loc)
{
    if (auto reserved = lookupReserved(text))
        return ClassifiedToken::reserved(*reserved);

    if (isIdentifierLexeme(text))
        return ClassifiedToken::symbol(TokenKind::Identifier, std::string(text));

    if (isConstantLexeme(text))
        return ClassifiedToken::symbol(TokenKind::Constant, std::string(text));

    return makeInvalidTokenDiag(text, loc);
}

support::Expected<ClassifiedToken> classify(const RawLexeme &lexeme)
{
    return classify(lexeme.text, lexeme.loc);
}

} // namespace lexis::frontends::toy
