//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/toy/TokenKind.hpp
// Purpose: Declares the closed token kind enumeration and the reserved lexeme catalog.
// Key invariants: Enumerator values are the stable PIF codes; do not reorder.
// Ownership/Lifetime: All returned strings point to static storage.
// Links: docs/toy-language.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string_view>

namespace lexis::frontends::toy
{

/// @brief Every token category of the toy language.
/// @details The underlying value of each enumerator is the integer code
///          written into the program internal form.  Identifier and Constant
///          are the only kinds that reference the symbol table; every other
///          kind corresponds to exactly one reserved lexeme.
enum class TokenKind : int
{
    Identifier = 0, ///< User name
    Constant = 1,   ///< Integer, character or string literal

    // Keywords
    KwInt = 2,
    KwChar = 3,
    KwString = 4,
    KwBool = 5,
    KwConst = 6,
    KwFor = 7,
    KwWhile = 8,
    KwDo = 9,
    KwIf = 10,
    KwElse = 11,
    KwCin = 12,
    KwCout = 13,
    KwReturn = 14,
    KwMain = 15,

    // Punctuation and operators
    Semicolon = 16,    ///< ;
    Comma = 17,        ///< ,
    Dot = 18,          ///< .
    Plus = 19,         ///< +
    Star = 20,         ///< *
    LParen = 21,       ///< (
    RParen = 22,       ///< )
    LBracket = 23,     ///< [
    RBracket = 24,     ///< ]
    LBrace = 25,       ///< {
    RBrace = 26,       ///< }
    Minus = 27,        ///< -
    Less = 28,         ///< <
    Greater = 29,      ///< >
    Assign = 30,       ///< =
    EqualEqual = 31,   ///< ==
    Colon = 32,        ///< :
    LessEqual = 33,    ///< <=
    GreaterEqual = 34, ///< >=
    NotEqual = 35,     ///< !=
    AndAnd = 36,       ///< &&
    OrOr = 37,         ///< ||
};

/// @brief Number of token kinds; codes are dense in [0, kTokenKindCount).
inline constexpr int kTokenKindCount = 38;

/// @brief Integer code of @p kind as written into the PIF.
[[nodiscard]] constexpr int tokenKindCode(TokenKind kind) noexcept
{
    return static_cast<int>(kind);
}

/// @brief Map a PIF code back to its token kind.
/// @return The kind, or std::nullopt when @p code is outside the catalog.
[[nodiscard]] std::optional<TokenKind> tokenKindFromCode(int code);

/// @brief True for the kinds whose tokens are stored in the symbol table.
[[nodiscard]] constexpr bool isSymbolKind(TokenKind kind) noexcept
{
    return kind == TokenKind::Identifier || kind == TokenKind::Constant;
}

/// @brief Convert TokenKind to human-readable string.
/// @return The reserved spelling, or "identifier" / "constant".
const char *tokenKindToString(TokenKind kind);

/// @brief Look up a lexeme in the reserved catalog.
/// @param lexeme Candidate text; matching is exact and case-sensitive.
/// @return The reserved kind, or std::nullopt when @p lexeme is not reserved.
[[nodiscard]] std::optional<TokenKind> lookupReserved(std::string_view lexeme);

/// @brief Reserved spelling of @p kind; empty for Identifier and Constant.
[[nodiscard]] std::string_view reservedSpelling(TokenKind kind);

} // namespace lexis::frontends::toy
