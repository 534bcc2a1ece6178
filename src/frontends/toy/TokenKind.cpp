//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/toy/TokenKind.cpp
// Purpose: Implements the reserved lexeme catalog and token kind conversions.
// Key invariants: The catalog is sorted by lexeme and covers every reserved kind once.
// Ownership/Lifetime: Catalog storage is static and immutable.
// Links: docs/toy-language.md
//
//===----------------------------------------------------------------------===//

#include "frontends/toy/TokenKind.hpp"
#include "frontends/common/KeywordTable.hpp"

#include <array>

namespace lexis::frontends::toy
{
namespace
{
using common::keyword_table::KeywordEntry;

// Sorted by byte order for lookupKeywordBinary.
constexpr std::array<KeywordEntry<TokenKind>, 36> kReservedTable = {{
    {"!=", TokenKind::NotEqual},
    {"&&", TokenKind::AndAnd},
    {"(", TokenKind::LParen},
    {")", TokenKind::RParen},
    {"*", TokenKind::Star},
    {"+", TokenKind::Plus},
    {",", TokenKind::Comma},
    {"-", TokenKind::Minus},
    {".", TokenKind::Dot},
    {":", TokenKind::Colon},
    {";", TokenKind::Semicolon},
    {"<", TokenKind::Less},
    {"<=", TokenKind::LessEqual},
    {"=", TokenKind::Assign},
    {"==", TokenKind::EqualEqual},
    {">", TokenKind::Greater},
    {">=", TokenKind::GreaterEqual},
    {"[", TokenKind::LBracket},
    {"]", TokenKind::RBracket},
    {"bool", TokenKind::KwBool},
    {"char", TokenKind::KwChar},
    {"cin", TokenKind::KwCin},
    {"const", TokenKind::KwConst},
    {"cout", TokenKind::KwCout},
    {"do", TokenKind::KwDo},
    {"else", TokenKind::KwElse},
    {"for", TokenKind::KwFor},
    {"if", TokenKind::KwIf},
    {"int", TokenKind::KwInt},
    {"main", TokenKind::KwMain},
    {"return", TokenKind::KwReturn},
    {"string", TokenKind::KwString},
    {"while", TokenKind::KwWhile},
    {"{", TokenKind::LBrace},
    {"||", TokenKind::OrOr},
    {"}", TokenKind::RBrace},
}};

static_assert(common::keyword_table::isKeywordTableSorted(kReservedTable),
              "reserved lexeme table must be sorted");
static_assert(common::keyword_table::hasUniqueKinds(kReservedTable),
              "each reserved kind must have exactly one spelling");
static_assert(kReservedTable.size() + 2 == kTokenKindCount,
              "every kind except Identifier and Constant must be reserved");
} // namespace

std::optional<TokenKind> tokenKindFromCode(int code)
{
    if (code < 0 || code >= kTokenKindCount)
        return std::nullopt;
    return static_cast<TokenKind>(code);
}

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Identifier:
            return "identifier";
        case TokenKind::Constant:
            return "constant";
        default:
            break;
    }
    // Table lexemes are string literals, so data() is NUL-terminated.
    std::string_view spelling = reservedSpelling(kind);
    return spelling.empty() ? "<unknown>" : spelling.data();
}

std::optional<TokenKind> lookupReserved(std::string_view lexeme)
{
    return common::keyword_table::lookupKeywordBinary(kReservedTable, lexeme);
}

std::string_view reservedSpelling(TokenKind kind)
{
    return common::keyword_table::spellingOf(kReservedTable, kind);
}

} // namespace lexis::frontends::toy
