//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/KeywordTable.hpp
// Purpose: Common reserved-lexeme lookup utilities for language frontends.
//
// Key Features:
//   - Sorted array with binary search for compile-time lexeme tables
//   - constexpr verification of table sorting and uniqueness
//   - Reverse lookup from token kind to spelling
//
//===----------------------------------------------------------------------===//
#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace lexis::frontends::common::keyword_table
{

/// @brief A reserved entry mapping a lexeme to a token kind.
/// @tparam TokenKind The token kind enum type.
template <typename TokenKind>
struct KeywordEntry
{
    std::string_view lexeme; ///< The reserved spelling.
    TokenKind kind;          ///< The token kind for this spelling.
};

/// @brief Check if a keyword table is strictly sorted by lexeme.
/// @details Strict ordering also rules out duplicate spellings.  Used for
///          static_assert validation of compile-time tables.
template <typename TokenKind, std::size_t N>
[[nodiscard]] constexpr bool isKeywordTableSorted(const std::array<KeywordEntry<TokenKind>, N> &table)
{
    for (std::size_t i = 1; i < N; ++i)
    {
        if (!(table[i - 1].lexeme < table[i].lexeme))
            return false;
    }
    return true;
}

/// @brief Check that no two entries share a token kind.
template <typename TokenKind, std::size_t N>
[[nodiscard]] constexpr bool hasUniqueKinds(const std::array<KeywordEntry<TokenKind>, N> &table)
{
    for (std::size_t i = 0; i < N; ++i)
    {
        for (std::size_t j = i + 1; j < N; ++j)
        {
            if (table[i].kind == table[j].kind)
                return false;
        }
    }
    return true;
}

/// @brief Binary search lookup in a sorted keyword table.
/// @param table The sorted keyword table.
/// @param lexeme The lexeme to look up; matching is exact and case-sensitive.
/// @return The token kind if found, std::nullopt otherwise.
template <typename TokenKind, std::size_t N>
[[nodiscard]] constexpr std::optional<TokenKind> lookupKeywordBinary(
    const std::array<KeywordEntry<TokenKind>, N> &table,
    std::string_view lexeme)
{
    auto first = table.begin();
    auto last = table.end();

    while (first < last)
    {
        auto mid = first + (last - first) / 2;
        if (mid->lexeme == lexeme)
            return mid->kind;
        if (mid->lexeme < lexeme)
            first = mid + 1;
        else
            last = mid;
    }

    return std::nullopt;
}

/// @brief Find the spelling registered for @p kind.
/// @return The lexeme, or an empty view when @p kind has no table entry.
template <typename TokenKind, std::size_t N>
[[nodiscard]] constexpr std::string_view spellingOf(const std::array<KeywordEntry<TokenKind>, N> &table,
                                                    TokenKind kind)
{
    for (const auto &entry : table)
    {
        if (entry.kind == kind)
            return entry.lexeme;
    }
    return {};
}

} // namespace lexis::frontends::common::keyword_table
