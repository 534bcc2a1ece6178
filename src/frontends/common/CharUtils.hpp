//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/CharUtils.hpp
// Purpose: Common character classification utilities for lexers.
//
// All predicates are locale independent; bytes >= 0x80 are never letters or
// digits.  whitespaceLength() additionally recognises the UTF-8 encodings of
// the Unicode space separators.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <cstddef>
#include <string_view>

namespace lexis::frontends::common::char_utils
{

/// @brief Check if character is an ASCII letter (A-Z, a-z).
[[nodiscard]] constexpr bool isLetter(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

/// @brief Check if character is a decimal digit (0-9).
[[nodiscard]] constexpr bool isDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/// @brief Check if character is alphanumeric (letter or digit).
[[nodiscard]] constexpr bool isAlphanumeric(char c) noexcept
{
    return isLetter(c) || isDigit(c);
}

/// @brief Check if character can start an identifier (letter or underscore).
[[nodiscard]] constexpr bool isIdentifierStart(char c) noexcept
{
    return isLetter(c) || c == '_';
}

/// @brief Check if character can continue an identifier (letter, digit, or underscore).
[[nodiscard]] constexpr bool isIdentifierContinue(char c) noexcept
{
    return isLetter(c) || isDigit(c) || c == '_';
}

/// @brief Check if character is ASCII whitespace (space, \t, \n, \v, \f, \r).
[[nodiscard]] constexpr bool isWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

/// @brief Byte length of the whitespace code point at the start of @p text.
/// @details Besides isWhitespace(), accepts the information separators
///          0x1C-0x1F and the UTF-8 forms of U+0085, U+00A0, U+1680,
///          U+2000-U+200A, U+2028, U+2029, U+202F, U+205F and U+3000.
/// @return 1 to 3 when @p text starts with whitespace, 0 otherwise.
[[nodiscard]] constexpr std::size_t whitespaceLength(std::string_view text) noexcept
{
    if (text.empty())
        return 0;
    const auto b0 = static_cast<unsigned char>(text[0]);
    if (isWhitespace(text[0]) || (b0 >= 0x1C && b0 <= 0x1F))
        return 1;
    if (b0 == 0xC2)
    {
        if (text.size() < 2)
            return 0;
        const auto b1 = static_cast<unsigned char>(text[1]);
        return b1 == 0x85 || b1 == 0xA0 ? 2 : 0;
    }
    if (text.size() < 3)
        return 0;

    const auto b1 = static_cast<unsigned char>(text[1]);
    const auto b2 = static_cast<unsigned char>(text[2]);
    switch (b0)
    {
        case 0xE1:
            return b1 == 0x9A && b2 == 0x80 ? 3 : 0;
        case 0xE2:
            if (b1 == 0x80)
                return (b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF ? 3 : 0;
            return b1 == 0x81 && b2 == 0x9F ? 3 : 0;
        case 0xE3:
            return b1 == 0x80 && b2 == 0x80 ? 3 : 0;
        default:
            return 0;
    }
}

/// @brief Check if every character of @p text satisfies @p pred.
/// @details Empty text trivially satisfies any predicate.
template <typename Pred>
[[nodiscard]] constexpr bool allOf(std::string_view text, Pred pred) noexcept
{
    for (char c : text)
    {
        if (!pred(c))
            return false;
    }
    return true;
}

} // namespace lexis::frontends::common::char_utils
