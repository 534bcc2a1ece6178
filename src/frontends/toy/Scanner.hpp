//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/toy/Scanner.hpp
// Purpose: Declares the maximal-munch scanner splitting toy source into raw lexemes.
// Key invariants: Lexemes are non-empty, whitespace free, and emitted left to right.
// Ownership/Lifetime: Scanner borrows the source buffer; lexemes own their text.
// Links: docs/toy-language.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/common/LexerBase.hpp"
#include "support/source_location.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexis::frontends::toy
{

/// @brief A contiguous source substring matched by the scanner.
struct RawLexeme
{
    /// @brief Matched text; never empty and never containing whitespace.
    std::string text;

    /// @brief Byte offset of the first character within the source buffer.
    std::size_t offset{0};

    /// @brief Line and column of the first character.
    support::SourceLoc loc;
};

/// @brief Splits toy source text into raw lexemes.
/// @details At every position the scanner tries, in order: a whitespace run
///          (skipped), a two-character operator (== != <= >= && ||), an
///          identifier, an integer literal, a character literal ('x'), a
///          string literal ("abc"), and finally any single character.  The
///          scanner never fails; unknown characters become one-character
///          lexemes that the classifier rejects.
/// @invariant Source buffer must remain valid for the scanner's lifetime.
class Scanner : public common::lexer_base::LexerCursor<Scanner>
{
  public:
    /// @brief Create a scanner over @p source.
    /// @param source Text to split.
    /// @param fileId Identifier stamped into lexeme locations; 0 for anonymous buffers.
    explicit Scanner(std::string_view source, uint32_t fileId = 0);

    /// @brief Produce the next lexeme.
    /// @return The next lexeme, or std::nullopt once only whitespace remains.
    std::optional<RawLexeme> next();

    /// @brief Drain the remaining lexemes.
    std::vector<RawLexeme> scanAll();

    /// @brief Buffer observed by the cursor.
    [[nodiscard]] std::string_view source() const noexcept
    {
        return source_;
    }

  private:
    /// @brief Length of the lexeme starting at the current position.
    /// @pre !eof() and the current character is not whitespace.
    [[nodiscard]] std::size_t matchLength() const;

    std::size_t matchCharLiteral() const;
    std::size_t matchStringLiteral() const;
    std::size_t matchFallback() const;

    std::string_view source_;
};

/// @brief Split @p source into raw lexemes in one call.
[[nodiscard]] std::vector<RawLexeme> scan(std::string_view source, uint32_t fileId = 0);

} // namespace lexis::frontends::toy
