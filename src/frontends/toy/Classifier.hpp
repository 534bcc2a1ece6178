//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/toy/Classifier.hpp
// Purpose: Declares the mapping from raw lexemes to classified tokens.
// Key invariants: Catalog membership is tested before the identifier and literal patterns.
// Ownership/Lifetime: Classified tokens own their value text.
// Links: docs/toy-language.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/toy/Scanner.hpp"
#include "frontends/toy/TokenKind.hpp"
#include "support/diag_expected.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace lexis::frontends::toy
{

/// @brief Diagnostic code reported for lexemes outside the toy vocabulary.
inline constexpr std::string_view kInvalidTokenCode = "L0001";

/// @brief A lexeme after classification.
/// @invariant value is engaged exactly when isSymbolKind(kind).
struct ClassifiedToken
{
    TokenKind kind{TokenKind::Identifier};
    std::optional<std::string> value{};

    /// @brief Token for a reserved lexeme; carries no value.
    static ClassifiedToken reserved(TokenKind kind)
    {
        return ClassifiedToken{kind, std::nullopt};
    }

    /// @brief Identifier or constant token carrying its lexeme.
    static ClassifiedToken symbol(TokenKind kind, std::string text)
    {
        return ClassifiedToken{kind, std::move(text)};
    }

    friend bool operator==(const ClassifiedToken &, const ClassifiedToken &) = default;
};

/// @brief Letter or underscore followed by letters, digits or underscores.
[[nodiscard]] bool isIdentifierLexeme(std::string_view text);

/// @brief One or more decimal digits.
[[nodiscard]] bool isIntegerLexeme(std::string_view text);

/// @brief A single alphanumeric character between single quotes.
[[nodiscard]] bool isCharLexeme(std::string_view text);

/// @brief Zero or more alphanumeric characters between double quotes.
[[nodiscard]] bool isStringLexeme(std::string_view text);

/// @brief Integer, character or string literal.
[[nodiscard]] bool isConstantLexeme(std::string_view text);

/// @brief Classify @p text found at @p loc.
/// @details Reserved spellings win over the identifier pattern, so `while`
///          is a keyword and never an identifier.
/// @return The classified token, or an L0001 error diagnostic quoting @p text.
support::Expected<ClassifiedToken> classify(std::string_view text, support::SourceLoc loc = {});

/// @brief Classify a scanned lexeme, reporting failures at its location.
support::Expected<ClassifiedToken> classify(const RawLexeme &lexeme);

/// @brief Build the invalid-token diagnostic for @p text at @p loc.
[[nodiscard]] support::Diag makeInvalidTokenDiag(std::string_view text, support::SourceLoc loc);

} // namespace lexis::frontends::toy
