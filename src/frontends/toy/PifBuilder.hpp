//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/toy/PifBuilder.hpp
// Purpose: Declares the program internal form and its two-pass builder.
// Key invariants: Symbol indices are ranks in the FINAL symbol table; reserved
//                 tokens carry kNoSymbol.
// Ownership/Lifetime: The builder owns its symbol table until finish() hands it out.
// Links: docs/toy-language.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/toy/Classifier.hpp"
#include "frontends/toy/SymbolTable.hpp"
#include "frontends/toy/TokenKind.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace lexis::frontends::toy
{

/// @brief PIF index of tokens that do not reference the symbol table.
inline constexpr int64_t kNoSymbol = -1;

/// @brief One program internal form entry.
struct PifEntry
{
    TokenKind kind{TokenKind::Identifier};
    int64_t index{kNoSymbol};

    /// @brief Integer code of kind.
    [[nodiscard]] int code() const noexcept
    {
        return tokenKindCode(kind);
    }

    friend bool operator==(const PifEntry &, const PifEntry &) = default;
};

/// @brief Symbol table together with the PIF that indexes into it.
struct PifBuild
{
    SymbolTable table;
    std::vector<PifEntry> pif;
};

/// @brief Builds the PIF in two phases.
/// @details add() inserts identifier and constant values into the symbol
///          table and remembers the resulting NodeId for the slot.  Ranks are
///          not known yet because later insertions can precede earlier keys.
///          finish() runs one in-order traversal over the final table and
///          resolves every remembered NodeId to its rank.
///
/// Usage:
///   PifBuilder builder;
///   for (const auto &tok : tokens)
///       builder.add(tok);
///   PifBuild build = std::move(builder).finish();
class PifBuilder
{
  public:
    /// @brief Append @p token to the pending PIF.
    void add(const ClassifiedToken &token);

    /// @brief Number of tokens added so far.
    [[nodiscard]] std::size_t size() const noexcept
    {
        return slots_.size();
    }

    /// @brief Symbol table as built so far.
    [[nodiscard]] const SymbolTable &table() const noexcept
    {
        return table_;
    }

    /// @brief Resolve final ranks and release the table and PIF.
    [[nodiscard]] PifBuild finish() &&;

  private:
    struct Slot
    {
        TokenKind kind;
        NodeId node; ///< kNoNode for reserved tokens
    };

    SymbolTable table_;
    std::vector<Slot> slots_;
};

/// @brief Build the symbol table and PIF for @p tokens.
[[nodiscard]] PifBuild buildPif(const std::vector<ClassifiedToken> &tokens);

} // namespace lexis::frontends::toy
