//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the source location value type attached to lexemes and diagnostics.
// Key invariants: file_id == 0 denotes an unregistered buffer; line/column are 1-based when known.
// Ownership/Lifetime: Value type with no dynamic ownership.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace lexis::support
{

/// @brief Represents an absolute position within a source buffer.
/// @invariant file_id == 0 indicates the buffer was never registered with a
///            SourceManager; line and column may still be populated.
/// @ownership Value type with no owned resources.
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 denotes an anonymous buffer.
    uint32_t file_id = 0;

    /// @brief One-based line number within the buffer; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number within the line; 0 when unknown.
    uint32_t column = 0;

    /// @brief Check whether the location references a registered file.
    [[nodiscard]] bool isValid() const;

    /// @brief Determine whether a 1-based line number is available.
    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    /// @brief Determine whether a 1-based column number is available.
    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }

    friend bool operator==(const SourceLoc &, const SourceLoc &) = default;
};

} // namespace lexis::support
