//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.hpp
// Purpose: Shared helpers for loading source files used by the analysis CLI tools.
// Key invariants: LoadedSource accurately captures file contents and SourceManager registration.
// Ownership/Lifetime: The caller owns the returned LoadedSource and may use it after the call.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace lexis::tools::common
{

/// @brief Diagnostic code reported when a source file cannot be read.
inline constexpr std::string_view kSourceLoadErrorCode = "L0002";

/// @brief Result of loading a source file into memory.
struct LoadedSource
{
    std::string buffer; ///< Full contents of the source file.
    uint32_t fileId{0}; ///< Identifier assigned by SourceManager (0 indicates failure).
};

/// @brief Load a source file into memory and register it with the source manager.
///
/// Opens @p path, reads the entire file into a string buffer, and registers the
/// file with @p sm so diagnostics can resolve the location later.
///
/// @param path Filesystem path to the source file.
/// @param sm Source manager tracking file identifiers for diagnostics.
/// @return Loaded source buffer on success; otherwise a diagnostic describing
///         the I/O failure or SourceManager overflow.
lexis::support::Expected<LoadedSource> loadSourceBuffer(const std::string &path,
                                                        lexis::support::SourceManager &sm);

} // namespace lexis::tools::common
