//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// Provides the out-of-line validity query for the SourceLoc value type.  A
// location is valid when it refers to a file registered with a SourceManager.
// Buffers analysed without registration still carry line and column numbers,
// which printers surface through `hasLine()` and `hasColumn()`.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the validity query for `SourceLoc`.

#include "support/source_location.hpp"

namespace lexis::support
{
/// @brief Determine whether the location carries a registered file attachment.
///
/// @details SourceManager dispenses monotonically increasing identifiers for
///          every registered file.  Zero marks an anonymous in-memory buffer,
///          which is how the core analyzer runs when no driver supplied a path.
///
/// @return True when the location originated from a tracked source file.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}
} // namespace lexis::support
