//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares the registry mapping analysed source paths to file identifiers.
// Key invariants: File ID 0 is invalid; identical normalized paths share one id.
// Ownership/Lifetime: Manager owns file path strings.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace lexis::support
{

inline constexpr std::string_view kSourceManagerFileIdOverflowMessage =
    "source manager exhausted file identifier space";

/// @brief Diagnostic code attached to file identifier overflow errors.
inline constexpr std::string_view kSourceManagerOverflowCode = "L0003";

/// Maintains the mapping between numeric file identifiers and their
/// corresponding filesystem paths. Drivers register every analysed file so
/// diagnostics can print `path:line:column` prefixes.
class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @param path File system path, or a placeholder such as "<input>".
    /// @return New file identifier (>0 on success, 0 on overflow).
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id.
    /// @param file_id Identifier returned by addFile().
    /// @return File path string view, empty when @p file_id is unknown.
    std::string_view getPath(uint32_t file_id) const;

    /// @brief Number of registered files.
    [[nodiscard]] std::size_t fileCount() const noexcept
    {
        return files_.size();
    }

  private:
    /// Stored file paths; entry i holds file id i + 1.
    /// std::deque keeps string references stable as new files are added.
    std::deque<std::string> files_;

    /// Next identifier to assign; stored as 64-bit to detect overflow safely.
    uint64_t next_file_id_ = 1;

    /// Fast lookup from normalized path to previously assigned identifier.
    std::unordered_map<std::string, uint32_t> path_to_id_;
};
} // namespace lexis::support
