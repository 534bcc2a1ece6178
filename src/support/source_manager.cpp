//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager utility responsible for tracking the files a
// driver hands to the analyzer.  The manager assigns stable numeric
// identifiers to file paths and resolves those identifiers back to normalized
// strings when printing diagnostics.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Provides the backing store for file identifiers used in diagnostics.

#include "support/source_manager.hpp"

#include "support/diag_expected.hpp"

#include <filesystem>
#include <iostream>
#include <limits>

namespace lexis::support
{
namespace
{
std::string normalizePath(std::string path)
{
    // Placeholders such as "<input>" are not filesystem paths.
    if (path.empty() || path.front() == '<')
        return path;
    std::filesystem::path p(std::move(path));
    return p.lexically_normal().generic_string();
}
} // namespace

/// @brief Register a file path and assign it a stable identifier.
///
/// @details The path is normalized into a generic string so diagnostics print
///          platform independent output.  Identifiers start at one, leaving
///          zero to represent an anonymous buffer.  Registering the same
///          normalized path twice returns the identifier assigned the first
///          time.
///
/// @param path Filesystem path to normalize and store.
/// @return Identifier (>0) representing the stored path, or 0 on overflow.
uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(std::move(path));

    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;

    if (next_file_id_ > std::numeric_limits<uint32_t>::max())
    {
        auto diag = makeError({}, std::string{kSourceManagerFileIdOverflowMessage},
                              std::string{kSourceManagerOverflowCode});
        printDiag(diag, std::cerr);
        return 0;
    }

    const uint32_t file_id = static_cast<uint32_t>(next_file_id_++);
    files_.push_back(std::move(normalized));
    path_to_id_.emplace(files_.back(), file_id);
    return file_id;
}

/// @brief Retrieve the canonical path associated with a file identifier.
///
/// @details Identifiers outside the valid range, including the sentinel zero,
///          yield an empty view.  Successful lookups return a view into the
///          manager's own storage; callers must not outlive the manager when
///          holding the view.
///
/// @param file_id 1-based identifier previously returned by addFile().
/// @return Stored path, or empty string view if @p file_id is invalid.
std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}
} // namespace lexis::support
