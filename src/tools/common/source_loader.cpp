//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/source_loader.cpp
// Purpose: Standardise how command-line tools load source files into memory.
// Key invariants: The loaded buffer contains the complete file contents.
// Ownership/Lifetime: The returned LoadedSource owns its buffer.
// Links: src/tools/common/source_loader.hpp
//
//===----------------------------------------------------------------------===//

#include "tools/common/source_loader.hpp"

#include <fstream>
#include <new>
#include <sstream>

namespace lexis::tools::common
{
namespace
{
lexis::support::Diag loadError(std::string message)
{
    return lexis::support::makeError({}, std::move(message), std::string{kSourceLoadErrorCode});
}
} // namespace

lexis::support::Expected<LoadedSource> loadSourceBuffer(const std::string &path,
                                                        lexis::support::SourceManager &sm)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return loadError("unable to open " + path);

    // Check file size before reading to avoid OOM on huge files.
    in.seekg(0, std::ios::end);
    auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    constexpr auto kMaxSourceSize = static_cast<std::streamoff>(256ULL * 1024 * 1024);
    if (fileSize < 0 || fileSize > kMaxSourceSize)
        return loadError("source file too large: " + path + " (limit: 256 MB)");

    std::string contents;
    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        contents = ss.str();
    }
    catch (const std::bad_alloc &)
    {
        return loadError("out of memory reading " + path);
    }

    const uint32_t fileId = sm.addFile(path);
    if (fileId == 0)
    {
        return lexis::support::makeError({},
                                         std::string{lexis::support::kSourceManagerFileIdOverflowMessage},
                                         std::string{lexis::support::kSourceManagerOverflowCode});
    }

    LoadedSource source{};
    source.buffer = std::move(contents);
    source.fileId = fileId;
    return source;
}

} // namespace lexis::tools::common
