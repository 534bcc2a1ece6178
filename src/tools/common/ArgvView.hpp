//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/ArgvView.hpp
// Purpose: Non-owning view over the argument list of a tool entry point.
// Key invariants: Never modifies or owns the underlying argument storage.
// Ownership/Lifetime: Borrows pointers from the C runtime; callers must ensure
//                     validity through the view's lifetime.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace lexis::tools
{

/// @brief Arguments handed to a tool entry point.
/// @details main() drops the program name with drop_front() and hands the
///          rest to the option parser, which reads each entry through at().
struct ArgvView
{
    int argc;
    char **argv;

    /// @brief Argument @p index, or an empty view when out of range.
    [[nodiscard]] std::string_view at(int index) const
    {
        if (argv == nullptr || index < 0 || index >= argc)
            return {};
        return argv[index];
    }

    /// @brief The arguments after the first @p count.
    [[nodiscard]] ArgvView drop_front(int count = 1) const
    {
        if (count >= argc)
            return ArgvView{0, nullptr};
        return ArgvView{argc - count, argv + count};
    }
};

} // namespace lexis::tools
