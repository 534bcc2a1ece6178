//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across the support
// library.  The utilities defined here build error diagnostics, map severities
// to their printed spelling, and render diagnostics with whatever location
// context is available.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies the error constructor and diagnostic printer.

#include "support/diag_expected.hpp"

namespace lexis::support
{
namespace detail
{
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

Diag makeError(SourceLoc loc, std::string msg, std::string code)
{
    return Diag{Severity::Error, std::move(msg), loc, std::move(code)};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When a source manager resolves the file identifier the message is
///          prefixed with "<path>:<line>:<column>:".  Anonymous buffers still
///          print "<line>:<column>:" when the location carries line data, so
///          errors from in-memory analysis remain locatable.  A non-empty code
///          is appended in brackets.  The function always emits a trailing
///          newline.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
/// @param sm Optional source manager for mapping file identifiers to paths.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    std::string_view path;
    if (sm && diag.loc.isValid())
        path = sm->getPath(diag.loc.file_id);

    if (!path.empty())
        os << path << ':';
    if (diag.loc.hasLine())
    {
        os << diag.loc.line << ':';
        if (diag.loc.hasColumn())
            os << diag.loc.column << ':';
    }
    if (!path.empty() || diag.loc.hasLine())
        os << ' ';

    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message;
    if (!diag.code.empty())
        os << " [" << diag.code << ']';
    os << '\n';
}
} // namespace lexis::support
