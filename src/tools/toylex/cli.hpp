//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: tools/toylex/cli.hpp
// Purpose: Declares command-line parsing and execution for the toylex tool.
// Key invariants: Each input file is analyzed with its own symbol table.
// Ownership/Lifetime: Configuration is a value type; streams are borrowed.
// Links: docs/toy-language.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/options.hpp"
#include "tools/common/ArgvView.hpp"

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace toylex
{

/// @brief Diagnostic code reported for malformed command lines.
inline constexpr std::string_view kUsageErrorCode = "L0004";

/// @brief Exit status for success.
inline constexpr int kExitOk = 0;
/// @brief Exit status when any input fails to load or analyze.
inline constexpr int kExitFailure = 1;
/// @brief Exit status for command-line errors.
inline constexpr int kExitUsage = 2;

/// @brief Parsed toylex command line.
struct ToylexConfig
{
    lexis::support::Options options{};
    std::vector<std::string> inputs{};
    bool showHelp{false};
    bool showVersion{false};
};

/// @brief Parse toylex arguments (program name already dropped).
/// @return Parsed configuration, or an L0004 diagnostic describing the misuse.
lexis::support::Expected<ToylexConfig> parseToylexArgs(lexis::tools::ArgvView args);

/// @brief Analyze every input of @p config and write the report.
/// @param config Parsed configuration with at least one input.
/// @param out Receives tables and token dumps.
/// @param err Receives diagnostics and trace lines.
/// @return kExitOk when every input succeeded, kExitFailure otherwise.
int runToylex(const ToylexConfig &config, std::ostream &out, std::ostream &err);

/// @brief Print usage text.
void printUsage(std::ostream &os);

/// @brief Print the tool version.
void printVersion(std::ostream &os);

} // namespace toylex
