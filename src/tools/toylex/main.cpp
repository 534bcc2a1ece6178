//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// Implements the CLI entry point that analyzes toy source files and prints
// their symbol tables and program internal forms.
//
//===----------------------------------------------------------------------===//

#include "tools/toylex/cli.hpp"

#include <fstream>
#include <iostream>

/// @brief Tool entry point.
///
/// Parses the command line, opens the optional output file, and analyzes
/// each input in turn.  Usage errors exit with status 2, analysis or I/O
/// failures with status 1.
int main(int argc, char **argv)
{
    lexis::tools::ArgvView args{argc, argv};
    auto config = toylex::parseToylexArgs(args.drop_front());
    if (!config)
    {
        lexis::support::printDiag(config.error(), std::cerr);
        toylex::printUsage(std::cerr);
        return toylex::kExitUsage;
    }

    if (config.value().showHelp)
    {
        toylex::printUsage(std::cout);
        return toylex::kExitOk;
    }
    if (config.value().showVersion)
    {
        toylex::printVersion(std::cout);
        return toylex::kExitOk;
    }

    const std::string &outputPath = config.value().options.outputPath;
    if (outputPath.empty())
        return toylex::runToylex(config.value(), std::cout, std::cerr);

    std::ofstream out(outputPath);
    if (!out)
    {
        lexis::support::printDiag(
            lexis::support::makeError({}, "unable to open " + outputPath + " for writing"),
            std::cerr);
        return toylex::kExitFailure;
    }
    const int status = toylex::runToylex(config.value(), out, std::cerr);
    out.flush();
    if (!out)
    {
        lexis::support::printDiag(
            lexis::support::makeError({}, "failed writing " + outputPath), std::cerr);
        return toylex::kExitFailure;
    }
    return status;
}
