//===----------------------------------------------------------------------===//
//
// Part of the Lexis project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// Implements option parsing and the per-file analysis loop of the toylex
// tool.  Parsing is kept separate from main() so tests can drive the tool
// with in-memory streams.
//
//===----------------------------------------------------------------------===//

#include "tools/toylex/cli.hpp"

#include "frontends/toy/Analyzer.hpp"
#include "frontends/toy/PifPrinter.hpp"
#include "support/source_manager.hpp"
#include "tools/common/source_loader.hpp"

#ifndef LEXIS_VERSION_STR
#define LEXIS_VERSION_STR "0.0.0"
#endif

namespace toylex
{
namespace
{
using lexis::support::Expected;

lexis::support::Diag usageError(std::string message)
{
    return lexis::support::makeError({}, std::move(message), std::string{kUsageErrorCode});
}

/// Analyze one file and append its sections to @p out.
bool runOne(const std::string &path,
            const lexis::support::Options &options,
            bool printHeader,
            std::ostream &out,
            std::ostream &err)
{
    using namespace lexis::frontends::toy;

    lexis::support::SourceManager sm;
    auto loaded = lexis::tools::common::loadSourceBuffer(path, sm);
    if (!loaded)
    {
        lexis::support::printDiag(loaded.error(), err, &sm);
        return false;
    }

    AnalyzerInput input{};
    input.source = loaded.value().buffer;
    input.path = path;
    input.fileId = loaded.value().fileId;

    AnalyzerOptions analyzerOptions{};
    analyzerOptions.keepLexemes = options.dumpTokens;
    analyzerOptions.trace = options.trace ? &err : nullptr;

    AnalyzerResult result = analyzeSource(input, analyzerOptions, sm);

    if (printHeader)
        out << "== " << sm.getPath(result.fileId) << '\n';

    if (options.dumpTokens)
    {
        out << "Tokens:\n";
        printLexemes(result.lexemes, out);
        out << '\n';
    }

    if (!result.succeeded())
    {
        result.diagnostics.printAll(err, &sm);
        return false;
    }

    if (options.symbolsOnly)
        printSymbolTable(result.analysis.symbols, out);
    else if (options.pifOnly)
        printPif(result.analysis.pif, out);
    else
        printAnalysis(result.analysis, out);
    return true;
}
} // namespace

Expected<ToylexConfig> parseToylexArgs(lexis::tools::ArgvView args)
{
    ToylexConfig config{};
    for (int i = 0; i < args.argc; ++i)
    {
        const std::string_view arg = args.at(i);
        if (arg == "-h" || arg == "--help")
        {
            config.showHelp = true;
        }
        else if (arg == "--version")
        {
            config.showVersion = true;
        }
        else if (arg == "--trace")
        {
            config.options.trace = true;
        }
        else if (arg == "--dump-tokens")
        {
            config.options.dumpTokens = true;
        }
        else if (arg == "--symbols-only")
        {
            config.options.symbolsOnly = true;
        }
        else if (arg == "--pif-only")
        {
            config.options.pifOnly = true;
        }
        else if (arg == "-o" || arg == "--output")
        {
            if (i + 1 >= args.argc)
                return usageError(std::string(arg) + " requires a file argument");
            config.options.outputPath = std::string(args.at(++i));
        }
        else if (arg.size() > 1 && arg.front() == '-')
        {
            return usageError("unknown option '" + std::string(arg) + "'");
        }
        else
        {
            config.inputs.emplace_back(arg);
        }
    }

    if (config.showHelp || config.showVersion)
        return config;

    if (config.options.symbolsOnly && config.options.pifOnly)
        return usageError("--symbols-only and --pif-only are mutually exclusive");
    if (config.inputs.empty())
        return usageError("no input files");
    return config;
}

int runToylex(const ToylexConfig &config, std::ostream &out, std::ostream &err)
{
    const bool printHeaders = config.inputs.size() > 1;
    bool ok = true;
    for (std::size_t i = 0; i < config.inputs.size(); ++i)
    {
        if (printHeaders && i > 0)
            out << '\n';
        // A failing file does not stop the remaining ones.
        if (!runOne(config.inputs[i], config.options, printHeaders, out, err))
            ok = false;
    }
    return ok ? kExitOk : kExitFailure;
}

void printUsage(std::ostream &os)
{
    os << "toylex v" << LEXIS_VERSION_STR << " - toy language lexical analyzer\n"
       << "\n"
       << "Usage: toylex [options] <file>...\n"
       << "\n"
       << "Options:\n"
       << "  --dump-tokens                  Print raw lexemes with positions\n"
       << "  --trace                        Trace analysis stages to stderr\n"
       << "  --symbols-only                 Print only the symbol table\n"
       << "  --pif-only                     Print only the program internal form\n"
       << "  -o, --output FILE              Write the report to FILE\n"
       << "  -h, --help                     Show this help message\n"
       << "  --version                      Show version information\n";
}

void printVersion(std::ostream &os)
{
    os << "toylex v" << LEXIS_VERSION_STR << "\n";
}

} // namespace toylex
