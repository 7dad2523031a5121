//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/tardi-grammar-check/cli.cpp
// Purpose: Argument parsing and the verification driver for tardi-grammar-check.
// Key invariants: Exit status is 0 only when every requested grammar passed.
// Ownership/Lifetime: Registry, loader and source manager live for one run.
// Links: src/tools/tardi-grammar-check/cli.hpp
//
//===----------------------------------------------------------------------===//

#include "tools/tardi-grammar-check/cli.hpp"

#include "grammar/GrammarRegistry.hpp"
#include "grammar/GrammarVerifier.hpp"
#include "grammar/Parser.hpp"
#include "support/source_manager.hpp"
#include "tools/common/source_loader.hpp"

#include <cstdlib>
#include <string_view>

#ifndef TARDI_VERSION_STR
#define TARDI_VERSION_STR "0.0.0"
#endif

namespace tardi::tools::grammar_check
{
namespace
{

std::optional<unsigned> parseUnsigned(const std::string &text)
{
    if (text.empty() || text.size() > 9)
        return std::nullopt;
    unsigned value = 0;
    for (char ch : text)
    {
        if (ch < '0' || ch > '9')
            return std::nullopt;
        value = value * 10 + static_cast<unsigned>(ch - '0');
    }
    return value;
}

support::Diag missingValue(std::string_view flag)
{
    return support::makeError({}, "missing value for " + std::string(flag));
}

/// Print "ok: tardi (abi 14, 31 symbols, 6 fields, 24 states)".
void printSummary(const grammar::LanguageInfo &info, std::ostream &out)
{
    out << "ok: " << info.name << " (abi " << info.abiVersion << ", " << info.symbolCount
        << " symbols, " << info.fieldCount << " fields, " << info.stateCount << " states)\n";
}

void printTrees(const grammar::VerificationReport &report,
                const std::vector<grammar::SourceInput> &samples,
                const support::SourceManager &sm,
                std::ostream &out)
{
    grammar::Parser parser;
    if (!parser.setLanguage(report.language))
        return;
    for (const auto &sample : samples)
    {
        grammar::Tree tree = parser.parse(sample.text);
        out << sm.getPath(sample.fileId) << ": " << tree.toSExpression() << '\n';
    }
}

} // namespace

std::optional<grammar::AbiWindow> parseAbiWindow(const std::string &text)
{
    const size_t colon = text.find(':');
    const auto min = parseUnsigned(text.substr(0, colon));
    if (!min)
        return std::nullopt;
    if (colon == std::string::npos)
        return grammar::AbiWindow{*min, grammar::runtimeAbiWindow().max};
    const auto max = parseUnsigned(text.substr(colon + 1));
    if (!max || *max < *min)
        return std::nullopt;
    return grammar::AbiWindow{*min, *max};
}

/// @brief Parse tardi-grammar-check arguments.
///
/// @details Flags taking a value consume the following argument. Anything not
///          starting with '-' is a grammar name. Parsing stops at the first
///          malformed argument and reports it as an error diagnostic so the
///          caller can print usage.
support::Expected<GrammarCheckOptions> parseArgs(int argc, char **argv)
{
    GrammarCheckOptions opts;
    for (int i = 0; i < argc; ++i)
    {
        const std::string arg = argv[i];
        auto nextValue = [&]() -> std::optional<std::string>
        {
            if (i + 1 >= argc)
                return std::nullopt;
            return std::string(argv[++i]);
        };

        if (arg == "-h" || arg == "--help")
        {
            opts.showHelp = true;
        }
        else if (arg == "--version")
        {
            opts.showVersion = true;
        }
        else if (arg == "-L" || arg == "--grammar-path")
        {
            auto value = nextValue();
            if (!value)
                return missingValue(arg);
            opts.searchPaths.emplace_back(*value);
        }
        else if (arg == "--library")
        {
            auto value = nextValue();
            if (!value)
                return missingValue(arg);
            const size_t eq = value->find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 == value->size())
            {
                return support::makeError(
                    {}, "invalid --library value '" + *value + "' (expected NAME=FILE)");
            }
            opts.libraries.push_back(LibrarySpec{value->substr(0, eq), value->substr(eq + 1)});
        }
        else if (arg == "--parse")
        {
            auto value = nextValue();
            if (!value)
                return missingValue(arg);
            opts.sampleFiles.push_back(*value);
        }
        else if (arg == "--query")
        {
            auto value = nextValue();
            if (!value)
                return missingValue(arg);
            opts.queryFiles.push_back(*value);
        }
        else if (arg == "--repeat")
        {
            auto value = nextValue();
            if (!value)
                return missingValue(arg);
            auto repeat = parseUnsigned(*value);
            if (!repeat || *repeat == 0)
                return support::makeError({}, "invalid --repeat value '" + *value + "'");
            opts.repeat = *repeat;
        }
        else if (arg == "--abi")
        {
            auto value = nextValue();
            if (!value)
                return missingValue(arg);
            auto window = parseAbiWindow(*value);
            if (!window)
                return support::makeError({}, "invalid --abi value '" + *value + "'");
            opts.abi = *window;
        }
        else if (arg == "--sexp")
        {
            opts.printTree = true;
        }
        else if (arg == "--trace")
        {
            opts.trace = true;
        }
        else if (arg == "-v" || arg == "--verbose")
        {
            opts.verbose = true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            return support::makeError({}, "unknown option '" + arg + "'");
        }
        else
        {
            opts.grammars.push_back(arg);
        }
    }
    return opts;
}

void applyGrammarPath(GrammarCheckOptions &opts, const char *grammarPath)
{
    if (!grammarPath)
        return;
    grammar::GrammarRegistry scratch;
    scratch.addSearchPathList(grammarPath);
    for (const auto &dir : scratch.searchPaths())
        opts.searchPaths.push_back(dir);
}

/// @brief Verify the requested grammars.
///
/// @details Step-by-step summary:
///          1. Build a registry with the built-in grammars and the search path.
///          2. Load every --parse and --query file; an unreadable file is fatal.
///          3. Verify each named grammar, then each --library grammar, printing
///             an ok/fail line to @p out and diagnostics to @p err.
///          4. Optionally print the syntax tree of every sample.
int runGrammarCheck(const GrammarCheckOptions &opts, std::ostream &out, std::ostream &err)
{
    grammar::GrammarRegistry registry = grammar::GrammarRegistry::withBuiltins();
    for (const auto &dir : opts.searchPaths)
        registry.addSearchPath(dir);

    grammar::LoaderOptions loaderOptions;
    if (opts.abi)
        loaderOptions.abi = *opts.abi;
    grammar::GrammarLoader loader(registry, loaderOptions);
    grammar::GrammarVerifier verifier(loader);

    support::SourceManager sm;
    grammar::VerifyOptions verifyOptions;
    verifyOptions.repeat = opts.repeat;
    verifyOptions.trace = opts.trace ? &err : nullptr;
    for (const auto &path : opts.sampleFiles)
    {
        auto loaded = common::loadSourceBuffer(path, sm);
        if (!loaded)
        {
            support::printDiag(loaded.error(), err);
            return 1;
        }
        verifyOptions.samples.push_back(std::move(loaded.value()));
    }
    for (const auto &path : opts.queryFiles)
    {
        auto loaded = common::loadSourceBuffer(path, sm);
        if (!loaded)
        {
            support::printDiag(loaded.error(), err);
            return 1;
        }
        verifyOptions.queries.push_back(std::move(loaded.value()));
    }

    std::vector<grammar::VerificationReport> reports;
    std::vector<std::string> names = opts.grammars;
    if (names.empty() && opts.libraries.empty())
        names.emplace_back("tardi");
    for (const auto &name : names)
        reports.push_back(verifier.verify(name, verifyOptions));
    for (const auto &lib : opts.libraries)
        reports.push_back(verifier.verifyLibrary(lib.name, lib.path, verifyOptions));

    int status = 0;
    for (const auto &report : reports)
    {
        support::DiagnosticEngine diags;
        if (opts.verbose && report.language)
        {
            std::string origin = grammar::originToString(report.language.origin());
            if (!report.language.libraryPath().empty())
                origin += " " + report.language.libraryPath().generic_string();
            diags.report(support::makeNote({}, report.grammar + ": loaded from " + origin));
        }
        diags.append(report.diagnostics);

        if (report.passed())
            printSummary(*report.info, out);
        else
            out << "fail: " << report.grammar << '\n';
        diags.printAll(err, &sm);

        if (opts.printTree && report.loaded)
            printTrees(report, verifyOptions.samples, sm, out);
        if (!report.passed())
            status = 1;
    }
    return status;
}

int cmdGrammarCheck(int argc, char **argv, std::ostream &out, std::ostream &err)
{
    auto parsed = parseArgs(argc, argv);
    if (!parsed)
    {
        support::printDiag(parsed.error(), err);
        usage(err);
        return 1;
    }
    GrammarCheckOptions &opts = parsed.value();
    if (opts.showHelp)
    {
        usage(out);
        return 0;
    }
    if (opts.showVersion)
    {
        printVersion(out);
        return 0;
    }
    applyGrammarPath(opts, std::getenv(kGrammarPathEnv));
    return runGrammarCheck(opts, out, err);
}

void usage(std::ostream &os)
{
    os << "tardi-grammar-check v" << TARDI_VERSION_STR << "\n"
       << "Usage: tardi-grammar-check [options] [grammar...]\n"
       << "  -L, --grammar-path DIR   Add DIR to the grammar search path\n"
       << "  --library NAME=FILE      Load grammar NAME from shared library FILE\n"
       << "  --parse FILE             Parse FILE with every loaded grammar\n"
       << "  --query FILE             Compile FILE against every loaded grammar\n"
       << "  --repeat N               Load each grammar N times\n"
       << "  --abi MIN[:MAX]          Restrict the accepted ABI window\n"
       << "  --sexp                   Print the syntax tree of parsed files\n"
       << "  --trace                  Print tree-sitter parse logs to stderr\n"
       << "  -v, --verbose            Print grammar origin notes\n"
       << "  -h, --help               Show this help message\n"
       << "  --version                Show version information\n"
       << "\nWith no grammar names, the built-in tardi grammar is verified.\n"
       << "Extra search directories are read from " << kGrammarPathEnv << ".\n";
}

void printVersion(std::ostream &os)
{
    const grammar::AbiWindow window = grammar::runtimeAbiWindow();
    os << "tardi-grammar-check v" << TARDI_VERSION_STR << "\n"
       << "tree-sitter ABI: " << window.max << " (compatible " << window.min << ".."
       << window.max << ")\n"
       << "builtin grammars:";
    for (const auto &name : grammar::GrammarRegistry::withBuiltins().builtinNames())
        os << ' ' << name;
    os << '\n';
}

} // namespace tardi::tools::grammar_check
