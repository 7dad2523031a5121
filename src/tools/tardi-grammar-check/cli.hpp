// File: src/tools/tardi-grammar-check/cli.hpp
// Purpose: Options and handlers for the tardi-grammar-check tool.
// Key invariants: Handlers never throw; failures become diagnostics and exit codes.
// Ownership/Lifetime: Options are plain values owned by the caller.
// Links: src/grammar/GrammarVerifier.hpp

#pragma once

#include "grammar/GrammarLoader.hpp"
#include "support/diag_expected.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace tardi::tools::grammar_check
{

/// @brief Grammar loaded from an explicit library file (`--library NAME=FILE`).
struct LibrarySpec
{
    std::string name;
    std::filesystem::path path;
};

/// @brief Configuration gathered from the command line and environment.
struct GrammarCheckOptions
{
    /// @brief Grammar names to verify; "tardi" when empty.
    std::vector<std::string> grammars;
    std::vector<LibrarySpec> libraries;
    /// @brief Library search directories, flags first, then TARDI_GRAMMAR_PATH.
    std::vector<std::filesystem::path> searchPaths;
    std::vector<std::string> sampleFiles;
    std::vector<std::string> queryFiles;
    unsigned repeat = 1;
    std::optional<grammar::AbiWindow> abi;
    bool printTree = false;
    bool trace = false;
    bool verbose = false;
    bool showHelp = false;
    bool showVersion = false;
};

/// @brief Environment variable listing extra grammar search directories.
inline constexpr const char *kGrammarPathEnv = "TARDI_GRAMMAR_PATH";

/// @brief Parse arguments following the program name.
/// @return Options, or a diagnostic naming the malformed argument.
support::Expected<GrammarCheckOptions> parseArgs(int argc, char **argv);

/// @brief Parse an `--abi` value of the form `MIN` or `MIN:MAX`.
/// @details A lone `MIN` is a lower bound; the upper bound is the runtime's.
std::optional<grammar::AbiWindow> parseAbiWindow(const std::string &text);

/// @brief Append the directories listed in @p grammarPath (may be null).
void applyGrammarPath(GrammarCheckOptions &opts, const char *grammarPath);

/// @brief Verify every requested grammar and print the results.
/// @param out Receives `ok:`/`fail:` lines and syntax trees.
/// @param err Receives diagnostics, notes and traces.
/// @return 0 when every grammar passed, 1 otherwise.
int runGrammarCheck(const GrammarCheckOptions &opts, std::ostream &out, std::ostream &err);

/// @brief Entry used by main: parse, apply the environment, run.
/// @return 1 with usage on @p err for malformed arguments; 0 for --help and
///         --version; otherwise the result of runGrammarCheck.
int cmdGrammarCheck(int argc, char **argv, std::ostream &out, std::ostream &err);

/// @brief Print the synopsis and option list.
void usage(std::ostream &os);

/// @brief Print tool version and runtime ABI information.
void printVersion(std::ostream &os);

} // namespace tardi::tools::grammar_check
