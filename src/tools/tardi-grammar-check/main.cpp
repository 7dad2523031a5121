//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the CLI entry point that verifies tree-sitter grammars can be
// loaded by the linked runtime. All work happens in cmdGrammarCheck so tests
// can drive the same code path without spawning a process.
//
//===----------------------------------------------------------------------===//

#include "tools/tardi-grammar-check/cli.hpp"

#include <iostream>

/// @brief Tool entry point.
/// @param argc Argument count supplied by the C runtime.
/// @param argv Argument vector supplied by the C runtime.
/// @return Zero when every grammar passed, non-zero otherwise.
int main(int argc, char **argv)
{
    return tardi::tools::grammar_check::cmdGrammarCheck(argc - 1, argv + 1, std::cout, std::cerr);
}
