// File: include/tardi/grammar/Grammar.hpp
// Purpose: Stable facade for loading, verifying, and exercising tree-sitter grammars.
// Key invariants: Re-exports supported grammar interfaces; loader internals stay in src/grammar.
// Ownership/Lifetime: Mirrors the underlying implementations.
// Links: src/grammar/GrammarVerifier.hpp
#pragma once

#include "grammar/GrammarLoader.hpp"
#include "grammar/GrammarRegistry.hpp"
#include "grammar/GrammarVerifier.hpp"
#include "grammar/Language.hpp"
#include "grammar/Parser.hpp"
#include "grammar/Query.hpp"
#include "grammar/SourceCheck.hpp"

/// @file include/tardi/grammar/Grammar.hpp
/// @brief Aggregated public header for the grammar toolkit. Provides the
///        registry, loader and verifier together with the parser, tree and
///        query wrappers used to exercise a loaded grammar.
