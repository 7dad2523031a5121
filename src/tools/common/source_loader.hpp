//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/source_loader.hpp
// Purpose: Declares the helper tools use to read sample and query files.
// Key invariants: A loaded buffer holds the complete file contents.
// Ownership/Lifetime: Returned SourceInput owns its buffer.
// Links: src/tools/tardi-grammar-check/cli.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "grammar/GrammarVerifier.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <string>

namespace tardi::tools::common
{

/// @brief Load a file into memory and register it with the source manager.
///
/// @param path Filesystem path to the file.
/// @param sm Source manager tracking file identifiers for diagnostics.
/// @return Contents plus file id; otherwise a diagnostic describing the I/O
///         failure or SourceManager overflow.
support::Expected<grammar::SourceInput> loadSourceBuffer(const std::string &path,
                                                         support::SourceManager &sm);

} // namespace tardi::tools::common
