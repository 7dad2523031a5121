//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: grammar/SourceCheck.hpp
// Purpose: Smoke checks that exercise a loaded grammar on real inputs.
// Key invariants: Every problem found is reported as one error diagnostic.
// Ownership/Lifetime: Stateless free functions; callers own the engine.
// Links: src/grammar/GrammarVerifier.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "grammar/Language.hpp"
#include "support/diagnostics.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>

namespace tardi::grammar
{

/// @brief Parse @p source with @p language and report its syntax errors.
/// @param fileId SourceManager id of the sample, used for locations.
/// @param diags Receives one "syntax error" or "missing <type>" per problem.
/// @param trace Optional stream receiving the runtime's parse log.
/// @return Number of errors reported.
size_t checkSource(const LanguageHandle &language,
                   std::string_view source,
                   uint32_t fileId,
                   support::DiagnosticEngine &diags,
                   std::ostream *trace = nullptr);

/// @brief Compile query @p source against @p language.
/// @return True when the query compiled; otherwise one error is reported.
bool checkQuery(const LanguageHandle &language,
                std::string_view source,
                uint32_t fileId,
                support::DiagnosticEngine &diags);

} // namespace tardi::grammar
