//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic engine. The grammar checker reports load failures,
// metadata notes, sample syntax errors and query compile errors through a
// single engine so the command-line tool can print them as one ordered block
// and derive its exit status from the error count.
//
//===----------------------------------------------------------------------===//

#include "support/diagnostics.hpp"

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

namespace tardi::support
{
/// @brief Adds a diagnostic to the engine and updates severity counters.
///
/// @details Notes are stored but not counted.
///
/// @param d Diagnostic to record; moved into the engine's storage.
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

void DiagnosticEngine::append(const std::vector<Diagnostic> &other)
{
    for (const auto &d : other)
        report(d);
}

/// @brief Writes all stored diagnostics to the provided output stream.
///
/// @param os Output stream that receives the formatted diagnostics.
/// @param sm Optional source manager used to translate file identifiers.
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os, sm);
    }
}

const std::vector<Diagnostic> &DiagnosticEngine::diagnostics() const
{
    return diags_;
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}
} // namespace tardi::support
