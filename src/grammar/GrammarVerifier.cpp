//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements grammar-load verification. The loader reports precise causes
// (missing symbol, ABI mismatch, unreadable library); the verifier is the
// boundary where all of them become the one failure users see, with the cause
// kept as a note underneath it.
//
//===----------------------------------------------------------------------===//

#include "grammar/GrammarVerifier.hpp"

#include "grammar/SourceCheck.hpp"

#include <algorithm>
#include <utility>

namespace tardi::grammar
{
namespace
{
/// Text describing one attempt's outcome, used when attempts disagree.
std::string describeOutcome(const support::Expected<LanguageHandle> &result)
{
    if (!result)
        return "failed: " + result.error().message;
    const LanguageInfo info = result.value().info();
    return "loaded with ABI version " + std::to_string(info.abiVersion) + ", " +
           std::to_string(info.symbolCount) + " symbols";
}

bool sameOutcome(const support::Expected<LanguageHandle> &lhs,
                 const support::Expected<LanguageHandle> &rhs)
{
    if (lhs.hasValue() != rhs.hasValue())
        return false;
    if (!lhs)
        return lhs.error().message == rhs.error().message;
    return lhs.value().get() == rhs.value().get() && lhs.value().info() == rhs.value().info();
}
} // namespace

bool VerificationReport::passed() const
{
    return loaded && std::none_of(diagnostics.begin(),
                                  diagnostics.end(),
                                  [](const support::Diagnostic &d)
                                  { return d.severity == support::Severity::Error; });
}

GrammarVerifier::GrammarVerifier(const GrammarLoader &loader) : loader_(loader) {}

VerificationReport GrammarVerifier::verify(std::string_view name,
                                           const VerifyOptions &options) const
{
    return run(name, [&] { return loader_.load(name); }, options);
}

VerificationReport GrammarVerifier::verifyLibrary(std::string_view name,
                                                  const std::filesystem::path &path,
                                                  const VerifyOptions &options) const
{
    return run(name, [&] { return loader_.loadLibrary(name, path); }, options);
}

/// @brief Run the load (possibly repeatedly) and the follow-up checks.
///
/// @details Step-by-step summary:
///          1. Load once; on failure record the fixed message plus the cause
///             and stop. There are no retries.
///          2. For repeat > 1, load again and compare each outcome against the
///             first; any divergence is an error.
///          3. Parse samples and compile queries against the first handle.
template <typename LoadFn>
VerificationReport GrammarVerifier::run(std::string_view name,
                                        LoadFn load,
                                        const VerifyOptions &options) const
{
    VerificationReport report;
    report.grammar = std::string(name);
    report.displayName = displayName(name);

    support::Expected<LanguageHandle> first = load();
    report.attempts = 1;

    if (!first)
    {
        report.failureMessage = loadFailureMessage(name);
        report.diagnostics.push_back(support::makeError({}, report.failureMessage));
        report.diagnostics.push_back(support::makeNote({}, first.error().message));
        return report;
    }

    report.loaded = true;
    report.info = first.value().info();
    report.language = first.value();

    support::DiagnosticEngine diags;
    const unsigned repeat = std::max(options.repeat, 1u);
    for (unsigned attempt = 2; attempt <= repeat; ++attempt)
    {
        support::Expected<LanguageHandle> again = load();
        ++report.attempts;
        if (!sameOutcome(first, again))
        {
            diags.report(support::makeError({}, "grammar load outcome changed between attempts"));
            diags.report(support::makeNote(
                {}, "attempt " + std::to_string(attempt) + " " + describeOutcome(again)));
            break;
        }
    }

    for (const auto &sample : options.samples)
        checkSource(first.value(), sample.text, sample.fileId, diags, options.trace);
    for (const auto &query : options.queries)
        checkQuery(first.value(), query.text, query.fileId, diags);

    report.diagnostics = diags.diagnostics();
    return report;
}

} // namespace tardi::grammar
