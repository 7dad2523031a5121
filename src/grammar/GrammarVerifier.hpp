//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: grammar/GrammarVerifier.hpp
// Purpose: Grammar-load verification with a single fixed failure message.
// Key invariants: A failed load yields exactly one error diagnostic
//                 ("Error loading <Grammar> grammar") followed by notes; load
//                 errors never escape the verifier.
// Ownership/Lifetime: Borrows the loader; reports are self-contained values.
// Links: src/tools/tardi-grammar-check/cli.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "grammar/GrammarLoader.hpp"
#include "grammar/Language.hpp"
#include "support/diagnostics.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace tardi::grammar
{

/// @brief In-memory sample or query text registered with a SourceManager.
struct SourceInput
{
    uint32_t fileId = 0;
    std::string text;
};

/// @brief Optional checks layered on top of the load.
struct VerifyOptions
{
    /// @brief Number of successive load attempts; all must agree.
    unsigned repeat = 1;
    /// @brief Sources parsed after a successful load.
    std::vector<SourceInput> samples;
    /// @brief Queries compiled after a successful load.
    std::vector<SourceInput> queries;
    /// @brief Receives runtime parse logs for the samples when non-null.
    std::ostream *trace = nullptr;
};

/// @brief Outcome of verifying one grammar.
struct VerificationReport
{
    std::string grammar;
    std::string displayName;
    bool loaded = false;
    /// @brief Empty on success; "Error loading <Grammar> grammar" on failure.
    std::string failureMessage;
    std::optional<LanguageInfo> info;
    /// @brief Handle from the first attempt; empty when the load failed.
    LanguageHandle language;
    std::vector<support::Diagnostic> diagnostics;
    unsigned attempts = 0;

    /// @brief Loaded, and no check reported an error.
    [[nodiscard]] bool passed() const;
};

/// @brief Loads grammars and converts every failure into a report.
class GrammarVerifier
{
  public:
    explicit GrammarVerifier(const GrammarLoader &loader);
    GrammarVerifier(GrammarLoader &&) = delete;

    /// @brief Verify grammar @p name resolved through the loader's registry.
    [[nodiscard]] VerificationReport verify(std::string_view name,
                                            const VerifyOptions &options = {}) const;

    /// @brief Verify grammar @p name loaded from the library at @p path.
    [[nodiscard]] VerificationReport verifyLibrary(std::string_view name,
                                                   const std::filesystem::path &path,
                                                   const VerifyOptions &options = {}) const;

  private:
    template <typename LoadFn>
    VerificationReport run(std::string_view name, LoadFn load, const VerifyOptions &options) const;

    const GrammarLoader &loader_;
};

} // namespace tardi::grammar
