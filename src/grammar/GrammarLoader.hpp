//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: grammar/GrammarLoader.hpp
// Purpose: Loads grammar artifacts through the tree-sitter runtime.
// Key invariants: A successful load returns a handle the runtime has accepted;
//                 loads hold no state between calls.
// Ownership/Lifetime: Borrows the registry; returned handles own any library.
// Links: src/grammar/GrammarVerifier.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "grammar/GrammarRegistry.hpp"
#include "grammar/Language.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace tardi::grammar
{

/// @brief Inclusive window of language ABI versions a load accepts.
struct AbiWindow
{
    uint32_t min = 0;
    uint32_t max = 0;

    [[nodiscard]] bool contains(uint32_t version) const
    {
        return version >= min && version <= max;
    }
};

/// @brief Window supported by the linked tree-sitter runtime.
AbiWindow runtimeAbiWindow();

/// @brief Loader configuration.
struct LoaderOptions
{
    /// @brief Requested ABI window; intersected with runtimeAbiWindow().
    AbiWindow abi = runtimeAbiWindow();
};

/// @brief Accept @p version when it lies in @p requested and in the runtime window.
/// @return Success, "incompatible grammar ABI version V (supported A..B)", or
///         "no ABI version satisfies the requested window A..B" when the two
///         windows do not overlap.
support::Expected<void> checkAbiVersion(uint32_t version, const AbiWindow &requested);

/// @brief Resolves names through a registry and validates what it finds.
class GrammarLoader
{
  public:
    explicit GrammarLoader(const GrammarRegistry &registry, LoaderOptions options = {});
    GrammarLoader(GrammarRegistry &&, LoaderOptions = {}) = delete;

    /// @brief Load grammar @p name: built-in first, then the search path.
    [[nodiscard]] support::Expected<LanguageHandle> load(std::string_view name) const;

    /// @brief Load grammar @p name from the shared library at @p path.
    [[nodiscard]] support::Expected<LanguageHandle> loadLibrary(
        std::string_view name, const std::filesystem::path &path) const;

    /// @brief Load grammar @p name by calling @p entry.
    [[nodiscard]] support::Expected<LanguageHandle> loadEntryPoint(std::string_view name,
                                                                   LanguageEntryPoint entry) const;

    [[nodiscard]] const LoaderOptions &options() const
    {
        return options_;
    }

  private:
    support::Expected<LanguageHandle> validate(LanguageHandle handle) const;

    const GrammarRegistry &registry_;
    LoaderOptions options_;
};

} // namespace tardi::grammar
