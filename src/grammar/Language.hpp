//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: grammar/Language.hpp
// Purpose: Declares LanguageHandle, a loaded tree-sitter grammar and its metadata.
// Key invariants: A non-empty handle points at a TSLanguage that stays valid for
//                 the handle's lifetime.
// Ownership/Lifetime: Handles share ownership of the shared library (if any)
//                     that defines the language; built-in languages are static.
// Links: src/grammar/GrammarLoader.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <tree_sitter/api.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace tardi::grammar
{

class SharedLibrary;

/// @brief C entry point exported by a generated grammar (`tree_sitter_<name>`).
using LanguageEntryPoint = const TSLanguage *(*)();

/// @brief Where a loaded language came from.
enum class LanguageOrigin
{
    Builtin,      ///< Linked into the running executable.
    SharedLibrary ///< Resolved from a grammar shared library on disk.
};

/// @brief Value snapshot of the metadata a loaded language exposes.
struct LanguageInfo
{
    std::string name;
    LanguageOrigin origin = LanguageOrigin::Builtin;
    uint32_t abiVersion = 0;
    uint32_t symbolCount = 0;
    uint32_t fieldCount = 0;
    uint32_t stateCount = 0;

    bool operator==(const LanguageInfo &other) const = default;
};

/// @brief Loaded grammar ready to drive a parser.
class LanguageHandle
{
  public:
    LanguageHandle() = default;

    /// @brief Wrap @p language loaded under @p name.
    /// @param name Grammar name used for lookup ("tardi").
    /// @param language Language returned by the grammar's entry point.
    /// @param library Library that defines @p language; empty for built-ins.
    /// @param libraryPath Path @p library was opened from.
    LanguageHandle(std::string name,
                   const TSLanguage *language,
                   std::shared_ptr<SharedLibrary> library = {},
                   std::filesystem::path libraryPath = {});

    [[nodiscard]] const TSLanguage *get() const
    {
        return language_;
    }

    [[nodiscard]] const std::string &name() const
    {
        return name_;
    }

    [[nodiscard]] LanguageOrigin origin() const;

    /// @brief Path of the shared library; empty for built-in languages.
    [[nodiscard]] const std::filesystem::path &libraryPath() const
    {
        return libraryPath_;
    }

    [[nodiscard]] uint32_t abiVersion() const;

    /// @brief Snapshot the language metadata; requires a non-empty handle.
    [[nodiscard]] LanguageInfo info() const;

    explicit operator bool() const
    {
        return language_ != nullptr;
    }

  private:
    std::string name_;
    const TSLanguage *language_ = nullptr;
    std::shared_ptr<SharedLibrary> library_;
    std::filesystem::path libraryPath_;
};

/// @brief Human-readable grammar name: "tardi" becomes "Tardi".
std::string displayName(std::string_view name);

/// @brief Fixed failure text reported when grammar @p name cannot be loaded.
std::string loadFailureMessage(std::string_view name);

/// @brief Lowercase name of @p origin ("builtin", "shared library").
const char *originToString(LanguageOrigin origin);

} // namespace tardi::grammar
