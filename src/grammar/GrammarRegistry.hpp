//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: grammar/GrammarRegistry.hpp
// Purpose: Resolves grammar names to built-in entry points or library files.
// Key invariants: Built-in names take precedence over search-path libraries;
//                 search paths are consulted in insertion order.
// Ownership/Lifetime: Owns the name table and search path list by value.
// Links: src/grammar/GrammarLoader.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "grammar/Language.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tardi::grammar
{

/// @brief Name lookup for grammar artifacts.
class GrammarRegistry
{
  public:
    /// @brief Registry with the grammars linked into this build ("tardi").
    static GrammarRegistry withBuiltins();

    /// @brief Register @p entry under @p name, replacing any previous entry.
    void registerBuiltin(std::string name, LanguageEntryPoint entry);

    /// @brief Append @p dir to the library search path.
    void addSearchPath(std::filesystem::path dir);

    /// @brief Append every entry of a PATH-style list (":" or ";" separated).
    /// @details Empty entries are skipped.
    void addSearchPathList(std::string_view list);

    [[nodiscard]] const std::vector<std::filesystem::path> &searchPaths() const
    {
        return searchPaths_;
    }

    /// @brief Names of registered built-ins in sorted order.
    [[nodiscard]] std::vector<std::string> builtinNames() const;

    /// @brief Entry point registered for @p name, if any.
    [[nodiscard]] std::optional<LanguageEntryPoint> findBuiltin(std::string_view name) const;

    /// @brief First existing library file for @p name on the search path.
    [[nodiscard]] std::optional<std::filesystem::path> findLibrary(std::string_view name) const;

    /// @brief File names probed inside each search directory for @p name.
    static std::vector<std::string> libraryFileNames(std::string_view name);

    /// @brief Exported C symbol that returns grammar @p name ("tree_sitter_<name>").
    static std::string entrySymbol(std::string_view name);

  private:
    std::map<std::string, LanguageEntryPoint, std::less<>> builtins_;
    std::vector<std::filesystem::path> searchPaths_;
};

} // namespace tardi::grammar
