//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements grammar name resolution. Built-in grammars are C entry points
// linked into the executable; everything else is found as a shared library
// named after the tree-sitter convention (libtree-sitter-<name>.so) in one of
// the configured search directories.
//
//===----------------------------------------------------------------------===//

#include "grammar/GrammarRegistry.hpp"

#include "grammar/SharedLibrary.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

extern "C" const TSLanguage *tree_sitter_tardi(void);

namespace tardi::grammar
{

GrammarRegistry GrammarRegistry::withBuiltins()
{
    GrammarRegistry registry;
    registry.registerBuiltin("tardi", &tree_sitter_tardi);
    return registry;
}

void GrammarRegistry::registerBuiltin(std::string name, LanguageEntryPoint entry)
{
    builtins_.insert_or_assign(std::move(name), entry);
}

void GrammarRegistry::addSearchPath(std::filesystem::path dir)
{
    searchPaths_.push_back(std::move(dir));
}

void GrammarRegistry::addSearchPathList(std::string_view list)
{
#ifdef _WIN32
    constexpr char kSeparator = ';';
#else
    constexpr char kSeparator = ':';
#endif
    while (!list.empty())
    {
        const size_t pos = list.find(kSeparator);
        const std::string_view entry = list.substr(0, pos);
        if (!entry.empty())
            addSearchPath(std::filesystem::path(std::string(entry)));
        if (pos == std::string_view::npos)
            break;
        list.remove_prefix(pos + 1);
    }
}

std::vector<std::string> GrammarRegistry::builtinNames() const
{
    std::vector<std::string> names;
    names.reserve(builtins_.size());
    for (const auto &[name, entry] : builtins_)
        names.push_back(name);
    return names;
}

std::optional<LanguageEntryPoint> GrammarRegistry::findBuiltin(std::string_view name) const
{
    auto it = builtins_.find(name);
    if (it == builtins_.end())
        return std::nullopt;
    return it->second;
}

/// @brief Locate the library file for @p name.
///
/// @details Each search directory is probed for every candidate file name
///          before moving on to the next directory, so an earlier directory
///          always wins. Filesystem errors while probing are treated as
///          "not found" rather than aborting the lookup.
std::optional<std::filesystem::path> GrammarRegistry::findLibrary(std::string_view name) const
{
    const auto candidates = libraryFileNames(name);
    for (const auto &dir : searchPaths_)
    {
        for (const auto &file : candidates)
        {
            std::error_code ec;
            const std::filesystem::path path = dir / file;
            if (std::filesystem::is_regular_file(path, ec))
                return path;
        }
    }
    return std::nullopt;
}

std::vector<std::string> GrammarRegistry::libraryFileNames(std::string_view name)
{
    const std::string suffix(SharedLibrary::suffix());
    const std::string base(name);
    return {"libtree-sitter-" + base + suffix, "tree-sitter-" + base + suffix, base + suffix};
}

std::string GrammarRegistry::entrySymbol(std::string_view name)
{
    std::string symbol(name);
    std::replace(symbol.begin(), symbol.end(), '-', '_');
    return "tree_sitter_" + symbol;
}

} // namespace tardi::grammar
