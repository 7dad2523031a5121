//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements grammar loading. Every path (built-in entry point or shared
// library) funnels into validate(), which applies the same three checks: the
// entry point produced a language, its ABI version is inside the accepted
// window, and a probe parser accepts it. Nothing is cached, so loading the
// same artifact twice repeats the same work and reaches the same outcome.
//
//===----------------------------------------------------------------------===//

#include "grammar/GrammarLoader.hpp"

#include "grammar/Parser.hpp"
#include "grammar/SharedLibrary.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>

namespace tardi::grammar
{
namespace
{
std::string joinPaths(const std::vector<std::filesystem::path> &paths)
{
    if (paths.empty())
        return "no search paths";
    std::string joined;
    for (const auto &path : paths)
    {
        if (!joined.empty())
            joined += ", ";
        joined += path.generic_string();
    }
    return joined;
}
} // namespace

AbiWindow runtimeAbiWindow()
{
    return AbiWindow{TREE_SITTER_MIN_COMPATIBLE_LANGUAGE_VERSION, TREE_SITTER_LANGUAGE_VERSION};
}

support::Expected<void> checkAbiVersion(uint32_t version, const AbiWindow &requested)
{
    const AbiWindow runtime = runtimeAbiWindow();
    const AbiWindow effective{std::max(requested.min, runtime.min),
                              std::min(requested.max, runtime.max)};
    if (effective.min > effective.max)
    {
        return support::makeError({},
                                  "no ABI version satisfies the requested window " +
                                      std::to_string(requested.min) + ".." +
                                      std::to_string(requested.max));
    }
    if (effective.contains(version))
        return {};
    return support::makeError({},
                              "incompatible grammar ABI version " + std::to_string(version) +
                                  " (supported " + std::to_string(effective.min) + ".." +
                                  std::to_string(effective.max) + ")");
}

GrammarLoader::GrammarLoader(const GrammarRegistry &registry, LoaderOptions options)
    : registry_(registry), options_(options)
{
}

support::Expected<LanguageHandle> GrammarLoader::load(std::string_view name) const
{
    if (auto entry = registry_.findBuiltin(name))
        return loadEntryPoint(name, *entry);
    if (auto path = registry_.findLibrary(name))
        return loadLibrary(name, *path);
    return support::makeError({},
                              "no grammar named '" + std::string(name) + "' (searched: " +
                                  joinPaths(registry_.searchPaths()) + ")");
}

/// @brief Load a grammar from a shared library file.
///
/// @details The library handle is moved into the resulting LanguageHandle, so
///          the language tables stay mapped for as long as any copy of the
///          handle (or any parser or query built from it) is alive.
support::Expected<LanguageHandle> GrammarLoader::loadLibrary(std::string_view name,
                                                             const std::filesystem::path &path) const
{
    auto opened = SharedLibrary::open(path);
    if (!opened)
        return opened.error();
    std::shared_ptr<SharedLibrary> library = opened.value();

    const std::string symbol = GrammarRegistry::entrySymbol(name);
    void *address = library->symbol(symbol.c_str());
    if (!address)
    {
        return support::makeError({},
                                  library->path().generic_string() + ": missing entry symbol '" +
                                      symbol + "'");
    }

    auto entry = reinterpret_cast<LanguageEntryPoint>(address);
    const TSLanguage *language = entry();
    if (!language)
    {
        return support::makeError({}, "entry point '" + symbol + "' returned no language");
    }
    const std::filesystem::path libraryPath = library->path();
    return validate(
        LanguageHandle(std::string(name), language, std::move(library), libraryPath));
}

support::Expected<LanguageHandle> GrammarLoader::loadEntryPoint(std::string_view name,
                                                                LanguageEntryPoint entry) const
{
    if (!entry)
    {
        return support::makeError(
            {}, "missing entry symbol '" + GrammarRegistry::entrySymbol(name) + "'");
    }
    const TSLanguage *language = entry();
    if (!language)
    {
        return support::makeError({},
                                  "entry point '" + GrammarRegistry::entrySymbol(name) +
                                      "' returned no language");
    }
    return validate(LanguageHandle(std::string(name), language));
}

support::Expected<LanguageHandle> GrammarLoader::validate(LanguageHandle handle) const
{
    if (auto abi = checkAbiVersion(handle.abiVersion(), options_.abi); !abi)
        return abi.error();

    Parser probe;
    if (auto bound = probe.setLanguage(handle); !bound)
        return bound.error();
    return handle;
}

} // namespace tardi::grammar
