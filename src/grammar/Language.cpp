//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements LanguageHandle along with the naming helpers used to phrase load
// failures. Metadata is read straight from the runtime each time it is asked
// for, so a handle never caches anything that could drift from the artifact.
//
//===----------------------------------------------------------------------===//

#include "grammar/Language.hpp"

#include "grammar/SharedLibrary.hpp"

#include <cctype>
#include <utility>

namespace tardi::grammar
{

LanguageHandle::LanguageHandle(std::string name,
                               const TSLanguage *language,
                               std::shared_ptr<SharedLibrary> library,
                               std::filesystem::path libraryPath)
    : name_(std::move(name)), language_(language), library_(std::move(library)),
      libraryPath_(std::move(libraryPath))
{
}

LanguageOrigin LanguageHandle::origin() const
{
    return library_ ? LanguageOrigin::SharedLibrary : LanguageOrigin::Builtin;
}

uint32_t LanguageHandle::abiVersion() const
{
    return language_ ? ts_language_version(language_) : 0;
}

/// @brief Collect the runtime-visible metadata of the wrapped language.
///
/// @details Two loads of the same artifact must produce equal snapshots; the
///          verifier compares them to detect outcomes that change between
///          attempts.
LanguageInfo LanguageHandle::info() const
{
    LanguageInfo info;
    info.name = name_;
    info.origin = origin();
    info.abiVersion = ts_language_version(language_);
    info.symbolCount = ts_language_symbol_count(language_);
    info.fieldCount = ts_language_field_count(language_);
    info.stateCount = ts_language_state_count(language_);
    return info;
}

std::string displayName(std::string_view name)
{
    std::string display(name);
    if (!display.empty())
    {
        display.front() =
            static_cast<char>(std::toupper(static_cast<unsigned char>(display.front())));
    }
    return display;
}

std::string loadFailureMessage(std::string_view name)
{
    return "Error loading " + displayName(name) + " grammar";
}

const char *originToString(LanguageOrigin origin)
{
    switch (origin)
    {
        case LanguageOrigin::Builtin:
            return "builtin";
        case LanguageOrigin::SharedLibrary:
            return "shared library";
    }
    return "";
}

} // namespace tardi::grammar
