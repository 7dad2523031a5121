//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements SharedLibrary on top of dlopen/dlsym, or LoadLibrary on Windows.
// Loader failures (missing file, not an object file, unresolved dependencies)
// are turned into diagnostics that carry the loader's own message.
//
//===----------------------------------------------------------------------===//

#include "grammar/SharedLibrary.hpp"

#include <string>
#include <utility>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace tardi::grammar
{
namespace
{
#ifdef _WIN32
std::string lastLoaderError()
{
    const DWORD code = GetLastError();
    return "LoadLibrary failed with error " + std::to_string(static_cast<unsigned long>(code));
}
#else
std::string lastLoaderError()
{
    const char *message = dlerror();
    return message ? std::string(message) : std::string("unknown dynamic loader error");
}
#endif
} // namespace

SharedLibrary::SharedLibrary(void *handle, std::filesystem::path path)
    : handle_(handle), path_(std::move(path))
{
}

/// @brief Open a grammar library.
///
/// @details RTLD_NOW surfaces unresolved symbols at open time instead of at
///          the first parse, so a broken artifact fails the load check.
///          RTLD_LOCAL keeps two grammars from interposing on each other's
///          internal symbols.
support::Expected<std::shared_ptr<SharedLibrary>> SharedLibrary::open(
    const std::filesystem::path &path)
{
#ifdef _WIN32
    void *handle = reinterpret_cast<void *>(LoadLibraryW(path.c_str()));
#else
    dlerror();
    void *handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
#endif
    if (!handle)
    {
        return support::makeError({}, path.generic_string() + ": " + lastLoaderError());
    }
    return std::shared_ptr<SharedLibrary>(new SharedLibrary(handle, path));
}

SharedLibrary::~SharedLibrary()
{
    if (!handle_)
        return;
#ifdef _WIN32
    FreeLibrary(reinterpret_cast<HMODULE>(handle_));
#else
    dlclose(handle_);
#endif
}

void *SharedLibrary::symbol(const char *name) const
{
#ifdef _WIN32
    return reinterpret_cast<void *>(GetProcAddress(reinterpret_cast<HMODULE>(handle_), name));
#else
    return dlsym(handle_, name);
#endif
}

std::string_view SharedLibrary::suffix()
{
#if defined(_WIN32)
    return ".dll";
#elif defined(__APPLE__)
    return ".dylib";
#else
    return ".so";
#endif
}

} // namespace tardi::grammar
