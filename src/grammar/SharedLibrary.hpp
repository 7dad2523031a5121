//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: grammar/SharedLibrary.hpp
// Purpose: RAII wrapper around the platform dynamic loader for grammar libraries.
// Key invariants: An open SharedLibrary always holds a valid loader handle.
// Ownership/Lifetime: Closes the handle on destruction; shared through
//                     std::shared_ptr so languages outlive the loader.
// Links: src/grammar/GrammarLoader.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

namespace tardi::grammar
{

/// @brief Dynamically loaded grammar library (`libtree-sitter-<name>.so`).
class SharedLibrary
{
  public:
    /// @brief Open the library at @p path with immediate symbol binding.
    /// @return Open library, or a diagnostic carrying the loader's message.
    static support::Expected<std::shared_ptr<SharedLibrary>> open(const std::filesystem::path &path);

    ~SharedLibrary();

    SharedLibrary(const SharedLibrary &) = delete;
    SharedLibrary &operator=(const SharedLibrary &) = delete;

    /// @brief Resolve exported symbol @p name.
    /// @return Symbol address, or nullptr when the library does not export it.
    [[nodiscard]] void *symbol(const char *name) const;

    [[nodiscard]] const std::filesystem::path &path() const
    {
        return path_;
    }

    /// @brief Platform suffix of shared libraries (".so", ".dylib", ".dll").
    static std::string_view suffix();

  private:
    SharedLibrary(void *handle, std::filesystem::path path);

    void *handle_ = nullptr;
    std::filesystem::path path_;
};

} // namespace tardi::grammar
