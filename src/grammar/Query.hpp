//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: grammar/Query.hpp
// Purpose: RAII wrapper for compiled tree-sitter queries.
// Key invariants: A Query always owns a successfully compiled TSQuery.
// Ownership/Lifetime: Move-only; keeps the language handle it was compiled for.
// Links: src/grammar/SourceCheck.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "grammar/Language.hpp"
#include "support/diag_expected.hpp"

#include <tree_sitter/api.h>

#include <cstdint>
#include <string_view>

namespace tardi::grammar
{

/// @brief Query source compiled against one language.
class Query
{
  public:
    /// @brief Compile @p source against @p language.
    /// @param fileId SourceManager id of the query file, used for error locations.
    /// @return Compiled query, or an "invalid query: <kind>" diagnostic at the
    ///         offending line and column.
    static support::Expected<Query> compile(const LanguageHandle &language,
                                            std::string_view source,
                                            uint32_t fileId = 0);

    ~Query();
    Query(Query &&other) noexcept;
    Query &operator=(Query &&other) noexcept;
    Query(const Query &) = delete;
    Query &operator=(const Query &) = delete;

    [[nodiscard]] uint32_t patternCount() const;
    [[nodiscard]] uint32_t captureCount() const;

  private:
    Query(TSQuery *query, LanguageHandle language);

    TSQuery *query_ = nullptr;
    LanguageHandle language_;
};

/// @brief Short name of a query compile error ("syntax", "node type", ...).
const char *queryErrorToString(TSQueryError error);

} // namespace tardi::grammar
