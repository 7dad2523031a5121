//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: grammar/Parser.hpp
// Purpose: RAII wrappers for the tree-sitter parser and syntax tree objects.
// Key invariants: Each wrapper exclusively owns its tree-sitter object.
// Ownership/Lifetime: Tree is move-only; Parser is neither copyable nor
//                     movable. Both hold the LanguageHandle they were built
//                     with so a dynamically loaded grammar stays mapped.
// Links: src/grammar/SourceCheck.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "grammar/Language.hpp"
#include "support/diag_expected.hpp"

#include <tree_sitter/api.h>

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace tardi::grammar
{

/// @brief ERROR or MISSING node found in a syntax tree.
struct SyntaxError
{
    enum class Kind
    {
        Error,  ///< Input the grammar could not place.
        Missing ///< Token inserted by error recovery.
    };

    Kind kind = Kind::Error;
    std::string nodeType; ///< Missing token type; "ERROR" for error nodes.
    TSPoint start{};      ///< Zero-based start row/column.
};

/// @brief Owned syntax tree produced by Parser::parse.
class Tree
{
  public:
    explicit Tree(TSTree *tree = nullptr, LanguageHandle language = {});
    ~Tree();

    Tree(Tree &&other) noexcept;
    Tree &operator=(Tree &&other) noexcept;
    Tree(const Tree &) = delete;
    Tree &operator=(const Tree &) = delete;

    explicit operator bool() const
    {
        return tree_ != nullptr;
    }

    [[nodiscard]] TSNode root() const;

    /// @brief True when the tree contains ERROR or MISSING nodes.
    [[nodiscard]] bool hasError() const;

    /// @brief S-expression rendering of the tree ("(source_file ...)").
    [[nodiscard]] std::string toSExpression() const;

    /// @brief ERROR and MISSING nodes in document order.
    /// @details Children of an ERROR node are not reported separately.
    [[nodiscard]] std::vector<SyntaxError> errors() const;

  private:
    TSTree *tree_ = nullptr;
    LanguageHandle language_;
};

/// @brief Owned tree-sitter parser bound to one language at a time.
class Parser
{
  public:
    Parser();
    ~Parser();

    Parser(const Parser &) = delete;
    Parser &operator=(const Parser &) = delete;

    /// @brief Bind @p language; fails when the runtime rejects its ABI version.
    support::Expected<void> setLanguage(const LanguageHandle &language);

    /// @brief Route runtime lex/parse log lines to @p os; nullptr disables logging.
    void setLogger(std::ostream *os);

    /// @brief Parse UTF-8 @p source from scratch.
    /// @return Tree, or an empty Tree when no language is bound.
    [[nodiscard]] Tree parse(std::string_view source) const;

  private:
    static void logLine(void *payload, TSLogType type, const char *message);

    TSParser *parser_ = nullptr;
    LanguageHandle language_;
    std::ostream *log_ = nullptr;
};

} // namespace tardi::grammar
