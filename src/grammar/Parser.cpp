//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the low-level parser and tree wrappers. These are the only place
// that talks to TSParser/TSTree directly; everything above works in terms of
// LanguageHandle, Tree and SyntaxError.
//
//===----------------------------------------------------------------------===//

#include "grammar/Parser.hpp"

#include <cstdlib>
#include <utility>

namespace tardi::grammar
{

Tree::Tree(TSTree *tree, LanguageHandle language)
    : tree_(tree), language_(std::move(language))
{
}

Tree::~Tree()
{
    if (tree_)
        ts_tree_delete(tree_);
}

Tree::Tree(Tree &&other) noexcept
    : tree_(std::exchange(other.tree_, nullptr)), language_(std::move(other.language_))
{
}

Tree &Tree::operator=(Tree &&other) noexcept
{
    if (this != &other)
    {
        if (tree_)
            ts_tree_delete(tree_);
        tree_ = std::exchange(other.tree_, nullptr);
        language_ = std::move(other.language_);
    }
    return *this;
}

TSNode Tree::root() const
{
    return ts_tree_root_node(tree_);
}

bool Tree::hasError() const
{
    return tree_ && ts_node_has_error(root());
}

std::string Tree::toSExpression() const
{
    if (!tree_)
        return {};
    char *text = ts_node_string(root());
    std::string result(text ? text : "");
    std::free(text);
    return result;
}

/// @brief Collect error and missing nodes.
///
/// @details Walks only subtrees flagged by ts_node_has_error, so a clean tree
///          costs a single check at the root. An ERROR node is reported once;
///          its children are skipped because they are the unparsed input.
std::vector<SyntaxError> Tree::errors() const
{
    std::vector<SyntaxError> found;
    if (!hasError())
        return found;

    std::vector<TSNode> pending{root()};
    while (!pending.empty())
    {
        TSNode node = pending.back();
        pending.pop_back();

        if (ts_node_is_missing(node))
        {
            found.push_back(SyntaxError{SyntaxError::Kind::Missing,
                                        ts_node_type(node),
                                        ts_node_start_point(node)});
            continue;
        }
        if (ts_node_is_error(node))
        {
            found.push_back(SyntaxError{SyntaxError::Kind::Error,
                                        "ERROR",
                                        ts_node_start_point(node)});
            continue;
        }
        if (!ts_node_has_error(node))
            continue;

        // Push in reverse so children pop in document order.
        const uint32_t count = ts_node_child_count(node);
        for (uint32_t i = count; i > 0; --i)
            pending.push_back(ts_node_child(node, i - 1));
    }
    return found;
}

Parser::Parser() : parser_(ts_parser_new()) {}

Parser::~Parser()
{
    if (parser_)
        ts_parser_delete(parser_);
    parser_ = nullptr;
}

/// @brief Bind a language to the parser.
///
/// @details ts_parser_set_language is the runtime's load check: it refuses a
///          language whose ABI version lies outside the window this build of
///          tree-sitter understands. The check runs in release builds too.
support::Expected<void> Parser::setLanguage(const LanguageHandle &language)
{
    if (!language)
        return support::makeError({}, "no language to bind");
    if (!ts_parser_set_language(parser_, language.get()))
    {
        return support::makeError({}, "runtime rejected grammar '" + language.name() + "'");
    }
    language_ = language;
    return {};
}

void Parser::setLogger(std::ostream *os)
{
    log_ = os;
    if (os)
        ts_parser_set_logger(parser_, TSLogger{this, &Parser::logLine});
    else
        ts_parser_set_logger(parser_, TSLogger{nullptr, nullptr});
}

void Parser::logLine(void *payload, TSLogType type, const char *message)
{
    auto *self = static_cast<Parser *>(payload);
    if (!self || !self->log_)
        return;
    *self->log_ << "trace: [" << (type == TSLogTypeLex ? "lex" : "parse") << "] " << message
                << '\n';
}

Tree Parser::parse(std::string_view source) const
{
    if (!language_)
        return Tree{};
    // Tree-sitter consumes bytes; the grammar expects UTF-8.
    return Tree{ts_parser_parse_string(
                    parser_, /*old_tree*/ nullptr, source.data(), static_cast<uint32_t>(source.size())),
                language_};
}

} // namespace tardi::grammar
