//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the sample and query checks run after a grammar loads.
//
//===----------------------------------------------------------------------===//

#include "grammar/SourceCheck.hpp"

#include "grammar/Parser.hpp"
#include "grammar/Query.hpp"

#include <string>

namespace tardi::grammar
{

size_t checkSource(const LanguageHandle &language,
                   std::string_view source,
                   uint32_t fileId,
                   support::DiagnosticEngine &diags,
                   std::ostream *trace)
{
    Parser parser;
    if (auto bound = parser.setLanguage(language); !bound)
    {
        diags.report(bound.error());
        return 1;
    }
    parser.setLogger(trace);

    Tree tree = parser.parse(source);
    if (!tree)
    {
        diags.report(support::makeError({fileId, 0, 0}, "parser produced no tree"));
        return 1;
    }

    size_t count = 0;
    for (const auto &error : tree.errors())
    {
        const auto loc = support::locFromPoint(fileId, error.start.row, error.start.column);
        if (error.kind == SyntaxError::Kind::Missing)
            diags.report(support::makeError(loc, "missing " + error.nodeType));
        else
            diags.report(support::makeError(loc, "syntax error"));
        ++count;
    }
    return count;
}

bool checkQuery(const LanguageHandle &language,
                std::string_view source,
                uint32_t fileId,
                support::DiagnosticEngine &diags)
{
    auto query = Query::compile(language, source, fileId);
    if (!query)
    {
        diags.report(query.error());
        return false;
    }
    return true;
}

} // namespace tardi::grammar
