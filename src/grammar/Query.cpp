//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements query compilation. A query names node types and fields, so
// compiling the bundled highlight query against a freshly loaded language is a
// cheap check that the artifact exposes the node types its queries expect.
//
//===----------------------------------------------------------------------===//

#include "grammar/Query.hpp"

#include <algorithm>
#include <utility>

namespace tardi::grammar
{
namespace
{
/// Convert a byte offset into a one-based location.
support::SourceLoc locFromOffset(std::string_view source, uint32_t offset, uint32_t fileId)
{
    const size_t end = std::min<size_t>(offset, source.size());
    uint32_t row = 0;
    uint32_t column = 0;
    for (size_t i = 0; i < end; ++i)
    {
        if (source[i] == '\n')
        {
            ++row;
            column = 0;
        }
        else
        {
            ++column;
        }
    }
    return support::locFromPoint(fileId, row, column);
}
} // namespace

Query::Query(TSQuery *query, LanguageHandle language)
    : query_(query), language_(std::move(language))
{
}

support::Expected<Query> Query::compile(const LanguageHandle &language,
                                        std::string_view source,
                                        uint32_t fileId)
{
    if (!language)
        return support::makeError({}, "no language to compile query against");

    uint32_t errorOffset = 0;
    TSQueryError errorType = TSQueryErrorNone;
    TSQuery *query = ts_query_new(language.get(),
                                  source.data(),
                                  static_cast<uint32_t>(source.size()),
                                  &errorOffset,
                                  &errorType);
    if (!query)
    {
        return support::makeError(locFromOffset(source, errorOffset, fileId),
                                  std::string("invalid query: ") + queryErrorToString(errorType));
    }
    return Query(query, language);
}

Query::~Query()
{
    if (query_)
        ts_query_delete(query_);
}

Query::Query(Query &&other) noexcept
    : query_(std::exchange(other.query_, nullptr)), language_(std::move(other.language_))
{
}

Query &Query::operator=(Query &&other) noexcept
{
    if (this != &other)
    {
        if (query_)
            ts_query_delete(query_);
        query_ = std::exchange(other.query_, nullptr);
        language_ = std::move(other.language_);
    }
    return *this;
}

uint32_t Query::patternCount() const
{
    return ts_query_pattern_count(query_);
}

uint32_t Query::captureCount() const
{
    return ts_query_capture_count(query_);
}

const char *queryErrorToString(TSQueryError error)
{
    switch (error)
    {
        case TSQueryErrorNone:
            return "none";
        case TSQueryErrorSyntax:
            return "syntax";
        case TSQueryErrorNodeType:
            return "node type";
        case TSQueryErrorField:
            return "field";
        case TSQueryErrorCapture:
            return "capture";
        case TSQueryErrorStructure:
            return "structure";
        case TSQueryErrorLanguage:
            return "language";
    }
    return "unknown";
}

} // namespace tardi::grammar
