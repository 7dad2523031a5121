//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/source_loader.cpp
// Purpose: Standardise how command-line tools load sample and query files.
// Key invariants: The loaded buffer contains the complete file contents.
// Ownership/Lifetime: The returned SourceInput owns its buffer.
// Links: src/tools/common/source_loader.hpp
//
//===----------------------------------------------------------------------===//

#include "tools/common/source_loader.hpp"

#include <fstream>
#include <new>
#include <sstream>

namespace tardi::tools::common
{

support::Expected<grammar::SourceInput> loadSourceBuffer(const std::string &path,
                                                         support::SourceManager &sm)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return support::makeError({}, "unable to open " + path);
    }

    // Check file size before reading; tree-sitter addresses input with 32-bit offsets.
    in.seekg(0, std::ios::end);
    auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    constexpr auto kMaxSourceSize = static_cast<std::streamoff>(256ULL * 1024 * 1024);
    if (fileSize < 0 || fileSize > kMaxSourceSize)
    {
        return support::makeError({}, "source file too large: " + path + " (limit: 256 MB)");
    }

    std::string contents;
    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        contents = ss.str();
    }
    catch (const std::bad_alloc &)
    {
        return support::makeError({}, "out of memory reading " + path);
    }

    const uint32_t fileId = sm.addFile(path);
    if (fileId == 0)
    {
        return support::makeError({}, std::string{support::kSourceManagerFileIdOverflowMessage});
    }

    grammar::SourceInput source;
    source.fileId = fileId;
    source.text = std::move(contents);
    return source;
}

} // namespace tardi::tools::common
