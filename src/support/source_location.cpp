//===----------------------------------------------------------------------===//
//
// Part of the Tardi project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line helpers for SourceLoc. A location is valid when it refers to a
// registered file identifier; line and column are optional. Tree-sitter hands
// out zero-based points, so the conversion into the one-based convention used
// by every printed diagnostic lives here as well.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace tardi::support
{
/// @brief Determine whether the location carries a real source attachment.
///
/// @details SourceManager dispenses identifiers starting at one. The
///          default-constructed location uses zero to mark "unknown", which
///          lets printers elide the path prefix for grammar-level errors that
///          are not tied to any file.
///
/// @return True when the location originated from a tracked source file.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}

SourceLoc locFromPoint(uint32_t fileId, uint32_t row, uint32_t column)
{
    return SourceLoc{fileId, row + 1, column + 1};
}
} // namespace tardi::support
