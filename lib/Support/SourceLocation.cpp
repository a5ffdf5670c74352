//===----------------------------------------------------------------------===//
///
/// @file
/// Implements source-location rendering helpers.
///
//===----------------------------------------------------------------------===//

#include "archwith/Frontend/SourceLocation.h"

#include <sstream>

namespace archwith
{

std::string SourceLocation::str() const
{
    std::ostringstream out;
    out << file << ':' << line << ':' << column;
    return out.str();
}

}  // namespace archwith
