#pragma once

#include <sift/view/collection.hpp>

#include <iostream>

namespace sift::io {

/// Print a collection as an aligned text table.
///
/// Columns are the fields of the collection's schema (or of its first
/// record). Unloaded cells are blank; null renders as "null" and a loaded
/// relation as the related schema name in angle brackets.
void print(const view::Collection& collection, std::ostream& out = std::cout);

}  // namespace sift::io
