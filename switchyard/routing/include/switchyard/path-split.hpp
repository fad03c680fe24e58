#pragma once

#include <string_view>

#include "switchyard/vector.hpp"

namespace switchyard {

// Split a path on '/' into its ordered non-empty components.
// Leading, trailing and repeated slashes produce no component:
//   "/"           -> []
//   "/foo/bar"    -> ["foo", "bar"]
//   "//foo//bar/" -> ["foo", "bar"]
// The returned views point into 'path'.
vector<std::string_view> SplitPathComponents(std::string_view path);

}  // namespace switchyard
