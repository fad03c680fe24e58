#include "switchyard/path-split.hpp"

#include <cstddef>
#include <string_view>

#include "switchyard/vector.hpp"

namespace switchyard {

vector<std::string_view> SplitPathComponents(std::string_view path) {
  vector<std::string_view> components;
  std::size_t pos = 0;
  while (pos < path.size()) {
    std::size_t nextSlash = path.find('/', pos);
    if (nextSlash == std::string_view::npos) {
      nextSlash = path.size();
    }
    if (nextSlash != pos) {
      components.push_back(path.substr(pos, nextSlash - pos));
    }
    pos = nextSlash + 1U;
  }
  return components;
}

}  // namespace switchyard
