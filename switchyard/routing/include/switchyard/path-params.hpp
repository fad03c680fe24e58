#pragma once

#include <string>

#include "switchyard/vector.hpp"

namespace switchyard {

// Values captured by the wildcard segments of a matched pattern, in left-to-right order.
using PathParams = vector<std::string>;

}  // namespace switchyard
