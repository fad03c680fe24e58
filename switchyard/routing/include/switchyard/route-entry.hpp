#pragma once

#include <memory>

#include "switchyard/path-pattern.hpp"
#include "switchyard/route-handler.hpp"

namespace switchyard {

// A path pattern bound to its handler.
// The handler is shared: the same callable may be registered for several patterns and invoked concurrently.
struct RouteEntry {
  PathPattern pattern;
  std::shared_ptr<const RouteHandler> handler;
};

}  // namespace switchyard
