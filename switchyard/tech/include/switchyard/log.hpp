#pragma once

#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace switchyard {

namespace log = spdlog;

}  // namespace switchyard
