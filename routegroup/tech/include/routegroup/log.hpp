#pragma once

// Logging goes through spdlog. Call sites use routegroup::log::<level>(fmt, args...).
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace routegroup {

namespace log = spdlog;

}  // namespace routegroup
