#pragma once

#include <span>

#include "routegroup/handler-unit.hpp"
#include "routegroup/vector.hpp"

namespace routegroup {

// Result of a composition: units in registration order, with fully wrapped handlers.
using FlatDispatchTable = vector<HandlerUnit>;

using HandlerUnitRange = std::span<const HandlerUnit>;

}  // namespace routegroup
