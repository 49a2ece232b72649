#pragma once

#include "routegroup/flat-dispatch-table.hpp"
#include "routegroup/server-collaborator.hpp"

namespace routegroup {

// Binds each unit of a composed dispatch table to 'server', in table order.
// Returns 'server', ready to dispatch requests.
// Installation is not atomic: if 'server' rejects a unit, the units before it stay bound.
ServerCollaborator& Install(HandlerUnitRange table, ServerCollaborator& server);

}  // namespace routegroup
