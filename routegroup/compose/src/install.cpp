#include "routegroup/install.hpp"

#include "routegroup/flat-dispatch-table.hpp"
#include "routegroup/log.hpp"
#include "routegroup/server-collaborator.hpp"

namespace routegroup {

ServerCollaborator& Install(HandlerUnitRange table, ServerCollaborator& server) {
  for (const HandlerUnit& unit : table) {
    server.bind(unit.path(), unit.handler());
  }
  log::debug("Installed {} route(s)", table.size());
  return server;
}

}  // namespace routegroup
