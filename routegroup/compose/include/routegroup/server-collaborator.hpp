#pragma once

#include <string_view>

#include "routegroup/request-handler.hpp"

namespace routegroup {

// The server side of a dispatch table: something able to bind a path to a request handler
// and, later on, dispatch incoming requests to it. Path matching rules and the policy applied
// to duplicated paths belong to the implementation.
class ServerCollaborator {
 public:
  virtual ~ServerCollaborator() = default;

  virtual void bind(std::string_view path, RequestHandler handler) = 0;
};

}  // namespace routegroup
