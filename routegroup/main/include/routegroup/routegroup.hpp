// routegroup Umbrella Header
//
// Include this single header to pull in the public API:
//   - Route building and composition (HandlerUnit, Middleware, Group, CompositionError)
//   - Fatal error reporting strategies (FatalErrorReporter and its implementations)
//   - Installation into a server (ServerCollaborator, Install, ServeMux, Compile)
//   - Request / Response primitives (HttpRequest, HttpResponse) and status codes
//
// Each re-exported header line is annotated with IWYU pragma: export.
//
// Usage Example:
//    #include <routegroup/routegroup.hpp>
//    using namespace routegroup;
//    int main() {
//      Group group;
//      group.add(Define("/hello", [](const HttpRequest&) { return HttpResponse("hello"); }));
//      ServeMux mux = Compile(group);
//      return mux.dispatch(HttpRequest("/hello")).status() == http::StatusCodeOK ? 0 : 1;
//    }
#pragma once

#include "routegroup/composition-error.hpp"    // IWYU pragma: export
#include "routegroup/fatal-error-reporter.hpp"  // IWYU pragma: export
#include "routegroup/flat-dispatch-table.hpp"   // IWYU pragma: export
#include "routegroup/group.hpp"                 // IWYU pragma: export
#include "routegroup/handler-unit.hpp"          // IWYU pragma: export
#include "routegroup/http-constants.hpp"        // IWYU pragma: export
#include "routegroup/http-request.hpp"          // IWYU pragma: export
#include "routegroup/http-response.hpp"         // IWYU pragma: export
#include "routegroup/http-status-code.hpp"      // IWYU pragma: export
#include "routegroup/install.hpp"               // IWYU pragma: export
#include "routegroup/middleware.hpp"            // IWYU pragma: export
#include "routegroup/request-handler.hpp"       // IWYU pragma: export
#include "routegroup/serve-mux-config.hpp"      // IWYU pragma: export
#include "routegroup/serve-mux.hpp"             // IWYU pragma: export
#include "routegroup/server-collaborator.hpp"   // IWYU pragma: export
