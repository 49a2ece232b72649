#pragma once

#include <string>
#include <string_view>

#include "routegroup/http-request.hpp"
#include "routegroup/http-response.hpp"
#include "routegroup/middleware.hpp"
#include "routegroup/request-handler.hpp"
#include "routegroup/vector.hpp"

namespace routegroup::test {

using Trace = vector<std::string>;

// Handler answering 200 with the given body.
RequestHandler Respond(std::string body);

// Same as Respond, also appending 'name' to 'trace' when invoked.
RequestHandler RespondTraced(Trace& trace, std::string name, std::string body);

// Middleware setting header 'name' to 'value' on the response produced by the next handler.
Middleware SetHeader(std::string name, std::string value);

// Middleware prepending 'prefix' to the body produced by the next handler.
Middleware PrefixBody(std::string prefix);

// Middleware appending "name>" to 'trace' before calling the next handler, and "<name" after.
Middleware Traced(Trace& trace, std::string name);

// Middleware returning an empty handler.
Middleware ReturnsEmptyHandler();

// Plain function handler, used to check handler identity.
HttpResponse Hello(const HttpRequest& request);

}  // namespace routegroup::test
