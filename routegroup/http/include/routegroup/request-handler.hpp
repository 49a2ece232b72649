#pragma once

#include <functional>

#include "routegroup/http-response.hpp"

namespace routegroup {

class HttpRequest;

// Request handler type: receives a const HttpRequest& and returns an HttpResponse.
using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

}  // namespace routegroup
