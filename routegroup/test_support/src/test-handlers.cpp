#include "routegroup/test-handlers.hpp"

#include <string>
#include <utility>

#include "routegroup/http-request.hpp"
#include "routegroup/http-response.hpp"
#include "routegroup/middleware.hpp"
#include "routegroup/request-handler.hpp"

namespace routegroup::test {

RequestHandler Respond(std::string body) {
  return [body = std::move(body)](const HttpRequest&) { return HttpResponse(body); };
}

RequestHandler RespondTraced(Trace& trace, std::string name, std::string body) {
  return [&trace, name = std::move(name), body = std::move(body)](const HttpRequest&) {
    trace.push_back(name);
    return HttpResponse(body);
  };
}

Middleware SetHeader(std::string name, std::string value) {
  return [name = std::move(name), value = std::move(value)](RequestHandler next) -> RequestHandler {
    return [name, value, next = std::move(next)](const HttpRequest& request) {
      HttpResponse response = next(request);
      response.header(name, value);
      return response;
    };
  };
}

Middleware PrefixBody(std::string prefix) {
  return [prefix = std::move(prefix)](RequestHandler next) -> RequestHandler {
    return [prefix, next = std::move(next)](const HttpRequest& request) {
      HttpResponse response = next(request);
      response.prependBody(prefix);
      return response;
    };
  };
}

Middleware Traced(Trace& trace, std::string name) {
  return [&trace, name = std::move(name)](RequestHandler next) -> RequestHandler {
    return [&trace, name, next = std::move(next)](const HttpRequest& request) {
      trace.push_back(name + '>');
      HttpResponse response = next(request);
      trace.push_back('<' + name);
      return response;
    };
  };
}

Middleware ReturnsEmptyHandler() {
  return [](RequestHandler) { return RequestHandler{}; };
}

HttpResponse Hello(const HttpRequest& request) { return HttpResponse("Hello from " + std::string(request.path())); }

}  // namespace routegroup::test
