#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "routegroup/fatal-error-reporter.hpp"
#include "routegroup/http-request.hpp"
#include "routegroup/http-response.hpp"
#include "routegroup/middleware.hpp"
#include "routegroup/request-handler.hpp"

namespace routegroup {

// Immutable (path, request handler) pair, the atomic unit of routing.
class HandlerUnit {
 public:
  // Throws CompositionError (InvalidHandler), after reporting it, if 'path' or 'handler' is empty.
  HandlerUnit(std::string_view path, RequestHandler handler,
              FatalErrorReporter& reporter = DefaultFatalErrorReporter());

  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  [[nodiscard]] const RequestHandler& handler() const noexcept { return _handler; }

  // Returns a new unit for the same path whose handler is this unit's handler wrapped by 'middlewares'
  // (first = outermost). This unit is left untouched.
  [[nodiscard]] HandlerUnit wrap(MiddlewareRange middlewares,
                                 FatalErrorReporter& reporter = DefaultFatalErrorReporter()) const;

  template <MiddlewareLike... Mws>
    requires(sizeof...(Mws) > 0)
  [[nodiscard]] HandlerUnit wrap(Mws&&... middlewares) const {
    const Middleware all[] = {Middleware(std::forward<Mws>(middlewares))...};
    return wrap(MiddlewareRange(all));
  }

  HttpResponse operator()(const HttpRequest& request) const { return _handler(request); }

 private:
  friend class Group;

  std::string _path;
  RequestHandler _handler;
};

// Shorthand for HandlerUnit(path, handler).
[[nodiscard]] inline HandlerUnit Define(std::string_view path, RequestHandler handler) {
  return {path, std::move(handler)};
}

}  // namespace routegroup
