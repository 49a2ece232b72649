#include "routegroup/handler-unit.hpp"

#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "routegroup/composition-error.hpp"
#include "routegroup/fatal-error-reporter.hpp"
#include "routegroup/middleware.hpp"
#include "routegroup/request-handler.hpp"

namespace routegroup {

HandlerUnit::HandlerUnit(std::string_view path, RequestHandler handler, FatalErrorReporter& reporter)
    : _path(path), _handler(std::move(handler)) {
  if (!_handler) {
    ReportAndThrow(reporter, CompositionError(CompositionError::Code::InvalidHandler,
                                              fmt::format("empty request handler for route '{}'", path)));
  }
  if (_path.empty()) {
    ReportAndThrow(reporter, CompositionError(CompositionError::Code::InvalidHandler, "empty route path"));
  }
}

HandlerUnit HandlerUnit::wrap(MiddlewareRange middlewares, FatalErrorReporter& reporter) const {
  return {_path, ApplyMiddleware(middlewares, _handler, _path, reporter), reporter};
}

}  // namespace routegroup
