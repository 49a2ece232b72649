#include "routegroup/middleware.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "routegroup/composition-error.hpp"
#include "routegroup/fatal-error-reporter.hpp"
#include "routegroup/request-handler.hpp"
#include "routegroup/vector.hpp"

namespace routegroup {

namespace {

std::string Where(std::string_view path) { return path.empty() ? std::string() : fmt::format(" for route '{}'", path); }

}  // namespace

RequestHandler ApplyMiddleware(MiddlewareRange middlewares, RequestHandler handler, std::string_view path,
                               FatalErrorReporter& reporter) {
  if (!handler) {
    ReportAndThrow(reporter, CompositionError(CompositionError::Code::NilHandlerInChain,
                                              fmt::format("cannot wrap an empty request handler{}", Where(path))));
  }

  // Right to left fold: the last registered middleware is the innermost wrapper.
  for (std::size_t pos = middlewares.size(); pos != 0;) {
    --pos;
    const Middleware& middleware = middlewares[pos];
    if (!middleware) {
      ReportAndThrow(reporter, CompositionError(CompositionError::Code::InvalidMiddleware,
                                                fmt::format("middleware #{} is empty{}", pos, Where(path))));
    }
    handler = middleware(std::move(handler));
    if (!handler) {
      ReportAndThrow(reporter,
                     CompositionError(CompositionError::Code::MiddlewareProducedNil,
                                      fmt::format("middleware #{} returned an empty request handler{}", pos, Where(path))));
    }
  }
  return handler;
}

Middleware Chain(vector<Middleware> middlewares, FatalErrorReporter& reporter) {
  for (std::size_t pos = 0; pos < middlewares.size(); ++pos) {
    if (!middlewares[pos]) {
      ReportAndThrow(reporter, CompositionError(CompositionError::Code::InvalidMiddleware,
                                                fmt::format("cannot chain empty middleware #{}", pos)));
    }
  }
  // Shared so that copies of the returned middleware do not duplicate the chain.
  auto pChain = std::make_shared<const vector<Middleware>>(std::move(middlewares));
  return [pChain, &reporter](RequestHandler next) {
    return ApplyMiddleware(MiddlewareRange(pChain->data(), pChain->size()), std::move(next), {}, reporter);
  };
}

}  // namespace routegroup
