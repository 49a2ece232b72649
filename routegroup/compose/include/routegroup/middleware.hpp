#pragma once

#include <concepts>
#include <functional>
#include <span>
#include <string_view>
#include <utility>

#include "routegroup/fatal-error-reporter.hpp"
#include "routegroup/request-handler.hpp"
#include "routegroup/vector.hpp"

namespace routegroup {

// A middleware takes the next request handler and returns a new handler wrapping it.
// It runs once, when routes are composed, not per request.
using Middleware = std::function<RequestHandler(RequestHandler)>;

// Ordered middleware, first registered first.
using MiddlewareRange = std::span<const Middleware>;

template <class T>
concept MiddlewareLike = std::convertible_to<T, Middleware>;

// Wraps 'handler' with 'middlewares' such that the first middleware is the outermost one:
// [m0, m1, ..., mk] applied to h gives m0(m1(...mk(h))).
// m0 sees the request first and the response last.
//
// 'path' is only used for diagnostics. Errors are reported to 'reporter' and thrown as CompositionError:
//  - NilHandlerInChain if 'handler' is empty,
//  - InvalidMiddleware if one of the middlewares is empty,
//  - MiddlewareProducedNil if one of the middlewares returns an empty handler.
[[nodiscard]] RequestHandler ApplyMiddleware(MiddlewareRange middlewares, RequestHandler handler,
                                             std::string_view path = {},
                                             FatalErrorReporter& reporter = DefaultFatalErrorReporter());

// Combines an ordered list of middleware into a single one, with the same ordering rule as ApplyMiddleware.
// Throws CompositionError (InvalidMiddleware) if one of them is empty.
// 'reporter' is also used when the returned middleware is applied, it must outlive it.
[[nodiscard]] Middleware Chain(vector<Middleware> middlewares,
                               FatalErrorReporter& reporter = DefaultFatalErrorReporter());

template <MiddlewareLike... Mws>
  requires(sizeof...(Mws) > 0)
[[nodiscard]] Middleware Chain(Mws&&... middlewares) {
  vector<Middleware> all;
  all.reserve(sizeof...(Mws));
  (all.emplace_back(std::forward<Mws>(middlewares)), ...);
  return Chain(std::move(all));
}

}  // namespace routegroup
