#pragma once

#include <cstdint>
#include <string_view>

#include "routegroup/exception.hpp"

namespace routegroup {

// Error raised when a group of routes cannot be built or composed.
// These are configuration-time integrity violations: a group that produced one must not be installed.
class CompositionError : public exception {
 public:
  enum class Code : std::uint8_t {
    InvalidHandler,                // a route was defined with an empty request handler
    InvalidMiddleware,             // an empty middleware was attached or chained
    NilHandlerInChain,             // an empty request handler was found while composing
    MiddlewareProducedNil,         // a middleware returned an empty request handler
    UnrecognizedRegistrationType,  // a registered item is neither a unit, a group nor a path/handler pair
    GroupAlreadyComposed           // registration attempted on a group after its composition
  };

  // The message is "<CodeName>: <details>".
  CompositionError(Code code, std::string_view details);

  [[nodiscard]] Code code() const noexcept { return _code; }

 private:
  Code _code;
};

constexpr std::string_view CompositionErrorCodeName(CompositionError::Code code) noexcept {
  switch (code) {
    case CompositionError::Code::InvalidHandler:
      return "InvalidHandler";
    case CompositionError::Code::InvalidMiddleware:
      return "InvalidMiddleware";
    case CompositionError::Code::NilHandlerInChain:
      return "NilHandlerInChain";
    case CompositionError::Code::MiddlewareProducedNil:
      return "MiddlewareProducedNil";
    case CompositionError::Code::UnrecognizedRegistrationType:
      return "UnrecognizedRegistrationType";
    case CompositionError::Code::GroupAlreadyComposed:
      return "GroupAlreadyComposed";
    default:
      return "Unknown";
  }
}

}  // namespace routegroup
