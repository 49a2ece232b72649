#include "routegroup/serve-mux-config.hpp"

#include <stdexcept>
#include <string_view>

namespace routegroup {

void ServeMuxConfig::validate() const {
  if (notFoundBody.empty()) {
    throw std::invalid_argument("ServeMuxConfig.notFoundBody cannot be empty");
  }
}

ServeMuxConfig& ServeMuxConfig::withDuplicatePathPolicy(DuplicatePathPolicy policy) {
  duplicatePathPolicy = policy;
  return *this;
}

ServeMuxConfig& ServeMuxConfig::withNotFoundBody(std::string_view body) {
  notFoundBody.assign(body);
  return *this;
}

}  // namespace routegroup
