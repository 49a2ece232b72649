#include "routegroup/composition-error.hpp"

#include <string_view>

namespace routegroup {

CompositionError::CompositionError(Code code, std::string_view details)
    : exception("{}: {}", CompositionErrorCodeName(code), details), _code(code) {}

}  // namespace routegroup
