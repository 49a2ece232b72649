#pragma once

#include <string>
#include <typeinfo>

namespace routegroup {

// Returns the demangled, human readable name of the given type (falls back to the raw name).
std::string DemangledTypeName(const std::type_info& typeInfo);

template <class T>
std::string TypeName() {
  return DemangledTypeName(typeid(T));
}

}  // namespace routegroup
