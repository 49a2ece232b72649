#pragma once

#include <amc/vector.hpp>
#include <memory>

namespace routegroup {

template <class T, class Alloc = std::allocator<T>>
using vector = amc::vector<T, Alloc>;

}  // namespace routegroup
