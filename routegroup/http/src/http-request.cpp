#include "routegroup/http-request.hpp"

#include <string_view>

namespace routegroup {

HttpRequest::HttpRequest(std::string_view path, std::string_view method) : _path(path), _method(method) {}

}  // namespace routegroup
